#include "dimacs_parser.hpp"
#include "parser.hpp"

namespace dpll_sat {
namespace dimacs {

namespace {

std::unique_ptr<Problem> finish_parse(int result, ParserContext& ctx) {
    if (ctx.has_error) {
        throw ParseError(ctx.error_kind);
    }
    if (result != 0) {
        throw ParseError(ParseErrorKind::BadClause);
    }
    return ctx.builder.finish();
}

}  // namespace

std::unique_ptr<Problem> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw ParseError(ParseErrorKind::Io, "Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    return finish_parse(result, ctx);
}

std::unique_ptr<Problem> parse_stream(FILE* in) {
    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(in, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);

    return finish_parse(result, ctx);
}

std::unique_ptr<Problem> parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    return finish_parse(result, ctx);
}

} // namespace dimacs
} // namespace dpll_sat
