/**
 * @file dimacs_parser.hpp
 * @brief DIMACSパーサーのインターフェース
 */
#ifndef DPLL_SAT_DIMACS_PARSER_HPP
#define DPLL_SAT_DIMACS_PARSER_HPP

#include "dpll_sat/dimacs/problem.hpp"
#include <cstdio>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

#endif // DPLL_SAT_DIMACS_PARSER_HPP
