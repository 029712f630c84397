#include "dpll_sat/dimacs/problem.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace dpll_sat {
namespace dimacs {

const char* to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::NoHeader:
            return "no header";
        case ParseErrorKind::BadHeader:
            return "bad header";
        case ParseErrorKind::BadClause:
            return "bad clause";
        case ParseErrorKind::VariableCount:
            return "unexpected number of variables";
        case ParseErrorKind::ClauseCount:
            return "unexpected number of clauses";
        case ParseErrorKind::Io:
            return "i/o error";
    }
    return "unknown error";
}

ParseError::ParseError(ParseErrorKind kind)
    : std::runtime_error(to_string(kind)), kind_(kind) {}

ParseError::ParseError(ParseErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

void ProblemBuilder::add_header_field(HeaderField field) {
    header_fields_.push_back(std::move(field));
}

namespace {

// 変数数・節数として読める値（符号なし 64bit の10進数、先頭の '+' は可）
std::optional<size_t> header_count(const HeaderField& field) {
    if (const auto* count = std::get_if<uint64_t>(&field)) {
        return static_cast<size_t>(*count);
    }
    const auto& word = std::get<std::string>(field);
    size_t pos = (!word.empty() && word[0] == '+') ? 1 : 0;
    if (pos == word.size() ||
        !std::all_of(word.begin() + pos, word.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    errno = 0;
    unsigned long long value = std::strtoull(word.c_str() + pos, nullptr, 10);
    if (errno == ERANGE || value > std::numeric_limits<size_t>::max()) {
        return std::nullopt;
    }
    return static_cast<size_t>(value);
}

}  // namespace

std::optional<ParseErrorKind> ProblemBuilder::finish_header() {
    // p cnf <num> <num>
    if (header_fields_.size() != 3) {
        return ParseErrorKind::BadHeader;
    }

    const auto* format = std::get_if<std::string>(&header_fields_[0]);
    if (!format || *format != "cnf") {
        return ParseErrorKind::BadHeader;
    }

    auto num_variables = header_count(header_fields_[1]);
    auto num_clauses = header_count(header_fields_[2]);
    if (!num_variables || !num_clauses) {
        return ParseErrorKind::BadHeader;
    }

    header_ = Header{*num_variables, *num_clauses};
    header_fields_.clear();
    return std::nullopt;
}

std::optional<ParseErrorKind> ProblemBuilder::add_literal(int64_t value) {
    if (value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        return ParseErrorKind::BadClause;
    }

    if (value == 0) {
        formula_.push_back(std::move(clause_));
        clause_.clear();
        return std::nullopt;
    }

    size_t var = static_cast<size_t>(value > 0 ? value : -value);
    if (var > header_->num_variables) {
        variable_count_exceeded_ = true;
        return std::nullopt;
    }

    // 1 始まりの符号付き整数 -> 0 始まりのリテラル
    if (value > 0) {
        clause_.push_back(Literal::positive(var - 1));
    } else {
        clause_.push_back(Literal::negative(var - 1));
    }
    return std::nullopt;
}

std::unique_ptr<Problem> ProblemBuilder::finish() {
    if (!header_) {
        throw ParseError(ParseErrorKind::NoHeader);
    }
    if (variable_count_exceeded_) {
        throw ParseError(ParseErrorKind::VariableCount);
    }
    if (formula_.size() != header_->num_clauses) {
        throw ParseError(ParseErrorKind::ClauseCount);
    }

    auto problem = std::make_unique<Problem>();
    problem->header = *header_;
    problem->formula = std::move(formula_);
    formula_.clear();
    clause_.clear();
    return problem;
}

std::string format_assignment(const Assignment& assignment) {
    std::ostringstream oss;
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (i > 0) oss << ' ';
        if (!assignment[i]) oss << '-';
        oss << (i + 1);
    }
    return oss.str();
}

} // namespace dimacs
} // namespace dpll_sat
