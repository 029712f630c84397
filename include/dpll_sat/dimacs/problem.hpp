/**
 * @file problem.hpp
 * @brief DIMACS CNF 問題の中間表現とパーサー
 */
#ifndef DPLL_SAT_DIMACS_PROBLEM_HPP
#define DPLL_SAT_DIMACS_PROBLEM_HPP

#include "dpll_sat/formula.hpp"
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace dpll_sat {
namespace dimacs {

/**
 * @brief パースエラーの種類
 */
enum class ParseErrorKind {
    NoHeader,       // "p cnf" 行がない
    BadHeader,      // "p cnf" 行の形式が不正
    BadClause,      // 節に整数以外のトークンがある
    VariableCount,  // 宣言された変数数を超えるリテラル
    ClauseCount,    // 節の数が宣言と一致しない
    Io              // ファイルを開けない
};

/**
 * @brief パースエラーの説明文
 */
const char* to_string(ParseErrorKind kind);

/**
 * @brief DIMACS パースエラー
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(ParseErrorKind kind);
    ParseError(ParseErrorKind kind, const std::string& message);

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

/**
 * @brief "p cnf <変数数> <節数>" 行の内容
 */
struct Header {
    size_t num_variables = 0;
    size_t num_clauses = 0;

    bool operator==(const Header& other) const {
        return num_variables == other.num_variables && num_clauses == other.num_clauses;
    }
};

/**
 * @brief パース済みの問題
 */
struct Problem {
    Header header;
    Formula formula;
};

/**
 * @brief ヘッダ行のトークン（符号なし整数または単語）
 *
 * 64bit 符号付き整数に収まらない数は単語として渡される。
 */
using HeaderField = std::variant<uint64_t, std::string>;

/**
 * @brief パーサーのアクションから呼ばれる問題ビルダー
 *
 * ヘッダ行のトークンを集めて検証し、その後のリテラル列を節に区切る。
 * 0 で終わらない末尾のリテラルは捨てる。
 * 変数数の超過は finish() まで保留するので、後続の不正トークン（BadClause）が優先される。
 */
class ProblemBuilder {
public:
    ProblemBuilder() = default;

    /**
     * @brief "p" に続くヘッダ行のトークンを追加
     */
    void add_header_field(HeaderField field);

    /**
     * @brief ヘッダ行を確定
     * @return 形式が "cnf <非負整数> <非負整数>" でなければ BadHeader
     */
    std::optional<ParseErrorKind> finish_header();

    /**
     * @brief ヘッダが確定済みか
     */
    bool has_header() const { return header_.has_value(); }

    /**
     * @brief 1 始まりの符号付きリテラルを追加（0 は節の終端）
     * @return 32bit に収まらなければ BadClause
     * @pre has_header()
     */
    std::optional<ParseErrorKind> add_literal(int64_t value);

    /**
     * @brief 問題を取り出す
     * @throws ParseError ヘッダがない、変数数を超えるリテラルがあった、
     *         または節の数が宣言と一致しない場合
     */
    std::unique_ptr<Problem> finish();

private:
    std::vector<HeaderField> header_fields_;
    std::optional<Header> header_;
    Formula formula_;
    Clause clause_;
    bool variable_count_exceeded_ = false;
};

/**
 * @brief DIMACS ファイルをパース
 * @param filename ファイル名
 * @return パースされた問題
 * @throws ParseError パースエラー時
 */
std::unique_ptr<Problem> parse_file(const std::string& filename);

/**
 * @brief 開いているストリーム（標準入力など）をパース
 * @throws ParseError パースエラー時
 */
std::unique_ptr<Problem> parse_stream(FILE* in);

/**
 * @brief DIMACS 文字列をパース
 * @param input 入力文字列
 * @return パースされた問題
 * @throws ParseError パースエラー時
 */
std::unique_ptr<Problem> parse_string(const std::string& input);

/**
 * @brief 割当を 1 始まりの符号付き整数の列に整形
 *
 * 例: [true, false, true] -> "1 -2 3"。空の割当は空文字列。
 */
std::string format_assignment(const Assignment& assignment);

} // namespace dimacs
} // namespace dpll_sat

#endif // DPLL_SAT_DIMACS_PROBLEM_HPP
