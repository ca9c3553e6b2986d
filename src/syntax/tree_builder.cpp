#include "terminus/syntax/tree_builder.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <utility>

namespace terminus::syntax {

namespace {

constexpr std::string_view kStatementStarters[] = {
    "ALTER", "BEGIN", "CALL", "COMMIT", "CREATE", "DECLARE", "DELETE", "DROP", "EXPLAIN", "GRANT",
    "INSERT", "MERGE", "REVOKE", "ROLLBACK", "SELECT", "SET", "TRUNCATE", "UPDATE", "USE", "WITH"};

constexpr std::string_view kContinuationTokens[] = {
    "(", ",", "=", "ALL", "AS", "DISTINCT", "ELSE", "EXCEPT", "INTERSECT", "MINUS", "THEN", "UNION"};

constexpr std::string_view kPlsqlObjects[] = {"FUNCTION", "PACKAGE", "PROCEDURE", "TRIGGER", "TYPE"};

template <std::size_t N>
bool contains_word(const std::string_view (&table)[N], std::string_view word) noexcept
{
    return std::find(std::begin(table), std::end(table), word) != std::end(table);
}

std::string uppercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

bool is_trivia(SegmentKind kind) noexcept
{
    return is_whitespace_kind(kind) || is_comment_kind(kind);
}

bool breaks_line(const RawToken& token) noexcept
{
    if (token.kind == SegmentKind::Newline) {
        return true;
    }
    return token.kind == SegmentKind::BlockComment
           && token.text.find_first_of("\r\n") != std::string::npos;
}

class TreeBuilder final {
public:
    TreeBuilder(const std::vector<RawToken>& tokens, Dialect dialect, std::vector<SyntaxDiagnostic>& diagnostics)
        : tokens_{tokens}
        , dialect_{dialect}
        , diagnostics_{diagnostics}
    {
    }

    SyntaxTree build()
    {
        for (std::size_t index = 0; index < tokens_.size(); ++index) {
            const auto& token = tokens_[index];
            if (is_trivia(token.kind)) {
                pending_trivia_.push_back(index);
                if (breaks_line(token)) {
                    code_on_line_ = false;
                }
                continue;
            }
            handle_code(index);
            code_on_line_ = true;
        }

        close_statement();
        flush_trivia(tree_.root());

        PositionMarker end{1U, 1U, 0U};
        if (!tokens_.empty()) {
            end = end_position(tokens_.back());
        }
        tree_.add_meta(SegmentKind::EndOfFile, end, tree_.root());
        return std::move(tree_);
    }

private:
    void handle_code(std::size_t index)
    {
        const auto& token = tokens_[index];

        if (token.text == ";") {
            if (statement_ != kInvalidNode && plsql_block_) {
                flush_trivia(container());
                add_code(token, SegmentKind::Symbol);
                last_code_was_semicolon_ = true;
                return;
            }
            add_terminator(token);
            last_code_was_semicolon_ = true;
            return;
        }

        if (token.text == "/" && dialect_ == Dialect::Oracle && slash_is_terminator(index)) {
            add_terminator(token);
            last_code_was_semicolon_ = false;
            return;
        }

        if (statement_ != kInvalidNode && starts_new_statement(index)) {
            close_statement();
        }

        if (statement_ == kInvalidNode) {
            open_statement(index);
        } else {
            flush_trivia(container());
        }

        if (token.text == "(") {
            const auto bracket = tree_.add_node(SegmentKind::Bracketed, container());
            tree_.add_raw(SegmentKind::Symbol, token.text, token.position, bracket);
            tree_.add_meta(SegmentKind::Indent, end_position(token), bracket);
            brackets_.push_back(bracket);
        } else if (token.text == ")" && !brackets_.empty()) {
            const auto bracket = brackets_.back();
            tree_.add_meta(SegmentKind::Dedent, token.position, bracket);
            tree_.add_raw(SegmentKind::Symbol, token.text, token.position, bracket);
            brackets_.pop_back();
        } else {
            if (token.text == ")") {
                SyntaxDiagnostic diagnostic{};
                diagnostic.severity = SyntaxSeverity::Warning;
                diagnostic.message = "Unbalanced closing parenthesis";
                diagnostic.line = token.position.line;
                diagnostic.column = token.position.column;
                diagnostic.remediation_hints = {"Remove the stray ')' or add the matching '('."};
                diagnostics_.push_back(std::move(diagnostic));
            }
            tree_.add_raw(token.kind, token.text, token.position, container());
        }

        last_code_end_ = end_position(token);
        last_code_ = index;
        last_code_was_semicolon_ = false;

        if (indent_pending_ && brackets_.empty()) {
            tree_.add_meta(SegmentKind::Indent, last_code_end_, statement_);
            indent_pending_ = false;
        }
    }

    void add_code(const RawToken& token, SegmentKind kind)
    {
        tree_.add_raw(kind, token.text, token.position, container());
        last_code_end_ = end_position(token);
        last_code_ = static_cast<std::size_t>(&token - tokens_.data());
    }

    void add_terminator(const RawToken& token)
    {
        close_statement();
        flush_trivia(tree_.root());
        tree_.add_raw(SegmentKind::StatementTerminator, token.text, token.position, tree_.root());
        last_code_end_ = end_position(token);
        last_code_ = static_cast<std::size_t>(&token - tokens_.data());
    }

    void open_statement(std::size_t index)
    {
        flush_trivia(tree_.root());
        statement_ = tree_.add_node(SegmentKind::Statement, tree_.root());
        statement_head_ = uppercase_copy(tokens_[index].text);
        plsql_block_ = dialect_ == Dialect::Oracle && opens_plsql_block(index);
        indent_pending_ = true;
    }

    void close_statement()
    {
        if (statement_ == kInvalidNode) {
            return;
        }

        while (!brackets_.empty()) {
            const auto bracket = brackets_.back();
            const auto opened_at = tree_.position(bracket);
            SyntaxDiagnostic diagnostic{};
            diagnostic.severity = SyntaxSeverity::Warning;
            diagnostic.message = "Unclosed parenthesis";
            diagnostic.line = opened_at.line;
            diagnostic.column = opened_at.column;
            diagnostic.remediation_hints = {"Add the matching ')' before the end of the statement."};
            diagnostics_.push_back(std::move(diagnostic));
            tree_.add_meta(SegmentKind::Dedent, last_code_end_, bracket);
            brackets_.pop_back();
        }

        if (indent_pending_) {
            tree_.add_meta(SegmentKind::Indent, last_code_end_, statement_);
            indent_pending_ = false;
        }
        tree_.add_meta(SegmentKind::Dedent, last_code_end_, statement_);

        statement_ = kInvalidNode;
        statement_head_.clear();
        plsql_block_ = false;
    }

    void flush_trivia(NodeId parent)
    {
        for (const auto index : pending_trivia_) {
            const auto& token = tokens_[index];
            tree_.add_raw(token.kind, token.text, token.position, parent);
        }
        pending_trivia_.clear();
    }

    [[nodiscard]] NodeId container() const noexcept
    {
        return brackets_.empty() ? statement_ : brackets_.back();
    }

    [[nodiscard]] bool starts_new_statement(std::size_t index) const
    {
        if (plsql_block_ || !brackets_.empty() || code_on_line_ || !last_code_) {
            return false;
        }

        const auto& token = tokens_[index];
        if (token.kind != SegmentKind::Keyword) {
            return false;
        }
        const auto word = uppercase_copy(token.text);
        if (!contains_word(kStatementStarters, word)) {
            return false;
        }

        const auto previous = uppercase_copy(tokens_[*last_code_].text);
        if (contains_word(kContinuationTokens, previous)) {
            return false;
        }

        const auto& head = statement_head_;
        if ((word == "SELECT" || word == "WITH")
            && (head == "INSERT" || head == "CREATE" || head == "WITH" || head == "EXPLAIN")) {
            return false;
        }
        if (word == "SET" && (head == "UPDATE" || head == "MERGE" || head == "ALTER")) {
            return false;
        }
        if ((word == "INSERT" || word == "UPDATE" || word == "DELETE") && (head == "MERGE" || head == "CREATE")) {
            return false;
        }
        return true;
    }

    [[nodiscard]] bool slash_is_terminator(std::size_t index) const
    {
        if (statement_ == kInvalidNode || last_code_was_semicolon_) {
            return true;
        }
        return alone_on_line(index);
    }

    [[nodiscard]] bool alone_on_line(std::size_t index) const
    {
        if (code_on_line_) {
            return false;
        }
        for (auto next = index + 1U; next < tokens_.size(); ++next) {
            const auto& token = tokens_[next];
            if (token.kind == SegmentKind::Newline) {
                return true;
            }
            if (!is_trivia(token.kind)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool opens_plsql_block(std::size_t index) const
    {
        std::vector<std::string> words;
        for (auto next = index; next < tokens_.size() && words.size() < 6U; ++next) {
            if (!is_trivia(tokens_[next].kind)) {
                words.push_back(uppercase_copy(tokens_[next].text));
            }
        }
        if (words.empty()) {
            return false;
        }
        if (words.front() == "DECLARE" || words.front() == "BEGIN") {
            return true;
        }
        if (words.front() != "CREATE") {
            return false;
        }

        std::size_t position = 1U;
        if (position + 1U < words.size() && words[position] == "OR" && words[position + 1U] == "REPLACE") {
            position += 2U;
        }
        if (position < words.size() && (words[position] == "EDITIONABLE" || words[position] == "NONEDITIONABLE")) {
            ++position;
        }
        return position < words.size() && contains_word(kPlsqlObjects, words[position]);
    }

    const std::vector<RawToken>& tokens_;
    Dialect dialect_;
    std::vector<SyntaxDiagnostic>& diagnostics_;
    SyntaxTree tree_{};
    NodeId statement_ = kInvalidNode;
    std::vector<NodeId> brackets_{};
    std::vector<std::size_t> pending_trivia_{};
    std::string statement_head_{};
    std::optional<std::size_t> last_code_{};
    PositionMarker last_code_end_{1U, 1U, 0U};
    bool plsql_block_ = false;
    bool indent_pending_ = false;
    bool last_code_was_semicolon_ = false;
    bool code_on_line_ = false;
};

}  // namespace

SyntaxTree build_tree(const std::vector<RawToken>& tokens, Dialect dialect, std::vector<SyntaxDiagnostic>& diagnostics)
{
    TreeBuilder builder{tokens, dialect, diagnostics};
    return builder.build();
}

ParseResult parse_sql(std::string_view input, Dialect dialect)
{
    ParseResult result{};
    auto lexed = lex_sql(input);
    if (!lexed.success()) {
        result.diagnostics = std::move(lexed.diagnostics);
        return result;
    }

    result.tree = build_tree(lexed.tokens, dialect, result.diagnostics);
    return result;
}

}  // namespace terminus::syntax
