#include "terminus/syntax/lexer.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace terminus::syntax {

namespace pegtl = tao::pegtl;

namespace {

struct newline_token : pegtl::sor<pegtl::string<'\r', '\n'>, pegtl::one<'\n'>, pegtl::one<'\r'>> {
};

struct whitespace_token : pegtl::plus<pegtl::one<' ', '\t', '\f', '\v'>> {
};

struct inline_comment_token : pegtl::seq<pegtl::string<'-', '-'>, pegtl::star<pegtl::not_one<'\r', '\n'>>> {
};

struct block_comment_token
    : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::sor<pegtl::string<'*', '/'>, pegtl::eof>>> {
};

struct closing_single_quote : pegtl::one<'\''> {
};

struct closing_double_quote : pegtl::one<'"'> {
};

struct single_quoted_token
    : pegtl::if_must<pegtl::one<'\''>,
                     pegtl::star<pegtl::sor<pegtl::string<'\'', '\''>, pegtl::not_one<'\''>>>,
                     closing_single_quote> {
};

struct double_quoted_token
    : pegtl::if_must<pegtl::one<'"'>,
                     pegtl::star<pegtl::sor<pegtl::string<'"', '"'>, pegtl::not_one<'"'>>>,
                     closing_double_quote> {
};

struct exponent_rule : pegtl::seq<pegtl::one<'e', 'E'>, pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

struct number_token
    : pegtl::seq<pegtl::sor<pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>>,
                            pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>>,
                 pegtl::opt<exponent_rule>> {
};

struct word_start : pegtl::sor<pegtl::alpha, pegtl::one<'_'>, pegtl::utf8::range<0x80, 0x10FFFF>> {
};

struct word_tail : pegtl::sor<pegtl::alnum, pegtl::one<'_', '$', '#'>, pegtl::utf8::range<0x80, 0x10FFFF>> {
};

struct word_token : pegtl::seq<word_start, pegtl::star<word_tail>> {
};

struct open_paren_token : pegtl::one<'('> {
};

struct close_paren_token : pegtl::one<')'> {
};

struct operator_token : pegtl::sor<pegtl::string<'<', '>'>,
                                   pegtl::string<'<', '='>,
                                   pegtl::string<'>', '='>,
                                   pegtl::string<'!', '='>,
                                   pegtl::string<'|', '|'>,
                                   pegtl::string<':', '='>,
                                   pegtl::string<':', ':'>,
                                   pegtl::string<'=', '>'>> {
};

struct symbol_token : pegtl::any {
};

struct sql_token : pegtl::sor<newline_token,
                              whitespace_token,
                              inline_comment_token,
                              block_comment_token,
                              single_quoted_token,
                              double_quoted_token,
                              number_token,
                              word_token,
                              open_paren_token,
                              close_paren_token,
                              operator_token,
                              symbol_token> {
};

struct sql_grammar : pegtl::seq<pegtl::star<sql_token>, pegtl::eof> {
};

template <typename Rule>
inline constexpr const char* lexer_error_message = "expected a SQL token";

template <>
inline constexpr const char* lexer_error_message<closing_single_quote> = "expected closing quote for string literal";

template <>
inline constexpr const char* lexer_error_message<closing_double_quote> = "expected closing quote for quoted identifier";

template <typename Rule>
struct lexer_control : pegtl::normal<Rule> {
    template <typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...)
    {
        throw pegtl::parse_error(lexer_error_message<Rule>, in);
    }
};

template <SegmentKind Kind>
struct emit_token {
    template <typename ActionInput>
    static void apply(const ActionInput& in, std::vector<RawToken>& tokens)
    {
        const auto position = in.position();
        RawToken token{};
        token.kind = Kind;
        token.text = in.string();
        token.position = PositionMarker{position.line, position.column, position.byte};
        tokens.push_back(std::move(token));
    }
};

template <typename Rule>
struct lexer_action : pegtl::nothing<Rule> {
};

template <>
struct lexer_action<newline_token> : emit_token<SegmentKind::Newline> {
};

template <>
struct lexer_action<whitespace_token> : emit_token<SegmentKind::Whitespace> {
};

template <>
struct lexer_action<inline_comment_token> : emit_token<SegmentKind::InlineComment> {
};

template <>
struct lexer_action<block_comment_token> : emit_token<SegmentKind::BlockComment> {
};

template <>
struct lexer_action<single_quoted_token> : emit_token<SegmentKind::Literal> {
};

template <>
struct lexer_action<double_quoted_token> : emit_token<SegmentKind::Identifier> {
};

template <>
struct lexer_action<number_token> : emit_token<SegmentKind::Literal> {
};

template <>
struct lexer_action<open_paren_token> : emit_token<SegmentKind::Symbol> {
};

template <>
struct lexer_action<close_paren_token> : emit_token<SegmentKind::Symbol> {
};

template <>
struct lexer_action<operator_token> : emit_token<SegmentKind::Symbol> {
};

template <>
struct lexer_action<symbol_token> : emit_token<SegmentKind::Symbol> {
};

template <>
struct lexer_action<word_token> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, std::vector<RawToken>& tokens)
    {
        const auto position = in.position();
        RawToken token{};
        token.text = in.string();
        token.kind = is_sql_keyword(token.text) ? SegmentKind::Keyword : SegmentKind::Identifier;
        token.position = PositionMarker{position.line, position.column, position.byte};
        tokens.push_back(std::move(token));
    }
};

constexpr std::string_view kKeywords[] = {
    "ALL", "ALTER", "AND", "ANY", "AS", "ASC", "AUTHORIZATION", "BEGIN",
    "BETWEEN", "BODY", "BOTH", "BY", "CALL", "CASCADE", "CASE", "CAST",
    "CHECK", "COLUMN", "COMMIT", "CONSTRAINT", "CREATE", "CROSS", "CURRENT", "CURSOR",
    "DATABASE", "DECLARE", "DEFAULT", "DELETE", "DESC", "DISTINCT", "DROP", "EACH",
    "EDITIONABLE", "ELSE", "ELSIF", "END", "ESCAPE", "EXCEPT", "EXCEPTION", "EXECUTE",
    "EXISTS", "EXPLAIN", "FALSE", "FETCH", "FOR", "FOREIGN", "FROM", "FULL",
    "FUNCTION", "GRANT", "GROUP", "HAVING", "IF", "IMMEDIATE", "IN", "INDEX",
    "INNER", "INSERT", "INTERSECT", "INTO", "IS", "JOIN", "KEY", "LEFT",
    "LIKE", "LIMIT", "LOOP", "MATCHED", "MERGE", "MINUS", "NATURAL", "NONEDITIONABLE",
    "NOT", "NULL", "OFFSET", "ON", "OR", "ORDER", "OUT", "OUTER",
    "OVER", "PACKAGE", "PARTITION", "PRIMARY", "PROCEDURE", "REFERENCES", "REPLACE", "RETURN",
    "RETURNING", "REVOKE", "RIGHT", "ROLLBACK", "ROW", "ROWS", "SCHEMA", "SELECT",
    "SET", "TABLE", "THEN", "TO", "TRIGGER", "TRUE", "TRUNCATE", "TYPE",
    "UNION", "UNIQUE", "UPDATE", "USE", "USING", "VALUES", "VIEW", "WHEN",
    "WHERE", "WHILE", "WINDOW", "WITH"};

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view expected_prefix = "expected ";
    if (message.rfind(expected_prefix, 0) == 0U && message.size() > expected_prefix.size()) {
        return "Missing " + std::string{message.substr(expected_prefix.size())};
    }
    return std::string{message};
}

std::string_view extract_line(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }
    offset = std::min(offset, input.size() - 1U);
    const auto begin = input.rfind('\n', offset);
    const auto start = begin == std::string_view::npos ? 0U : begin + 1U;
    auto end = input.find('\n', offset);
    if (end == std::string_view::npos) {
        end = input.size();
    }
    return input.substr(start, end - start);
}

SyntaxDiagnostic make_lex_error(const pegtl::parse_error& error, std::string_view source)
{
    SyntaxDiagnostic diagnostic{};
    diagnostic.severity = SyntaxSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.remediation_hints = {"Close the quoted literal or identifier before the end of the file."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (byte_index >= source.size()) {
            diagnostic.message += " at end of input";
        }
        diagnostic.excerpt = trim_copy(extract_line(source, byte_index));
    }

    return diagnostic;
}

}  // namespace

bool is_sql_keyword(std::string_view word) noexcept
{
    if (word.empty() || word.size() > 32U) {
        return false;
    }
    char buffer[32];
    for (std::size_t index = 0; index < word.size(); ++index) {
        buffer[index] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[index])));
    }
    const std::string_view upper{buffer, word.size()};
    return std::binary_search(std::begin(kKeywords), std::end(kKeywords), upper);
}

PositionMarker end_position(const RawToken& token) noexcept
{
    auto position = token.position;
    for (std::size_t index = 0; index < token.text.size(); ++index) {
        const char ch = token.text[index];
        ++position.offset;
        if (ch == '\n' || (ch == '\r' && (index + 1U >= token.text.size() || token.text[index + 1U] != '\n'))) {
            ++position.line;
            position.column = 1U;
        } else if (ch != '\r') {
            ++position.column;
        }
    }
    return position;
}

LexResult lex_sql(std::string_view input)
{
    LexResult result{};
    pegtl::memory_input in(input.data(), input.size(), "sql");

    try {
        const auto parsed = pegtl::parse<sql_grammar, lexer_action, lexer_control>(in, result.tokens);
        if (!parsed) {
            SyntaxDiagnostic diagnostic{};
            diagnostic.severity = SyntaxSeverity::Error;
            diagnostic.message = "input did not match the SQL token grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            diagnostic.remediation_hints = {"Check the file encoding and remove stray control characters."};
            result.diagnostics.push_back(std::move(diagnostic));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_lex_error(error, input));
    }

    if (!result.success()) {
        result.tokens.clear();
    }
    return result;
}

}  // namespace terminus::syntax
