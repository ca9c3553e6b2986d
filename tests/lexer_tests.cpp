#include "terminus/syntax/lexer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace terminus::syntax;

namespace {

std::vector<SegmentKind> kinds_of(const LexResult& result)
{
    std::vector<SegmentKind> kinds;
    for (const auto& token : result.tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.rfind(prefix, 0) == 0U;
}

}  // namespace

TEST_CASE("Lexer splits a statement into typed tokens")
{
    const auto lexed = lex_sql("select 'a''b' -- c\n");
    REQUIRE(lexed.success());

    const std::vector<SegmentKind> expected{SegmentKind::Keyword,
                                            SegmentKind::Whitespace,
                                            SegmentKind::Literal,
                                            SegmentKind::Whitespace,
                                            SegmentKind::InlineComment,
                                            SegmentKind::Newline};
    CHECK(kinds_of(lexed) == expected);
    CHECK(lexed.tokens[2].text == "'a''b'");
    CHECK(lexed.tokens[4].text == "-- c");
    CHECK(lexed.tokens[5].text == "\n");
}

TEST_CASE("Lexer records line, column and byte offset")
{
    const auto lexed = lex_sql("select\n  x");
    REQUIRE(lexed.success());
    REQUIRE(lexed.tokens.size() == 4U);

    const auto& identifier = lexed.tokens.back();
    CHECK(identifier.kind == SegmentKind::Identifier);
    CHECK(identifier.position.line == 2U);
    CHECK(identifier.position.column == 3U);
    CHECK(identifier.position.offset == 9U);
}

TEST_CASE("Lexer classifies keywords case-insensitively")
{
    const auto lexed = lex_sql("SeLeCt foo \"Quoted\"");
    REQUIRE(lexed.success());

    const std::vector<SegmentKind> expected{SegmentKind::Keyword,
                                            SegmentKind::Whitespace,
                                            SegmentKind::Identifier,
                                            SegmentKind::Whitespace,
                                            SegmentKind::Identifier};
    CHECK(kinds_of(lexed) == expected);
}

TEST_CASE("Lexer reads numbers, operators and terminator symbols")
{
    const auto lexed = lex_sql("1.5e3<>x;/");
    REQUIRE(lexed.success());
    REQUIRE(lexed.tokens.size() == 5U);

    CHECK(lexed.tokens[0].kind == SegmentKind::Literal);
    CHECK(lexed.tokens[0].text == "1.5e3");
    CHECK(lexed.tokens[1].text == "<>");
    CHECK(lexed.tokens[2].kind == SegmentKind::Identifier);
    CHECK(lexed.tokens[3].kind == SegmentKind::Symbol);
    CHECK(lexed.tokens[3].text == ";");
    CHECK(lexed.tokens[4].kind == SegmentKind::Symbol);
    CHECK(lexed.tokens[4].text == "/");
}

TEST_CASE("Lexer keeps block comments apart from the slash symbol")
{
    const auto lexed = lex_sql("end;\n/* note\n*/\n/");
    REQUIRE(lexed.success());
    REQUIRE(lexed.tokens.size() == 6U);

    CHECK(lexed.tokens[3].kind == SegmentKind::BlockComment);
    CHECK(lexed.tokens[3].text == "/* note\n*/");
    CHECK(lexed.tokens[5].text == "/");
    CHECK(lexed.tokens[5].position.line == 4U);
}

TEST_CASE("Lexer runs an unterminated block comment to the end of input")
{
    const auto lexed = lex_sql("select 1 /* open");
    REQUIRE(lexed.success());
    CHECK(lexed.tokens.back().kind == SegmentKind::BlockComment);
    CHECK(lexed.tokens.back().text == "/* open");
}

TEST_CASE("Lexer treats CRLF as a single newline")
{
    const auto lexed = lex_sql("a\r\nb");
    REQUIRE(lexed.success());
    REQUIRE(lexed.tokens.size() == 3U);

    CHECK(lexed.tokens[1].kind == SegmentKind::Newline);
    CHECK(lexed.tokens[1].text == "\r\n");
    CHECK(lexed.tokens[2].position.line == 2U);
    CHECK(lexed.tokens[2].position.column == 1U);
}

TEST_CASE("Lexer reports an unterminated string literal")
{
    const auto lexed = lex_sql("select 'abc");
    CHECK_FALSE(lexed.success());
    CHECK(lexed.tokens.empty());
    REQUIRE(lexed.diagnostics.size() == 1U);

    const auto& diagnostic = lexed.diagnostics.front();
    CHECK(diagnostic.severity == SyntaxSeverity::Error);
    CHECK(starts_with(diagnostic.message, "Missing closing quote for string literal"));
    CHECK(diagnostic.line == 1U);
    CHECK(diagnostic.excerpt == "select 'abc");
    CHECK_FALSE(diagnostic.remediation_hints.empty());
}

TEST_CASE("Lexer reports an unterminated quoted identifier")
{
    const auto lexed = lex_sql("select \"abc");
    REQUIRE(lexed.diagnostics.size() == 1U);
    CHECK(starts_with(lexed.diagnostics.front().message, "Missing closing quote for quoted identifier"));
}

TEST_CASE("Keyword table lookups")
{
    CHECK(is_sql_keyword("select"));
    CHECK(is_sql_keyword("NONEDITIONABLE"));
    CHECK_FALSE(is_sql_keyword("widget"));
    CHECK_FALSE(is_sql_keyword(""));
    CHECK_FALSE(is_sql_keyword("an_identifier_that_is_far_longer_than_any_keyword"));
}

TEST_CASE("end_position steps past the token text")
{
    RawToken token{};
    token.text = "a\nbc";
    token.position = PositionMarker{1U, 1U, 0U};

    const auto end = end_position(token);
    CHECK(end.line == 2U);
    CHECK(end.column == 3U);
    CHECK(end.offset == 4U);
}
