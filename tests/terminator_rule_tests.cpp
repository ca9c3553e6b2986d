#include "terminus/rules/terminator_rule.hpp"

#include "sql_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

using namespace terminus::rules;
using terminus::syntax::Dialect;
using terminus::syntax::SegmentKind;
using terminus::syntax::SyntaxTree;
using terminus::testing::apply_results;
using terminus::testing::find_all;
using terminus::testing::find_first;
using terminus::testing::find_raw;
using terminus::testing::make_statement_without_code;
using terminus::testing::parse_tree;
using terminus::testing::run_rule;

namespace {

RuleOptions make_options(bool multiline_newline, bool require_final_semicolon)
{
    RuleOptions options{};
    options.multiline_newline = multiline_newline;
    options.require_final_semicolon = require_final_semicolon;
    return options;
}

// Applies every fix and lints the output again; the second pass must be clean.
std::string fix_and_recheck(const TerminatorRule& rule, std::string_view sql, Dialect dialect = Dialect::Ansi)
{
    const auto tree = parse_tree(sql, dialect);
    const auto results = run_rule(rule, tree, dialect);
    const auto fixed = apply_results(tree, results);

    const auto again = parse_tree(fixed, dialect);
    CHECK(run_rule(rule, again, dialect).empty());
    return fixed;
}

}  // namespace

TEST_CASE("TerminatorRule accepts correctly terminated statements")
{
    const TerminatorRule rule{};
    for (const auto* sql : {"select 1;", "select\n  1;", "select 1;\nselect 2;\n", "", "-- only a comment\n"}) {
        const auto tree = parse_tree(sql);
        CHECK(run_rule(rule, tree).empty());
    }
}

TEST_CASE("TerminatorRule moves a terminator next to its statement")
{
    const TerminatorRule rule{};
    const auto tree = parse_tree("select 1 ;");
    const auto results = run_rule(rule, tree);

    REQUIRE(results.size() == 1U);
    CHECK(results.front().description == "Statements must end with a semi-colon.");
    CHECK(tree.kind(results.front().anchor) == SegmentKind::Dedent);
    CHECK(tree.position(results.front().anchor).column == 9U);
    CHECK_FALSE(has_conflicting_anchor(results.front().fixes));

    CHECK(fix_and_recheck(rule, "select 1 ;") == "select 1;");
    CHECK(fix_and_recheck(rule, "select 1\n\n;") == "select 1;");
}

TEST_CASE("TerminatorRule collapses repeated terminators into one result")
{
    const TerminatorRule rule{};

    const auto tree = parse_tree("select 1;;;;");
    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    CHECK(results.front().anchor == find_first(tree, SegmentKind::StatementTerminator));
    CHECK(results.front().fixes.size() == 3U);
    CHECK(std::all_of(results.front().fixes.begin(), results.front().fixes.end(), [](const LintFix& fix) {
        return fix.type == EditType::Delete;
    }));

    CHECK(fix_and_recheck(rule, "select 1;;;;") == "select 1;");
    CHECK(fix_and_recheck(rule, "select 1; ; ;") == "select 1;");
    CHECK(fix_and_recheck(rule, "select 1;;\nselect 2;") == "select 1;\nselect 2;");
}

TEST_CASE("TerminatorRule never moves an inline comment before the terminator")
{
    const TerminatorRule rule{};
    const auto tree = parse_tree("select 1 -- noqa\n;");
    const auto comment = find_first(tree, SegmentKind::InlineComment);

    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    for (const auto& fix : results.front().fixes) {
        CHECK(fix.anchor != comment);
    }

    CHECK(fix_and_recheck(rule, "select 1 -- noqa\n;") == "select 1; -- noqa");
}

TEST_CASE("TerminatorRule accepts a terminator on its own line after a multi-line statement")
{
    const TerminatorRule rule{make_options(true, false)};
    for (const auto* sql : {"select\n  1\n;", "select\n  1 -- noqa\n;", "select 1;"}) {
        const auto tree = parse_tree(sql);
        CHECK(run_rule(rule, tree).empty());
    }
}

TEST_CASE("TerminatorRule puts the terminator of a multi-line statement on a new line")
{
    const TerminatorRule rule{make_options(true, false)};

    const auto tree = parse_tree("select\n  1;");
    const auto statement = find_first(tree, SegmentKind::Statement);
    const auto terminator = find_first(tree, SegmentKind::StatementTerminator);
    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    const std::vector<LintFix> expected{
        LintFix::create_after(statement, {NewSegment::newline(), NewSegment::terminator()}),
        LintFix::remove(terminator)};
    CHECK(results.front().fixes == expected);

    CHECK(fix_and_recheck(rule, "select\n  1;") == "select\n  1\n;");
    CHECK(fix_and_recheck(rule, "select\n  1 ;") == "select\n  1\n;");
    CHECK(fix_and_recheck(rule, "select\n  1 -- noqa\n\n;") == "select\n  1 -- noqa\n;");
    CHECK(fix_and_recheck(rule, "select 1 ;") == "select 1;");
}

TEST_CASE("TerminatorRule keeps a trailing inline comment ahead of the moved terminator")
{
    const TerminatorRule rule{make_options(true, false)};
    const auto tree = parse_tree("select\n  1; -- done");
    const auto comment = find_first(tree, SegmentKind::InlineComment);

    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    CHECK(results.front().anchor == comment);
    CHECK(results.front().fixes.front() == LintFix::create_after(comment, {NewSegment::newline(), NewSegment::terminator()}));

    CHECK(fix_and_recheck(rule, "select\n  1; -- done") == "select\n  1 -- done\n;");
}

TEST_CASE("TerminatorRule ignores the comment of the next statement on the same line")
{
    const TerminatorRule rule{make_options(true, false)};
    const auto tree = parse_tree("select\n  1 ; select 2 -- c");
    const auto comment = find_first(tree, SegmentKind::InlineComment);

    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    CHECK(results.front().anchor != comment);
    for (const auto& fix : results.front().fixes) {
        CHECK(fix.anchor != comment);
    }

    CHECK(fix_and_recheck(rule, "select\n  1 ; select 2 -- c") == "select\n  1\n; select 2 -- c");
}

TEST_CASE("TerminatorRule places a missing terminator after the line a bracket ends on")
{
    const TerminatorRule rule{make_options(true, true)};
    CHECK(fix_and_recheck(rule, "select foo( -- c\n  1)\nselect 2;") == "select foo( -- c\n  1)\n;\nselect 2;");
    CHECK(fix_and_recheck(rule, "select foo(\n  1) -- c\nselect 2;") == "select foo(\n  1) -- c\n;\nselect 2;");
}

TEST_CASE("TerminatorRule adds a missing final terminator")
{
    const TerminatorRule rule{make_options(false, true)};
    const auto tree = parse_tree("select 1");
    const auto statement = find_first(tree, SegmentKind::Statement);

    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    CHECK(tree.kind(results.front().anchor) == SegmentKind::EndOfFile);
    const std::vector<LintFix> expected{LintFix::create_after(statement, {NewSegment::terminator()})};
    CHECK(results.front().fixes == expected);

    CHECK(fix_and_recheck(rule, "select 1") == "select 1;");
    CHECK(fix_and_recheck(rule, "select 1\n") == "select 1;\n");
}

TEST_CASE("TerminatorRule adds a final terminator without a newline for a single-line statement")
{
    const TerminatorRule rule{make_options(true, true)};
    CHECK(fix_and_recheck(rule, "select 1  \n") == "select 1;  \n");
}

TEST_CASE("TerminatorRule adds a final terminator on its own line after a multi-line statement")
{
    const TerminatorRule rule{make_options(true, true)};
    CHECK(fix_and_recheck(rule, "select\n  1") == "select\n  1\n;");
    CHECK(fix_and_recheck(rule, "select\n  1 -- note\n") == "select\n  1 -- note\n;\n");
}

TEST_CASE("TerminatorRule terminates a statement followed by another statement")
{
    const TerminatorRule rule{make_options(false, true)};
    const auto tree = parse_tree("select 1\nselect 2;");
    const auto first = find_all(tree, SegmentKind::Statement).front();

    const auto results = run_rule(rule, tree);
    REQUIRE(results.size() == 1U);
    CHECK(results.front().anchor == find_raw(tree, "1"));
    const std::vector<LintFix> expected{LintFix::create_after(first, {NewSegment::terminator()})};
    CHECK(results.front().fixes == expected);

    CHECK(fix_and_recheck(rule, "select 1\nselect 2;") == "select 1;\nselect 2;");
    CHECK(fix_and_recheck(rule, "select 1\nselect 2") == "select 1;\nselect 2;");
    CHECK(fix_and_recheck(rule, "select\n  1 -- a\nselect 2;") == "select\n  1; -- a\nselect 2;");
}

TEST_CASE("TerminatorRule places a missing mid-file terminator after a trailing comment in newline mode")
{
    const TerminatorRule rule{make_options(true, true)};
    CHECK(fix_and_recheck(rule, "select\n  1 -- a\nselect 2;") == "select\n  1 -- a\n;\nselect 2;");
}

TEST_CASE("TerminatorRule only checks missing terminators when asked to")
{
    const TerminatorRule rule{};
    const auto tree = parse_tree("select 1\nselect 2");
    CHECK(run_rule(rule, tree).empty());
}

TEST_CASE("TerminatorRule treats the last terminator as final despite trailing trivia")
{
    const TerminatorRule rule{make_options(false, true)};
    for (const auto* sql : {"select 1;\n\n", "select 1; -- done\n", "select 1;\n/* trailer */\n", "select 1;\nselect 2;\n"}) {
        const auto tree = parse_tree(sql);
        CHECK(run_rule(rule, tree).empty());
    }
}

TEST_CASE("TerminatorRule is satisfied by any terminator for the final check")
{
    const TerminatorRule rule{make_options(false, true)};
    const auto tree = parse_tree("select 1; select 2");
    CHECK(run_rule(rule, tree).empty());
}

TEST_CASE("TerminatorRule reports nothing for files without statements")
{
    const TerminatorRule rule{make_options(true, true)};
    for (const auto* sql : {"", "\n\n", "-- just a comment\n", "/* block */"}) {
        const auto tree = parse_tree(sql);
        CHECK(run_rule(rule, tree).empty());
    }
}

TEST_CASE("TerminatorRule leaves Oracle slash terminators alone")
{
    const TerminatorRule rule{make_options(true, true)};
    for (const auto* sql : {"select 1 from dual\n/", "begin\n  null;\nend;\n/\n", "select 1 from dual; /"}) {
        const auto tree = parse_tree(sql, Dialect::Oracle);
        CHECK(run_rule(rule, tree, Dialect::Oracle).empty());
    }

    const auto blocks = parse_tree(terminus::testing::kOracleBlocks, Dialect::Oracle);
    CHECK(run_rule(rule, blocks, Dialect::Oracle).empty());
}

TEST_CASE("TerminatorRule skips statements without code")
{
    const TerminatorRule rule{make_options(false, true)};

    const auto bare = make_statement_without_code(false);
    CHECK(run_rule(rule, bare.tree).empty());

    const auto terminated = make_statement_without_code(true);
    CHECK(run_rule(rule, terminated.tree).empty());
}

TEST_CASE("TerminatorRule logs its decisions")
{
    const TerminatorRule rule{make_options(false, true)};
    const auto tree = parse_tree("select 1 ;");
    std::vector<std::string> messages;
    const RuleContext context{tree, Dialect::Ansi, [&messages](std::string_view message) {
                                  messages.emplace_back(message);
                              }};

    CHECK(rule.evaluate(context).size() == 1U);

    const auto logged = [&messages](std::string_view prefix) {
        return std::any_of(messages.begin(), messages.end(), [prefix](const std::string& message) {
            return message.rfind(prefix, 0) == 0U;
        });
    };
    CHECK(logged("Handling terminator: statement_terminator ';' @1:10"));
    CHECK(logged("Semicolon Newline: false"));
    CHECK(logged("Handling final segment: end_of_file"));
    CHECK(logged("Trigger on: "));
}

TEST_CASE("TerminatorRule handles files with many statements")
{
    constexpr std::size_t statements = 5000U;
    std::string clean;
    std::string unterminated;
    for (std::size_t index = 0; index < statements; ++index) {
        clean += "select 1; -- row\n";
        unterminated += "select\n  1 -- row\n";
    }

    const TerminatorRule rule{make_options(true, true)};
    CHECK(run_rule(rule, parse_tree(clean)).empty());

    const auto tree = parse_tree(unterminated);
    const auto results = run_rule(rule, tree);
    CHECK(results.size() == statements);
    CHECK(run_rule(rule, parse_tree(apply_results(tree, results))).empty());
}
