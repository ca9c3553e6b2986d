#include "terminus/rules/slash_terminator_rule.hpp"

#include "sql_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace terminus::rules;
using terminus::syntax::Dialect;
using terminus::syntax::SegmentKind;
using terminus::syntax::SyntaxTree;
using terminus::testing::apply_results;
using terminus::testing::find_all;
using terminus::testing::parse_tree;
using terminus::testing::run_rule;

TEST_CASE("SlashTerminatorRule moves a slash after a semicolon onto its own line")
{
    const SlashTerminatorRule rule{};
    const auto tree = parse_tree("select 1 from dual; /", Dialect::Oracle);
    const auto slash = find_all(tree, SegmentKind::StatementTerminator).back();
    REQUIRE(tree.raw(slash) == "/");

    const auto results = run_rule(rule, tree, Dialect::Oracle);
    REQUIRE(results.size() == 1U);
    CHECK(results.front().anchor == slash);
    CHECK(results.front().description == "Slash terminator should be on a new line.");
    const std::vector<LintFix> expected{LintFix::create_before(slash, {NewSegment::newline()})};
    CHECK(results.front().fixes == expected);

    const auto fixed = apply_results(tree, results);
    CHECK(fixed == "select 1 from dual; \n/");
    const auto again = parse_tree(fixed, Dialect::Oracle);
    CHECK(run_rule(rule, again, Dialect::Oracle).empty());
}

TEST_CASE("SlashTerminatorRule flags a slash after a PL/SQL block on the same line")
{
    const SlashTerminatorRule rule{};
    const auto tree = parse_tree("begin\n  null;\nend; /", Dialect::Oracle);

    const auto results = run_rule(rule, tree, Dialect::Oracle);
    REQUIRE(results.size() == 1U);
    CHECK(apply_results(tree, results) == "begin\n  null;\nend; \n/");
}

TEST_CASE("SlashTerminatorRule accepts slashes on their own line")
{
    const SlashTerminatorRule rule{};
    for (const auto* sql : {"begin\n  null;\nend;\n/\n", "select 1 from dual\n/", "select 1 from dual;\n/"}) {
        const auto tree = parse_tree(sql, Dialect::Oracle);
        CHECK(run_rule(rule, tree, Dialect::Oracle).empty());
    }

    const auto blocks = parse_tree(terminus::testing::kOracleBlocks, Dialect::Oracle);
    CHECK(run_rule(rule, blocks, Dialect::Oracle).empty());
}

TEST_CASE("SlashTerminatorRule ignores a slash at the start of the file")
{
    const SlashTerminatorRule rule{};
    const auto tree = parse_tree("/\nselect 1 from dual;", Dialect::Oracle);
    REQUIRE(tree.raw(find_all(tree, SegmentKind::StatementTerminator).front()) == "/");
    CHECK(run_rule(rule, tree, Dialect::Oracle).empty());
}

TEST_CASE("SlashTerminatorRule accepts whitespace that already holds a line break")
{
    SyntaxTree tree;
    const auto statement = tree.add_node(SegmentKind::Statement, tree.root());
    tree.add_raw(SegmentKind::Keyword, "commit", {1U, 1U, 0U}, statement);
    tree.add_raw(SegmentKind::Whitespace, " \n", {1U, 7U, 6U}, tree.root());
    tree.add_raw(SegmentKind::StatementTerminator, "/", {2U, 1U, 8U}, tree.root());

    const SlashTerminatorRule rule{};
    CHECK(run_rule(rule, tree, Dialect::Oracle).empty());
}

TEST_CASE("SlashTerminatorRule only runs for the Oracle dialect")
{
    const SlashTerminatorRule rule{};
    const auto oracle_tree = parse_tree("select 1 from dual; /", Dialect::Oracle);
    CHECK(run_rule(rule, oracle_tree, Dialect::Ansi).empty());

    const auto ansi_tree = parse_tree("select 1 from dual; /");
    CHECK(run_rule(rule, ansi_tree, Dialect::Ansi).empty());
}

TEST_CASE("SlashTerminatorRule ignores semicolon terminators")
{
    const SlashTerminatorRule rule{};
    const auto tree = parse_tree("select 1 from dual ;", Dialect::Oracle);
    CHECK(run_rule(rule, tree, Dialect::Oracle).empty());
}
