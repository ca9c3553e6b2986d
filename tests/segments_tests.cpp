#include "terminus/syntax/segments.hpp"

#include "sql_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace terminus::syntax;
using terminus::testing::parse_tree;

namespace sp = terminus::syntax::predicates;

TEST_CASE("Segments reversed keeps every node in reverse order")
{
    const auto tree = parse_tree("select 1 ;");
    const auto raws = Segments::raw_segments_of(tree, tree.root());
    REQUIRE(raws.size() == 8U);

    const auto reversed = raws.reversed();
    CHECK(reversed.front() == raws.back());
    CHECK(reversed.back() == raws.front());
    CHECK(reversed.reversed().ids() == raws.ids());
}

TEST_CASE("Segments select loops backward from a start node")
{
    const auto tree = parse_tree("select 1 ;");
    const auto raws = Segments::raw_segments_of(tree, tree.root());
    const auto terminator = raws[6];
    REQUIRE(tree.kind(terminator) == SegmentKind::StatementTerminator);

    SelectOptions options{};
    options.loop_while = sp::not_(sp::is_code());
    options.start = terminator;
    const auto trivia = raws.reversed().select(options);

    REQUIRE(trivia.size() == 2U);
    CHECK(tree.kind(trivia[0]) == SegmentKind::Whitespace);
    CHECK(tree.kind(trivia[1]) == SegmentKind::Dedent);

    const auto non_meta = trivia.select(sp::not_(sp::is_meta()));
    REQUIRE(non_meta.size() == 1U);
    CHECK(non_meta.front() == trivia.front());
}

TEST_CASE("Segments select honours stop and unknown start nodes")
{
    const auto tree = parse_tree("select 1 ;");
    const auto raws = Segments::raw_segments_of(tree, tree.root());

    SelectOptions until_literal{};
    until_literal.stop = raws[3];
    CHECK(raws.select(until_literal).size() == 3U);

    SelectOptions from_missing{};
    from_missing.start = kInvalidNode;
    CHECK(raws.select(from_missing).empty());

    SelectOptions from_last{};
    from_last.start = raws.back();
    CHECK(raws.select(from_last).empty());
}

TEST_CASE("Segments first and last find matching nodes")
{
    const auto tree = parse_tree("select 1 ;");
    const auto raws = Segments::raw_segments_of(tree, tree.root());

    const auto first_code = raws.first(sp::is_code());
    REQUIRE(first_code.size() == 1U);
    CHECK(tree.raw(first_code.front()) == "select");

    const auto last_code = raws.last(sp::is_code());
    REQUIRE(last_code.size() == 1U);
    CHECK(tree.raw(last_code.front()) == ";");

    CHECK(raws.first().front() == raws.front());
    CHECK(raws.first(sp::is_comment()).empty());
}

TEST_CASE("Segments head, without and index_of")
{
    const auto tree = parse_tree("select 1 ;");
    const auto raws = Segments::raw_segments_of(tree, tree.root());

    CHECK(raws.head(2U).size() == 2U);
    CHECK(raws.head(100U).size() == raws.size());
    CHECK(raws.head(0U).empty());

    const auto trimmed = raws.without(raws[2]);
    CHECK(trimmed.size() == raws.size() - 1U);
    CHECK_FALSE(trimmed.contains(raws[2]));
    CHECK(trimmed.contains(raws[3]));

    CHECK(raws.index_of(raws[5]) == 5U);
    CHECK_FALSE(raws.index_of(kInvalidNode).has_value());
}

TEST_CASE("Segment predicates compose")
{
    const auto tree = parse_tree("select 1 -- c\n;");
    const auto children = Segments::children_of(tree, tree.root());

    CHECK(children.any(sp::is_comment()));
    CHECK_FALSE(children.all(sp::is_code()));
    CHECK(children.all());
    CHECK(Segments{tree}.all(sp::is_code()));
    CHECK_FALSE(Segments{tree}.any());

    const auto trivia = children.select(sp::or_(sp::is_whitespace(), sp::is_comment()));
    CHECK(trivia.size() == 3U);

    const auto terminators = children.select(sp::and_(sp::is_type(SegmentKind::StatementTerminator), sp::raw_is(";")));
    REQUIRE(terminators.size() == 1U);
    CHECK(tree.raw(terminators.front()) == ";");

    CHECK(children.select(sp::raw_is("/")).empty());
}
