#include "terminus/rules/terminator_placement.hpp"

#include <string>
#include <vector>

namespace terminus::rules {

using syntax::Segments;
using syntax::SegmentKind;
using syntax::SelectOptions;
using syntax::SyntaxTree;
namespace sp = syntax::predicates;

namespace {

// Line of the last leaf, so a multi-line composite reports where it ends.
std::size_t ending_line(const SyntaxTree& tree, NodeId segment)
{
    const auto leaf = tree.last_raw(segment);
    return tree.position(leaf == syntax::kInvalidNode ? segment : leaf).line;
}

}  // namespace

std::optional<NodeId> find_statement(const SyntaxTree& tree, NodeId root, NodeId segment)
{
    if (!tree.contains(segment)) {
        return std::nullopt;
    }
    for (const auto ancestor : tree.path_to(root, segment)) {
        if (tree.is_type(ancestor, SegmentKind::Statement)) {
            return ancestor;
        }
    }
    if (tree.is_type(segment, SegmentKind::Statement)) {
        return segment;
    }
    return std::nullopt;
}

bool is_one_line_statement(const SyntaxTree& tree, NodeId root, NodeId segment)
{
    const auto statement = find_statement(tree, root, segment);
    if (!statement) {
        return false;
    }
    return !tree.contains_kind(*statement, SegmentKind::Newline);
}

PlacementContext analyze_placement(const RuleContext& context, NodeId terminator)
{
    const auto& tree = context.tree();

    // Leaves between the terminator and the preceding code, nearest first.
    std::vector<NodeId> before_code;
    auto first_code = tree.previous_raw(terminator);
    while (first_code != syntax::kInvalidNode && !tree.is_code(first_code)) {
        before_code.push_back(first_code);
        first_code = tree.previous_raw(first_code);
    }
    const auto anchor = before_code.empty() ? terminator : before_code.back();
    auto preceding_trivia = Segments{tree, std::move(before_code)}.select(sp::not_(sp::is_meta()));

    context.debug("Semicolon: first_code: " + describe_segment(tree, first_code));

    const auto is_one_line =
        first_code != syntax::kInvalidNode && is_one_line_statement(tree, context.root(), first_code);

    SelectOptions whitespace_options{};
    whitespace_options.loop_while = sp::is_whitespace();
    auto whitespace_deletions = preceding_trivia.select(whitespace_options);

    return PlacementContext{anchor, is_one_line, std::move(preceding_trivia), std::move(whitespace_deletions)};
}

CommentAdjustment handle_preceding_inline_comments(const Segments& preceding_trivia, NodeId anchor)
{
    const auto& tree = preceding_trivia.tree();
    if (tree.last_raw(anchor) == syntax::kInvalidNode) {
        return CommentAdjustment{preceding_trivia, anchor};
    }
    const auto anchor_line = ending_line(tree, anchor);

    for (std::size_t index = 0; index < preceding_trivia.size(); ++index) {
        const auto candidate = preceding_trivia[index];
        if (tree.is_type(candidate, SegmentKind::InlineComment) && tree.position(candidate).line == anchor_line) {
            return CommentAdjustment{preceding_trivia.head(index), candidate};
        }
    }
    return CommentAdjustment{preceding_trivia, anchor};
}

NodeId handle_trailing_inline_comments(const SyntaxTree& tree, NodeId anchor, NodeId target)
{
    const auto anchor_line = ending_line(tree, anchor);
    const auto last_leaf = tree.last_raw(anchor);
    const auto start = last_leaf == syntax::kInvalidNode ? anchor : last_leaf;
    for (auto cursor = tree.next_raw(start); cursor != syntax::kInvalidNode; cursor = tree.next_raw(cursor)) {
        if (cursor == target || tree.is_meta(cursor)) {
            continue;
        }
        if (tree.is_type(cursor, SegmentKind::Newline) || tree.position(cursor).line != anchor_line) {
            break;
        }
        if (tree.is_type(cursor, SegmentKind::InlineComment)) {
            return cursor;
        }
        if (tree.is_code(cursor)) {
            break;
        }
    }
    return anchor;
}

}  // namespace terminus::rules
