#include "terminus/rules/terminator_edits.hpp"

#include "terminus/rules/rule.hpp"

#include <utility>

namespace terminus::rules {

using syntax::SegmentKind;
using syntax::SyntaxTree;

namespace {

bool is_semicolon_terminator(const SyntaxTree& tree, NodeId id)
{
    return tree.is_type(id, SegmentKind::StatementTerminator) && tree.raw(id) == ";";
}

}  // namespace

std::vector<LintFix> create_and_delete(const SyntaxTree& tree,
                                       NodeId root,
                                       NodeId target,
                                       NodeId anchor,
                                       const syntax::Segments& whitespace_deletions,
                                       std::vector<NewSegment> create)
{
    const auto resolved = choose_anchor_segment(tree, root, EditType::CreateAfter, anchor, true);

    std::vector<LintFix> fixes;
    auto deletions = whitespace_deletions;
    if (deletions.contains(resolved)) {
        fixes.push_back(LintFix::replace(resolved, std::move(create)));
        deletions = deletions.without(resolved);
    } else {
        fixes.push_back(LintFix::create_after(resolved, std::move(create)));
    }

    fixes.push_back(LintFix::remove(target));
    for (const auto id : deletions) {
        fixes.push_back(LintFix::remove(id));
    }
    return fixes;
}

std::optional<RepeatedTerminators> collapse_repeated_terminators(const SyntaxTree& tree, NodeId terminator)
{
    const auto parent = tree.parent(terminator);
    if (parent == syntax::kInvalidNode) {
        return std::nullopt;
    }
    const auto index = tree.index_in_parent(terminator);
    if (!index) {
        return std::nullopt;
    }

    const auto siblings = tree.children(parent);
    std::vector<NodeId> terminators{terminator};
    auto cursor = *index + 1U;
    while (cursor < siblings.size()) {
        const auto current = siblings[cursor];
        if (is_semicolon_terminator(tree, current)) {
            terminators.push_back(current);
            ++cursor;
            continue;
        }
        if (!tree.is_type(current, SegmentKind::Whitespace)) {
            break;
        }

        auto next = cursor + 1U;
        while (next < siblings.size() && tree.is_type(siblings[next], SegmentKind::Whitespace)) {
            ++next;
        }
        if (next < siblings.size() && is_semicolon_terminator(tree, siblings[next])) {
            ++cursor;
        } else {
            break;
        }
    }

    if (terminators.size() < 2U) {
        return std::nullopt;
    }

    RepeatedTerminators repeated{};
    repeated.result.anchor = terminator;
    repeated.collapsed.assign(terminators.begin() + 1, terminators.end());
    for (const auto extra : repeated.collapsed) {
        repeated.result.fixes.push_back(LintFix::remove(extra));
    }
    for (auto position = *index + 1U; position < cursor; ++position) {
        const auto id = siblings[position];
        if (tree.is_type(id, SegmentKind::Whitespace)) {
            repeated.result.fixes.push_back(LintFix::remove(id));
        }
    }
    return repeated;
}

}  // namespace terminus::rules
