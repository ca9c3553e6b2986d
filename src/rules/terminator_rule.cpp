#include "terminus/rules/terminator_rule.hpp"

#include "terminus/rules/terminator_edits.hpp"

#include <algorithm>
#include <utility>

namespace terminus::rules {

using syntax::Segments;
using syntax::SegmentKind;

TerminatorRule::TerminatorRule(RuleOptions options) noexcept
    : options_{options}
{
}

std::vector<LintResult> TerminatorRule::evaluate(const RuleContext& context) const
{
    const auto& tree = context.tree();
    std::vector<LintResult> results;
    if (!tree.is_type(context.root(), SegmentKind::File)) {
        return results;
    }

    const auto children = tree.children(context.root());
    std::vector<NodeId> pending_statements;
    // Children before this index were collapsed into an earlier terminator.
    std::size_t resume_at = 0U;

    for (std::size_t index = 0; index < children.size(); ++index) {
        if (index < resume_at) {
            continue;
        }
        const auto segment = children[index];

        std::optional<LintResult> result;
        if (tree.is_type(segment, SegmentKind::Statement)) {
            pending_statements.push_back(segment);
        }

        if (tree.is_type(segment, SegmentKind::StatementTerminator)) {
            context.debug("Handling terminator: " + describe_segment(tree, segment));
            if (tree.raw(segment) == ";") {
                if (auto repeated = collapse_repeated_terminators(tree, segment)) {
                    repeated->result.description = std::string{description()};
                    result = std::move(repeated->result);
                    resume_at = tree.node(repeated->collapsed.back()).sibling_index + 1U;
                } else {
                    result = handle_semicolon(context, segment);
                }
            }
            if (!pending_statements.empty()) {
                pending_statements.pop_back();
            }
        } else if (options_.require_final_semicolon && index + 1U == children.size()) {
            context.debug("Handling final segment: " + describe_segment(tree, segment));
            result = ensure_final_semicolon(context);
        }

        if (result) {
            results.push_back(std::move(*result));
        }
    }

    if (options_.require_final_semicolon) {
        const auto last_statement = std::find_if(children.rbegin(), children.rend(), [&tree](NodeId id) {
            return tree.is_type(id, SegmentKind::Statement);
        });
        for (const auto statement : pending_statements) {
            if (last_statement != children.rend() && statement == *last_statement) {
                continue;
            }
            if (auto result = handle_missing_semicolon(context, statement)) {
                results.push_back(std::move(*result));
            }
        }
    }

    return results;
}

std::optional<LintResult> TerminatorRule::handle_semicolon(const RuleContext& context, NodeId target) const
{
    const auto info = analyze_placement(context, target);
    const auto semicolon_newline = options_.multiline_newline && !info.is_one_line;
    context.debug(semicolon_newline ? "Semicolon Newline: true" : "Semicolon Newline: false");

    if (!semicolon_newline) {
        return handle_semicolon_same_line(context, target, info);
    }
    return handle_semicolon_newline(context, target, info);
}

std::optional<LintResult> TerminatorRule::handle_semicolon_same_line(const RuleContext& context,
                                                                     NodeId target,
                                                                     const PlacementContext& info) const
{
    if (info.preceding_trivia.empty()) {
        return std::nullopt;
    }

    auto fixes = create_and_delete(context.tree(),
                                   context.root(),
                                   target,
                                   info.anchor,
                                   info.whitespace_deletions,
                                   {NewSegment::terminator()});
    return make_result(info.anchor, std::move(fixes));
}

std::optional<LintResult> TerminatorRule::handle_semicolon_newline(const RuleContext& context,
                                                                   NodeId target,
                                                                   const PlacementContext& info) const
{
    const auto& tree = context.tree();
    const auto adjusted = handle_preceding_inline_comments(info.preceding_trivia, info.anchor);

    if (adjusted.preceding_trivia.size() == 1U
        && tree.is_type(adjusted.preceding_trivia.front(), SegmentKind::Newline)) {
        return std::nullopt;
    }

    const auto anchor = handle_trailing_inline_comments(tree, adjusted.anchor, target);
    std::vector<LintFix> fixes;
    if (anchor == target) {
        fixes.push_back(LintFix::replace(anchor, {NewSegment::newline(), NewSegment::terminator()}));
    } else {
        fixes = create_and_delete(tree,
                                  context.root(),
                                  target,
                                  anchor,
                                  info.whitespace_deletions,
                                  {NewSegment::newline(), NewSegment::terminator()});
    }
    return make_result(anchor, std::move(fixes));
}

std::optional<LintResult> TerminatorRule::ensure_final_semicolon(const RuleContext& context) const
{
    const auto& tree = context.tree();
    const auto children = tree.children(context.root());

    const auto last_code = std::find_if(children.rbegin(), children.rend(), [&tree](NodeId id) {
        return tree.is_code(id);
    });
    if (last_code == children.rend()) {
        return std::nullopt;
    }

    const auto terminator_exists = std::any_of(children.begin(), children.end(), [&tree](NodeId id) {
        return tree.is_type(id, SegmentKind::StatementTerminator);
    });
    const auto single_line = is_one_line_statement(tree, context.root(), *last_code);

    std::vector<NodeId> non_meta_before_code;
    auto anchor = children.back();
    auto trigger = children.back();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        anchor = *it;
        if (tree.is_code(*it)) {
            break;
        }
        if (!tree.is_meta(*it)) {
            non_meta_before_code.push_back(*it);
        }
        trigger = *it;
    }

    context.debug("Trigger on: " + describe_segment(tree, trigger));
    context.debug("Anchoring on: " + describe_segment(tree, anchor));

    if (terminator_exists) {
        return std::nullopt;
    }

    std::vector<LintFix> fixes;
    if (!options_.multiline_newline || single_line) {
        fixes.push_back(LintFix::create_after(
            choose_anchor_segment(tree, context.root(), EditType::CreateAfter, anchor, true),
            {NewSegment::terminator()}));
    } else {
        const auto adjusted =
            handle_preceding_inline_comments(Segments{tree, std::move(non_meta_before_code)}, anchor);
        context.debug("Revised anchor on: " + describe_segment(tree, adjusted.anchor));
        fixes.push_back(LintFix::create_after(
            choose_anchor_segment(tree, context.root(), EditType::CreateAfter, adjusted.anchor, true),
            {NewSegment::newline(), NewSegment::terminator()}));
    }
    return make_result(trigger, std::move(fixes));
}

std::optional<LintResult> TerminatorRule::handle_missing_semicolon(const RuleContext& context, NodeId statement) const
{
    const auto& tree = context.tree();
    const auto children = tree.children(statement);
    const auto last_non_meta = std::find_if(children.rbegin(), children.rend(), [&tree](NodeId id) {
        return !tree.is_meta(id);
    });
    if (last_non_meta == children.rend()) {
        return std::nullopt;
    }

    const auto single_line = is_one_line_statement(tree, context.root(), statement);

    // A terminator placed on the same line must stay ahead of any trailing
    // comment, so only the newline form is anchored after the comment.
    auto anchor = *last_non_meta;
    std::vector<NewSegment> segments;
    if (options_.multiline_newline && !single_line) {
        anchor = handle_trailing_inline_comments(tree, anchor);
        segments.push_back(NewSegment::newline());
    }
    segments.push_back(NewSegment::terminator());

    const auto resolved = choose_anchor_segment(tree, context.root(), EditType::CreateAfter, anchor, true);
    return make_result(*last_non_meta, {LintFix::create_after(resolved, std::move(segments))});
}

LintResult TerminatorRule::make_result(NodeId anchor, std::vector<LintFix> fixes) const
{
    return LintResult{anchor, std::string{description()}, std::move(fixes)};
}

}  // namespace terminus::rules
