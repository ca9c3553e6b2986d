#include "terminus/rules/slash_terminator_rule.hpp"

#include <string>
#include <utility>

namespace terminus::rules {

using syntax::SegmentKind;

namespace {

std::string_view strip(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1U);
}

}  // namespace

std::vector<LintResult> SlashTerminatorRule::evaluate(const RuleContext& context) const
{
    std::vector<LintResult> results;
    if (context.dialect() != syntax::Dialect::Oracle) {
        return results;
    }

    for (const auto terminator : context.tree().recursive_crawl(context.root(), SegmentKind::StatementTerminator)) {
        if (auto result = check_terminator(context, terminator)) {
            results.push_back(std::move(*result));
        }
    }
    return results;
}

std::optional<LintResult> SlashTerminatorRule::check_terminator(const RuleContext& context, NodeId terminator) const
{
    const auto& tree = context.tree();
    const auto raw = tree.raw(terminator);
    if (strip(raw) != "/") {
        return std::nullopt;
    }
    if (tree.position(terminator).offset == 0U) {
        return std::nullopt;
    }

    const auto parent = tree.parent(terminator);
    if (parent == syntax::kInvalidNode) {
        return std::nullopt;
    }
    const auto index = tree.index_in_parent(terminator);
    if (!index || *index == 0U) {
        return std::nullopt;
    }

    const auto previous = tree.children(parent)[*index - 1U];
    const auto on_new_line = tree.is_type(previous, SegmentKind::Newline)
                             || (tree.is_type(previous, SegmentKind::Whitespace)
                                 && tree.raw(previous).find('\n') != std::string::npos);
    if (on_new_line) {
        return std::nullopt;
    }

    context.debug("Slash terminator not on its own line: " + describe_segment(tree, terminator));
    return LintResult{terminator,
                      std::string{description()},
                      {LintFix::create_before(terminator, {NewSegment::newline()})}};
}

}  // namespace terminus::rules
