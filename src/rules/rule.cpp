#include "terminus/rules/rule.hpp"

#include "terminus/rules/slash_terminator_rule.hpp"
#include "terminus/rules/terminator_rule.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace terminus::rules {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
              });
}

}  // namespace

RuleContext::RuleContext(const syntax::SyntaxTree& tree, syntax::Dialect dialect, DebugLogger logger) noexcept
    : tree_{&tree}
    , dialect_{dialect}
    , logger_{std::move(logger)}
{
}

void RuleContext::debug(std::string_view message) const
{
    if (logger_) {
        logger_(message);
    }
}

void RuleRegistry::register_rule(RulePtr rule)
{
    if (!rule) {
        throw std::invalid_argument{"RuleRegistry::register_rule requires a rule"};
    }
    if (find(rule->code()) || find(rule->name())) {
        throw std::invalid_argument{"rule already registered: " + std::string{rule->code()}};
    }
    rules_.push_back(std::move(rule));
}

const std::vector<RulePtr>& RuleRegistry::rules() const noexcept
{
    return rules_;
}

RulePtr RuleRegistry::find(std::string_view code_or_name) const
{
    for (const auto& rule : rules_) {
        if (iequals(rule->code(), code_or_name) || rule->name() == code_or_name) {
            return rule;
        }
    }
    return nullptr;
}

RuleRegistry make_default_registry(const RuleOptions& options)
{
    RuleRegistry registry{};
    registry.register_rule(std::make_shared<TerminatorRule>(options));
    registry.register_rule(std::make_shared<SlashTerminatorRule>());
    return registry;
}

std::string describe_segment(const syntax::SyntaxTree& tree, NodeId id)
{
    if (!tree.contains(id)) {
        return "<none>";
    }
    const auto position = tree.position(id);
    std::string text{syntax::segment_kind_name(tree.kind(id))};
    text += " '";
    for (const char ch : tree.raw(id)) {
        if (ch == '\n') {
            text += "\\n";
        } else {
            text.push_back(ch);
        }
    }
    text += "' @" + std::to_string(position.line) + ':' + std::to_string(position.column);
    return text;
}

NodeId choose_anchor_segment(const syntax::SyntaxTree& tree,
                             NodeId root,
                             EditType edit_type,
                             NodeId node,
                             bool filter_meta)
{
    if (edit_type != EditType::CreateBefore && edit_type != EditType::CreateAfter) {
        return node;
    }

    auto anchor = node;
    auto child = node;
    const auto path = tree.path_to(root, node);
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        const auto segment = *it;
        if (tree.can_start_end_non_code(segment)) {
            break;
        }

        const auto children = tree.children(segment);
        std::vector<std::vector<NodeId>> children_lists;
        if (filter_meta) {
            std::vector<NodeId> non_meta;
            std::copy_if(children.begin(), children.end(), std::back_inserter(non_meta), [&tree](NodeId id) {
                return !tree.is_meta(id);
            });
            children_lists.push_back(std::move(non_meta));
        }
        children_lists.emplace_back(children.begin(), children.end());

        for (const auto& candidates : children_lists) {
            if (candidates.empty()) {
                continue;
            }
            const auto edge = edit_type == EditType::CreateBefore ? candidates.front() : candidates.back();
            if (edge == child) {
                anchor = segment;
                child = segment;
                break;
            }
        }
    }
    return anchor;
}

}  // namespace terminus::rules
