#pragma once

#include "terminus/rules/rule.hpp"

#include <optional>
#include <vector>

namespace terminus::rules {

// OR01: an Oracle "/" terminator must start its own line.
class SlashTerminatorRule final : public Rule {
public:
    [[nodiscard]] std::string_view code() const noexcept override { return "OR01"; }
    [[nodiscard]] std::string_view name() const noexcept override { return "oracle.slash_terminator"; }
    [[nodiscard]] std::string_view description() const noexcept override
    {
        return "Slash terminator should be on a new line.";
    }

    [[nodiscard]] std::vector<LintResult> evaluate(const RuleContext& context) const override;

private:
    [[nodiscard]] std::optional<LintResult> check_terminator(const RuleContext& context, NodeId terminator) const;
};

}  // namespace terminus::rules
