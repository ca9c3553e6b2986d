#pragma once

#include "terminus/rules/rule.hpp"
#include "terminus/rules/terminator_placement.hpp"

#include <optional>
#include <vector>

namespace terminus::rules {

// CV06: statements must end with a single ";" placed directly after the
// statement, or on its own line after a multi-line statement when
// `multiline_newline` is set. `/` terminators are left to OR01.
class TerminatorRule final : public Rule {
public:
    explicit TerminatorRule(RuleOptions options = {}) noexcept;

    [[nodiscard]] std::string_view code() const noexcept override { return "CV06"; }
    [[nodiscard]] std::string_view name() const noexcept override { return "convention.terminator"; }
    [[nodiscard]] std::string_view description() const noexcept override
    {
        return "Statements must end with a semi-colon.";
    }

    [[nodiscard]] std::vector<LintResult> evaluate(const RuleContext& context) const override;

    [[nodiscard]] const RuleOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::optional<LintResult> handle_semicolon(const RuleContext& context, NodeId target) const;
    [[nodiscard]] std::optional<LintResult> handle_semicolon_same_line(const RuleContext& context,
                                                                       NodeId target,
                                                                       const PlacementContext& info) const;
    [[nodiscard]] std::optional<LintResult> handle_semicolon_newline(const RuleContext& context,
                                                                     NodeId target,
                                                                     const PlacementContext& info) const;
    [[nodiscard]] std::optional<LintResult> ensure_final_semicolon(const RuleContext& context) const;
    [[nodiscard]] std::optional<LintResult> handle_missing_semicolon(const RuleContext& context,
                                                                     NodeId statement) const;

    [[nodiscard]] LintResult make_result(NodeId anchor, std::vector<LintFix> fixes) const;

    RuleOptions options_{};
};

}  // namespace terminus::rules
