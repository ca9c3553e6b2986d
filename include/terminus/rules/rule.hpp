#pragma once

#include "terminus/rules/lint_fix.hpp"
#include "terminus/syntax/dialect.hpp"
#include "terminus/syntax/syntax_tree.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace terminus::rules {

using DebugLogger = std::function<void(std::string_view)>;

struct RuleOptions final {
    bool multiline_newline = false;
    bool require_final_semicolon = false;
};

class RuleContext final {
public:
    RuleContext(const syntax::SyntaxTree& tree, syntax::Dialect dialect, DebugLogger logger = {}) noexcept;

    [[nodiscard]] const syntax::SyntaxTree& tree() const noexcept { return *tree_; }
    [[nodiscard]] NodeId root() const noexcept { return tree_->root(); }
    [[nodiscard]] syntax::Dialect dialect() const noexcept { return dialect_; }

    void debug(std::string_view message) const;

private:
    const syntax::SyntaxTree* tree_;
    syntax::Dialect dialect_ = syntax::Dialect::Ansi;
    DebugLogger logger_{};
};

class Rule {
public:
    virtual ~Rule() = default;

    [[nodiscard]] virtual std::string_view code() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::string_view description() const noexcept = 0;

    // Evaluates the whole file once. An empty vector means nothing to report.
    [[nodiscard]] virtual std::vector<LintResult> evaluate(const RuleContext& context) const = 0;
};

using RulePtr = std::shared_ptr<const Rule>;

class RuleRegistry final {
public:
    // Throws std::invalid_argument when the code or name is already registered.
    void register_rule(RulePtr rule);

    [[nodiscard]] const std::vector<RulePtr>& rules() const noexcept;

    // Matches a rule code (case-insensitive) or a rule name.
    [[nodiscard]] RulePtr find(std::string_view code_or_name) const;

private:
    std::vector<RulePtr> rules_{};
};

[[nodiscard]] RuleRegistry make_default_registry(const RuleOptions& options);

// "kind 'raw' @line:column", for debug output.
[[nodiscard]] std::string describe_segment(const syntax::SyntaxTree& tree, NodeId id);

// Hoists a create-before/create-after anchor to the outermost ancestor the
// edit would attach to anyway, so the new segments do not land inside a
// container that must not start or end with them. Other edit types return
// `node` unchanged.
[[nodiscard]] NodeId choose_anchor_segment(const syntax::SyntaxTree& tree,
                                           NodeId root,
                                           EditType edit_type,
                                           NodeId node,
                                           bool filter_meta = false);

}  // namespace terminus::rules
