#pragma once

#include "terminus/syntax/dialect.hpp"
#include "terminus/syntax/lexer.hpp"
#include "terminus/syntax/syntax_diagnostic.hpp"
#include "terminus/syntax/syntax_tree.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace terminus::syntax {

struct ParseResult final {
    std::optional<SyntaxTree> tree{};
    std::vector<SyntaxDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return tree.has_value(); }
};

[[nodiscard]] ParseResult parse_sql(std::string_view input, Dialect dialect = Dialect::Ansi);

[[nodiscard]] SyntaxTree build_tree(const std::vector<RawToken>& tokens,
                                    Dialect dialect,
                                    std::vector<SyntaxDiagnostic>& diagnostics);

}  // namespace terminus::syntax
