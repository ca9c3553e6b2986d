#pragma once

#include "terminus/syntax/syntax_diagnostic.hpp"
#include "terminus/syntax/syntax_tree.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace terminus::syntax {

struct RawToken final {
    SegmentKind kind = SegmentKind::Other;
    std::string text{};
    PositionMarker position{};
};

struct LexResult final {
    std::vector<RawToken> tokens{};
    std::vector<SyntaxDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return diagnostics.empty(); }
};

[[nodiscard]] LexResult lex_sql(std::string_view input);

[[nodiscard]] bool is_sql_keyword(std::string_view word) noexcept;

// Position just past the last character of the token.
[[nodiscard]] PositionMarker end_position(const RawToken& token) noexcept;

}  // namespace terminus::syntax
