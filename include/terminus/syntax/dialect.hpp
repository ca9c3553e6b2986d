#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace terminus::syntax {

enum class Dialect : std::uint8_t {
    Ansi = 0,
    Oracle
};

[[nodiscard]] std::optional<Dialect> parse_dialect(std::string_view name) noexcept;
[[nodiscard]] std::string_view dialect_name(Dialect dialect) noexcept;

}  // namespace terminus::syntax
