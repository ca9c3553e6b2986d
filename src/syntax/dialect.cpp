#include "terminus/syntax/dialect.hpp"

#include <cctype>

namespace terminus::syntax {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<Dialect> parse_dialect(std::string_view name) noexcept
{
    if (iequals(name, "ansi")) {
        return Dialect::Ansi;
    }
    if (iequals(name, "oracle")) {
        return Dialect::Oracle;
    }
    return std::nullopt;
}

std::string_view dialect_name(Dialect dialect) noexcept
{
    switch (dialect) {
    case Dialect::Oracle:
        return "oracle";
    case Dialect::Ansi:
    default:
        return "ansi";
    }
}

}  // namespace terminus::syntax
