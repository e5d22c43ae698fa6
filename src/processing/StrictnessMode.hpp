#pragma once

#include <optional>
#include <string_view>

namespace processing
{

/**
 * @brief Controls which permitted punctuation bypasses the byte-range tables.
 *
 * Values match the legacy integer check-type flags (0, 1, 2).
 */
enum class StrictnessMode
{
    NoExtraAllowances = 0, // bars, dots and tilde go through the tables like anything else
    AllowBarsAndDots = 1,  // dashes/bars and middle dots always pass
    AllowAll = 2           // bars, dots and the full-width tilde always pass
};

/**
 * @brief Which pair of byte-range tables a classification uses.
 */
enum class TableVariant
{
    Symbols, // narrow safe table (kana, full-width alphanumerics, a few marks)
    Kanji    // broad safe table that also accepts the full-width symbol blocks
};

// Throws std::invalid_argument for anything other than 0, 1 or 2.
[[nodiscard]] StrictnessMode StrictnessModeFromLegacy(int check_type);

[[nodiscard]] std::optional<TableVariant> ParseTableVariant(std::string_view name);

[[nodiscard]] const char* ToString(StrictnessMode mode) noexcept;
[[nodiscard]] const char* ToString(TableVariant variant) noexcept;

} // namespace processing
