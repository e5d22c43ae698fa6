#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Closed interval over Shift_JIS double-byte values (lead << 8 | trail).
 */
struct ByteRange
{
    std::uint16_t low;
    std::uint16_t high;
};

/**
 * @brief Ordered list of permitted double-byte ranges.
 *
 * The tables are static data; a ByteRangeTable is a cheap view over them.
 */
class ByteRangeTable
{
public:
    constexpr explicit ByteRangeTable(std::span<const ByteRange> ranges) noexcept
        : ranges_(ranges)
    {
    }

    [[nodiscard]] bool contains(std::uint16_t byte_pair) const noexcept;

    /**
     * @brief Membership test using the historical comparison of 4-digit hex strings.
     *
     * Each bound is formatted like FormatBytePair() and compared case-insensitively
     * as text. Kept to check that the numeric test above accepts exactly the same set.
     */
    [[nodiscard]] bool containsLegacy(std::string_view hex_pair) const;

    [[nodiscard]] std::span<const ByteRange> ranges() const noexcept { return ranges_; }

private:
    std::span<const ByteRange> ranges_;
};

/**
 * @brief The safe/kanji table pair used by one classifier entry point.
 *
 * A double-byte character is accepted when it falls in either table.
 */
struct RangeTableSet
{
    const char* name;
    ByteRangeTable safe;
    ByteRangeTable kanji;
};

[[nodiscard]] constexpr std::uint16_t MakeBytePair(std::uint8_t lead, std::uint8_t trail) noexcept
{
    return static_cast<std::uint16_t>((lead << 8) | trail);
}

/// "8140"-style lowercase hex rendering of a double-byte value
[[nodiscard]] std::string FormatBytePair(std::uint8_t lead, std::uint8_t trail);

/// Kana, full-width digits and letters, 々 and the long-vowel/dash marks
[[nodiscard]] const RangeTableSet& SymbolsRangeTables() noexcept;

/// Same as SymbolsRangeTables() plus the full-width punctuation, Greek, Cyrillic and box-drawing rows
[[nodiscard]] const RangeTableSet& KanjiRangeTables() noexcept;

} // namespace processing
