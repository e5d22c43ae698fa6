#include "ByteRangeTable.hpp"

#include <array>
#include <cctype>

namespace processing
{

namespace
{

// Reference: http://charset.7jp.net/sjis.html

constexpr std::array<ByteRange, 7> kSymbolsSafeRanges{ {
    { 0x8158, 0x8158 }, // 々
    { 0x815B, 0x815D }, // ー ― ‐
    { 0x824F, 0x8258 }, // ０-９
    { 0x8260, 0x8279 }, // Ａ-Ｚ
    { 0x8281, 0x829A }, // ａ-ｚ
    { 0x829F, 0x82F1 }, // hiragana
    { 0x8340, 0x8396 }, // katakana
} };

constexpr std::array<ByteRange, 16> kKanjiSafeRanges{ {
    { 0x8140, 0x81AC }, // full-width space, punctuation, brackets, math and unit marks
    { 0x81B8, 0x81BF }, // set operators
    { 0x81C8, 0x81CE }, // logical operators
    { 0x81DA, 0x81E8 }, // geometry operators
    { 0x81F0, 0x81F7 }, // Å ‰ ♯ ♭ ♪ † ‡ ¶
    { 0x81FC, 0x81FC }, // ◯
    { 0x824F, 0x8258 }, // ０-９
    { 0x8260, 0x8279 }, // Ａ-Ｚ
    { 0x8281, 0x829A }, // ａ-ｚ
    { 0x829F, 0x82F1 }, // hiragana
    { 0x8340, 0x8396 }, // katakana
    { 0x839F, 0x83B6 }, // Greek capitals
    { 0x83BF, 0x83D6 }, // Greek smalls
    { 0x8440, 0x8460 }, // Cyrillic capitals
    { 0x8470, 0x8491 }, // Cyrillic smalls
    { 0x849F, 0x84BE }, // box drawing
} };

constexpr std::array<ByteRange, 3> kKanjiRanges{ {
    { 0x889F, 0x9872 }, // JIS level 1
    { 0x989F, 0x9FFC }, // JIS level 2, first half
    { 0xE040, 0xEAA4 }, // JIS level 2, second half
} };

const RangeTableSet kSymbolsTables{ "symbols", ByteRangeTable(kSymbolsSafeRanges), ByteRangeTable(kKanjiRanges) };
const RangeTableSet kKanjiTables{ "kanji", ByteRangeTable(kKanjiSafeRanges), ByteRangeTable(kKanjiRanges) };

std::string formatBytePair(std::uint16_t value)
{
    return FormatBytePair(static_cast<std::uint8_t>(value >> 8), static_cast<std::uint8_t>(value & 0xFFu));
}

int compareIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    const std::size_t n = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        const int a = std::tolower(static_cast<unsigned char>(lhs[i]));
        const int b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b)
            return a - b;
    }
    return static_cast<int>(lhs.size()) - static_cast<int>(rhs.size());
}

} // namespace

bool ByteRangeTable::contains(std::uint16_t byte_pair) const noexcept
{
    for (const auto& range : ranges_)
    {
        if (byte_pair >= range.low && byte_pair <= range.high)
            return true;
    }
    return false;
}

bool ByteRangeTable::containsLegacy(std::string_view hex_pair) const
{
    for (const auto& range : ranges_)
    {
        if (compareIgnoreCase(hex_pair, formatBytePair(range.low)) >= 0 &&
            compareIgnoreCase(hex_pair, formatBytePair(range.high)) <= 0)
            return true;
    }
    return false;
}

std::string FormatBytePair(std::uint8_t lead, std::uint8_t trail)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(4, '0');
    out[0] = kDigits[lead >> 4];
    out[1] = kDigits[lead & 0x0F];
    out[2] = kDigits[trail >> 4];
    out[3] = kDigits[trail & 0x0F];
    return out;
}

const RangeTableSet& SymbolsRangeTables() noexcept { return kSymbolsTables; }

const RangeTableSet& KanjiRangeTables() noexcept { return kKanjiTables; }

} // namespace processing
