#pragma once

#include "ByteRangeTable.hpp"
#include "IByteOracle.hpp"
#include "StrictnessMode.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace processing
{

/**
 * @brief Outcome of the per-character decision tree.
 */
enum class CharacterVerdict
{
    AllowedBarOrDot, // bypassed the tables under AllowBarsAndDots
    AllowedSymbol,   // bypassed the tables under AllowAll
    Unencodable,     // encoder substituted '?'; rejected, scan continues
    HalfWidth,       // single-byte ASCII or half-width katakana lead byte
    SingleByte,      // any other single-byte sequence
    SafeRange,       // double-byte, inside the safe table
    KanjiRange,      // double-byte, inside the kanji table
    OutOfRange       // double-byte, in neither table; rejected, scan stops
};

[[nodiscard]] const char* ToString(CharacterVerdict verdict) noexcept;

[[nodiscard]] constexpr bool IsRejected(CharacterVerdict verdict) noexcept
{
    return verdict == CharacterVerdict::Unencodable || verdict == CharacterVerdict::OutOfRange;
}

/**
 * @brief One classification decision, handed to the trace observer.
 */
struct ClassificationTrace
{
    std::size_t position;     // codepoint index within the input
    char32_t codepoint;
    std::string character;    // UTF-8 rendering of the codepoint
    std::string bytes;        // hex rendering of the encoded bytes ("8140", "41")
    CharacterVerdict verdict;
};

using TraceObserver = std::function<void(const ClassificationTrace&)>;

/**
 * @brief Decides whether a string holds characters that cannot be stored as Shift_JIS
 *        within the approved byte ranges.
 *
 * One classifier serves both historical entry points; they differ only in the
 * RangeTableSet passed in (SymbolsRangeTables() or KanjiRangeTables()).
 *
 * Per character, in order:
 *   1. encode through the oracle (must yield 1 or 2 bytes, else EncodingError)
 *   2. AllowBarsAndDots: bars and middle dots pass
 *   3. AllowAll: bars, middle dots and U+FF5E pass
 *   4. lead byte 0x3F for anything but '?' -> unencodable, remember and keep scanning
 *   5. lead byte 0x00-0x7E or 0xA1-0xDE passes
 *   6. any other single byte passes
 *   7. double byte: pass when in the safe or kanji table, otherwise reject and stop
 *
 * The classifier holds no mutable state and is safe to share between threads
 * as long as the oracle and observer are.
 */
class EncodingClassifier
{
public:
    EncodingClassifier(const IByteOracle& oracle, const RangeTableSet& tables, TraceObserver observer = {});

    /**
     * @brief Returns true when at least one character must be rejected.
     *
     * @param text UTF-8 input
     * @param mode which permitted punctuation bypasses the tables
     * @throws EncodingError on malformed UTF-8 or when the oracle cannot encode a character
     */
    [[nodiscard]] bool isForbidden(std::string_view text, StrictnessMode mode) const;

    [[nodiscard]] CharacterVerdict classifyCharacter(char32_t codepoint, const EncodedChar& encoded,
                                                     StrictnessMode mode) const noexcept;

    [[nodiscard]] const RangeTableSet& tables() const noexcept { return tables_; }

private:
    void emitTrace(const ClassificationTrace& trace) const;

    const IByteOracle& oracle_;
    const RangeTableSet& tables_;
    TraceObserver observer_;
};

[[nodiscard]] const RangeTableSet& RangeTablesFor(TableVariant variant) noexcept;

// Entry points over DefaultShiftJisOracle()
[[nodiscard]] bool IsSymbolsForbidden(std::string_view text, StrictnessMode mode);
[[nodiscard]] bool IsKanjiForbidden(std::string_view text, StrictnessMode mode);
[[nodiscard]] bool Classify(std::string_view text, StrictnessMode mode, TableVariant variant);

[[nodiscard]] bool Classify(std::string_view text, StrictnessMode mode, TableVariant variant,
                            const IByteOracle& oracle);

} // namespace processing
