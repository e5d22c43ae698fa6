#include "EncodingClassifier.hpp"
#include "Diagnostics.hpp"
#include "EncodingError.hpp"
#include "IcuShiftJisOracle.hpp"
#include "PermittedSymbols.hpp"
#include "TextUtils.hpp"

#include <utility>

#include <plog/Log.h>

namespace processing
{

namespace
{

std::string formatBytes(const EncodedChar& encoded)
{
    if (encoded.length == 2)
        return FormatBytePair(encoded.lead(), encoded.trail());

    std::string pair = FormatBytePair(0, encoded.lead());
    return pair.substr(2);
}

bool isHalfWidthLead(std::uint8_t lead)
{
    return lead <= 0x7Eu || (lead >= 0xA1u && lead <= 0xDEu);
}

} // namespace

const char* ToString(CharacterVerdict verdict) noexcept
{
    switch (verdict)
    {
    case CharacterVerdict::AllowedBarOrDot:
        return "allow_bars_and_dots";
    case CharacterVerdict::AllowedSymbol:
        return "allow_all";
    case CharacterVerdict::Unencodable:
        return "unencodable";
    case CharacterVerdict::HalfWidth:
        return "half_width";
    case CharacterVerdict::SingleByte:
        return "single_byte";
    case CharacterVerdict::SafeRange:
        return "safe_range";
    case CharacterVerdict::KanjiRange:
        return "kanji_range";
    case CharacterVerdict::OutOfRange:
        return "forbidden";
    default:
        return "unknown";
    }
}

EncodingClassifier::EncodingClassifier(const IByteOracle& oracle, const RangeTableSet& tables,
                                       TraceObserver observer)
    : oracle_(oracle)
    , tables_(tables)
    , observer_(std::move(observer))
{
}

bool EncodingClassifier::isForbidden(std::string_view text, StrictnessMode mode) const
{
    bool forbidden = false;
    std::size_t index = 0;
    std::size_t position = 0;

    while (index < text.size())
    {
        const std::size_t offset = index;
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            PLOG_WARNING << "[EncodingClassifier] malformed UTF-8 at byte " << offset << " input="
                         << Diagnostics::Preview(text);
            throw EncodingError("malformed UTF-8 at byte offset " + std::to_string(offset), U'\uFFFD');
        }

        const EncodedChar encoded = oracle_.encode(codepoint);
        if (encoded.length != 1 && encoded.length != 2)
        {
            throw EncodingError("unexpected " + std::to_string(encoded.length) + "-byte sequence for " +
                                    Diagnostics::DescribeCodepoint(codepoint),
                                codepoint);
        }

        const CharacterVerdict verdict = classifyCharacter(codepoint, encoded, mode);
        emitTrace(ClassificationTrace{ position, codepoint, std::string(text.substr(offset, index - offset)),
                                       formatBytes(encoded), verdict });

        if (verdict == CharacterVerdict::Unencodable)
        {
            forbidden = true;
        }
        else if (verdict == CharacterVerdict::OutOfRange)
        {
            forbidden = true;
            break;
        }
        ++position;
    }

    return forbidden;
}

CharacterVerdict EncodingClassifier::classifyCharacter(char32_t codepoint, const EncodedChar& encoded,
                                                       StrictnessMode mode) const noexcept
{
    if (mode == StrictnessMode::AllowBarsAndDots && IsPermittedBarOrDot(codepoint))
        return CharacterVerdict::AllowedBarOrDot;

    if (mode == StrictnessMode::AllowAll && IsPermittedSymbol(codepoint))
        return CharacterVerdict::AllowedSymbol;

    const std::uint8_t lead = encoded.lead();
    if (lead == FALLBACK_MARKER && codepoint != U'?')
        return CharacterVerdict::Unencodable;

    if (isHalfWidthLead(lead))
        return CharacterVerdict::HalfWidth;

    if (encoded.length == 1)
        return CharacterVerdict::SingleByte;

    const std::uint16_t pair = MakeBytePair(lead, encoded.trail());
    if (tables_.safe.contains(pair))
        return CharacterVerdict::SafeRange;
    if (tables_.kanji.contains(pair))
        return CharacterVerdict::KanjiRange;
    return CharacterVerdict::OutOfRange;
}

void EncodingClassifier::emitTrace(const ClassificationTrace& trace) const
{
    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[EncodingClassifier] table=" << tables_.name << " pos=" << trace.position << " char=["
            << trace.character << "] " << Diagnostics::DescribeCodepoint(trace.codepoint) << " bytes=" << trace.bytes
            << " verdict=" << ToString(trace.verdict);
    }

    if (observer_)
        observer_(trace);
}

const RangeTableSet& RangeTablesFor(TableVariant variant) noexcept
{
    return variant == TableVariant::Symbols ? SymbolsRangeTables() : KanjiRangeTables();
}

bool IsSymbolsForbidden(std::string_view text, StrictnessMode mode)
{
    return Classify(text, mode, TableVariant::Symbols);
}

bool IsKanjiForbidden(std::string_view text, StrictnessMode mode)
{
    return Classify(text, mode, TableVariant::Kanji);
}

bool Classify(std::string_view text, StrictnessMode mode, TableVariant variant)
{
    return Classify(text, mode, variant, DefaultShiftJisOracle());
}

bool Classify(std::string_view text, StrictnessMode mode, TableVariant variant, const IByteOracle& oracle)
{
    EncodingClassifier classifier(oracle, RangeTablesFor(variant));
    return classifier.isForbidden(text, mode);
}

} // namespace processing
