#include "StrictnessMode.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace processing
{

StrictnessMode StrictnessModeFromLegacy(int check_type)
{
    switch (check_type)
    {
    case 0:
        return StrictnessMode::NoExtraAllowances;
    case 1:
        return StrictnessMode::AllowBarsAndDots;
    case 2:
        return StrictnessMode::AllowAll;
    default:
        throw std::invalid_argument("invalid strictness mode: " + std::to_string(check_type));
    }
}

std::optional<TableVariant> ParseTableVariant(std::string_view name)
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "symbols")
        return TableVariant::Symbols;
    if (lowered == "kanji")
        return TableVariant::Kanji;
    return std::nullopt;
}

const char* ToString(StrictnessMode mode) noexcept
{
    switch (mode)
    {
    case StrictnessMode::NoExtraAllowances:
        return "NoExtraAllowances";
    case StrictnessMode::AllowBarsAndDots:
        return "AllowBarsAndDots";
    case StrictnessMode::AllowAll:
        return "AllowAll";
    default:
        return "Unknown";
    }
}

const char* ToString(TableVariant variant) noexcept
{
    switch (variant)
    {
    case TableVariant::Symbols:
        return "symbols";
    case TableVariant::Kanji:
        return "kanji";
    default:
        return "unknown";
    }
}

} // namespace processing
