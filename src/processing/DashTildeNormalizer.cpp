#include "DashTildeNormalizer.hpp"
#include "PermittedSymbols.hpp"
#include "TextUtils.hpp"

namespace processing
{

std::string NormalizeDashesAndTildes(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 2);

    std::size_t index = 0;
    while (index < text.size())
    {
        const std::size_t start = index;
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            out.append(text.substr(start, index - start));
            continue;
        }

        if (IsDeniedDash(codepoint))
        {
            out += codepointToUtf8(CANONICAL_DASH);
        }
        else if (IsDeniedTilde(codepoint))
        {
            out += codepointToUtf8(FULLWIDTH_TILDE);
        }
        else
        {
            out.append(text.substr(start, index - start));
        }
    }

    return out;
}

std::optional<std::string> NormalizeDashesAndTildesNullable(const std::optional<std::string>& text)
{
    if (!text)
        return std::nullopt;
    return NormalizeDashesAndTildes(*text);
}

} // namespace processing
