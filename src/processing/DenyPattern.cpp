#include "DenyPattern.hpp"
#include "TextUtils.hpp"

#include <cstddef>

namespace processing
{

bool IsForbiddenSymbol(char32_t cp) noexcept
{
    switch (cp)
    {
    case U'<':
    case U'>':
    case U'"':
    case U'&':
    case U',':
    case U'*':
    case U'$':
    case U'%':
    case U'|':
    case U'=':
    case U'`':
    case U'#':
    case U'~':
    case U'^':
    case U'[':
    case U']':
    case U'(':
    case U')':
    case U';':
    case U':':
    case U'{':
    case U'}':
    case U'\u2225': // ∥ PARALLEL TO
    case U'\u00A3': // £
    case U'\u20AC': // €
    case U'\u301C': // 〜 WAVE DASH, mapped to U+FF5E by some drivers but not all
    case U'\uFF3E': // ＾ FULLWIDTH CIRCUMFLEX ACCENT
    case U'\u2015': // ― HORIZONTAL BAR
        return true;
    default:
        return false;
    }
}

bool ContainsForbiddenSymbol(std::string_view text)
{
    std::size_t index = 0;
    while (index < text.size())
    {
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
            continue;

        if (IsForbiddenSymbol(codepoint))
            return true;
    }
    return false;
}

} // namespace processing
