#include "PermittedSymbols.hpp"

namespace processing
{

namespace
{

bool isPermittedBar(char32_t cp)
{
    switch (cp)
    {
    case U'-': // - HYPHEN-MINUS
    case U'\u2010': // ‐ HYPHEN
    case U'\u2014': // — EM DASH
    case U'\u2500': // ─ BOX DRAWINGS LIGHT HORIZONTAL
    case U'\uFF0D': // － FULLWIDTH HYPHEN-MINUS
    case U'\u2212': // − MINUS SIGN
        return true;
    default:
        return false;
    }
}

bool isPermittedDot(char32_t cp)
{
    switch (cp)
    {
    case U'\u30FB': // ・ KATAKANA MIDDLE DOT
    case U'\uFF65': // ･ HALFWIDTH KATAKANA MIDDLE DOT
        return true;
    default:
        return false;
    }
}

} // namespace

bool IsPermittedBarOrDot(char32_t cp) noexcept
{
    return isPermittedBar(cp) || isPermittedDot(cp);
}

bool IsPermittedSymbol(char32_t cp) noexcept
{
    return cp == FULLWIDTH_TILDE || IsPermittedBarOrDot(cp);
}

bool IsDeniedDash(char32_t cp) noexcept
{
    // ‒ FIGURE DASH, – EN DASH
    return cp == U'\u2012' || cp == U'\u2013';
}

bool IsDeniedTilde(char32_t cp) noexcept
{
    switch (cp)
    {
    case U'\u301C': // 〜 WAVE DASH
    case U'~': // ~ TILDE
    case U'\u02DC': // ˜ SMALL TILDE
    case U'\u223C': // ∼ TILDE OPERATOR
        return true;
    default:
        return false;
    }
}

} // namespace processing
