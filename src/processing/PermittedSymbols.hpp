#pragma once

namespace processing
{

/// Canonical substitute for the denied dash variants (U+2014 EM DASH)
constexpr char32_t CANONICAL_DASH = U'\u2014';

/// Canonical substitute for the denied tilde variants, also the only permitted tilde (U+FF5E FULLWIDTH TILDE)
constexpr char32_t FULLWIDTH_TILDE = U'\uFF5E';

/// Shift_JIS substitution byte for characters the encoder cannot map ('?')
constexpr unsigned char FALLBACK_MARKER = 0x3F;

/// Bars (hyphen/dash/minus family) and middle dots that bypass the byte-range tables
[[nodiscard]] bool IsPermittedBarOrDot(char32_t cp) noexcept;

/// Bars, dots and the full-width tilde
[[nodiscard]] bool IsPermittedSymbol(char32_t cp) noexcept;

/// Dash variants rewritten to CANONICAL_DASH by the normalizer
[[nodiscard]] bool IsDeniedDash(char32_t cp) noexcept;

/// Tilde variants rewritten to FULLWIDTH_TILDE by the normalizer
[[nodiscard]] bool IsDeniedTilde(char32_t cp) noexcept;

} // namespace processing
