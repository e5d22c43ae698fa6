#pragma once

#include <string_view>

namespace processing
{

// True when the text contains at least one symbol that is rejected by policy
// regardless of whether Shift_JIS can represent it. The empty string is never forbidden.
[[nodiscard]] bool ContainsForbiddenSymbol(std::string_view text);

[[nodiscard]] bool IsForbiddenSymbol(char32_t cp) noexcept;

} // namespace processing
