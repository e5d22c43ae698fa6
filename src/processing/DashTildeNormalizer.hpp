#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

// Rewrites the denied dash variants to U+2014 and the denied tilde variants to U+FF5E.
// Every other codepoint, and every malformed UTF-8 byte, is copied unchanged,
// so the codepoint count of the output always equals that of the input.
[[nodiscard]] std::string NormalizeDashesAndTildes(std::string_view text);

// Same as above; an absent input yields an absent output.
[[nodiscard]] std::optional<std::string> NormalizeDashesAndTildesNullable(const std::optional<std::string>& text);

} // namespace processing
