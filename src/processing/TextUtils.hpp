#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// Encode a single codepoint as UTF-8 (empty for invalid codepoints)
std::string codepointToUtf8(char32_t cp);

/// Decode the codepoint starting at text[index].
/// On success advances index past the sequence and returns true.
/// On a malformed sequence advances index by one byte and returns false.
bool decodeNextUtf8(std::string_view text, std::size_t& index, char32_t& codepoint);

} // namespace processing
