#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::string codepointToUtf8(char32_t cp)
{
    std::string result;
    if (!utf8proc_codepoint_valid(static_cast<utf8proc_int32_t>(cp)))
        return result;

    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
    if (bytes > 0)
    {
        result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
    }
    return result;
}

bool decodeNextUtf8(std::string_view text, std::size_t& index, char32_t& codepoint)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data()) + index;
    utf8proc_ssize_t remaining = static_cast<utf8proc_ssize_t>(text.size() - index);

    utf8proc_int32_t decoded = 0;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, remaining, &decoded);
    if (bytes <= 0 || decoded < 0)
    {
        ++index;
        return false;
    }

    codepoint = static_cast<char32_t>(decoded);
    index += static_cast<std::size_t>(bytes);
    return true;
}

} // namespace processing
