#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <cstdint>
#include <cstdio>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 80 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t codepoints) noexcept
{
    if (codepoints == 0)
        codepoints = 1;
    max_preview_.store(codepoints, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(text.size() + 16);

    std::size_t count = 0;
    std::size_t index = 0;
    while (index < text.size() && count < limit)
    {
        const std::size_t start = index;
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            out.push_back('?');
        }
        else if (codepoint == U'\n')
        {
            out += "\\n";
        }
        else if (codepoint == U'\r')
        {
            out += "\\r";
        }
        else if (codepoint == U'\t')
        {
            out += "\\t";
        }
        else if (codepoint < 0x20u || codepoint == 0x7Fu)
        {
            out.push_back('?');
        }
        else
        {
            out.append(text.substr(start, index - start));
        }
        ++count;
    }

    if (index < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    return out;
}

std::string Diagnostics::DescribeCodepoint(char32_t codepoint)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<std::uint32_t>(codepoint));
    return buffer;
}

} // namespace processing
