#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Process-wide switches for classification tracing.
// Trace records go to the plog instance kLogInstance; they never affect results.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Preview limit in codepoints
    static void SetMaxPreview(std::size_t codepoints) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Log-safe rendering of input text, truncated on a codepoint boundary
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "U+301C"
    [[nodiscard]] static std::string DescribeCodepoint(char32_t codepoint);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
