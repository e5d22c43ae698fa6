#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace processing
{

/**
 * @brief Byte sequence of one character in the target encoding.
 */
struct EncodedChar
{
    std::array<std::uint8_t, 4> bytes{};
    std::size_t length = 0;

    [[nodiscard]] std::uint8_t lead() const noexcept { return bytes[0]; }
    [[nodiscard]] std::uint8_t trail() const noexcept { return bytes[1]; }
};

/**
 * @brief Converts a single character to its Shift_JIS byte sequence.
 *
 * Characters the encoding cannot represent map to the single substitution
 * byte 0x3F ('?') instead of failing. Implementations throw EncodingError only
 * when no byte sequence can be produced at all.
 *
 * Implementations must be safe to call concurrently.
 */
class IByteOracle
{
public:
    virtual ~IByteOracle() = default;

    [[nodiscard]] virtual EncodedChar encode(char32_t codepoint) const = 0;
};

} // namespace processing
