#pragma once

#include "IByteOracle.hpp"

#include <memory>
#include <string>

namespace processing
{

// JIS X 0208 flavoured Shift_JIS: U+2014, U+2212 and U+301C have byte pairs,
// U+FF0D and U+FF5E do not. ICU's "Shift_JIS" alias is the Microsoft table,
// which maps the opposite way.
inline constexpr const char* kDefaultShiftJisConverter = "ibm-943_P130-1999";

/**
 * @brief IByteOracle backed by an ICU converter.
 *
 * Unmappable characters come back as the single byte 0x3F and fallback
 * mappings are disabled, so only round-trip Shift_JIS characters produce real
 * byte pairs. U+0000-U+007F always encode as the same single byte, including
 * backslash and tilde, which some tables reserve for yen and overline.
 * The converter is stateful; encode() serializes access to it.
 */
class IcuShiftJisOracle : public IByteOracle
{
public:
    // Throws std::runtime_error when ICU has no converter of that name.
    explicit IcuShiftJisOracle(const std::string& converter_name = kDefaultShiftJisConverter);
    ~IcuShiftJisOracle() override;

    IcuShiftJisOracle(const IcuShiftJisOracle&) = delete;
    IcuShiftJisOracle& operator=(const IcuShiftJisOracle&) = delete;

    [[nodiscard]] EncodedChar encode(char32_t codepoint) const override;

    [[nodiscard]] const std::string& converterName() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Process-wide oracle over kDefaultShiftJisConverter, created on first use.
[[nodiscard]] const IByteOracle& DefaultShiftJisOracle();

} // namespace processing
