#pragma once

#include <stdexcept>
#include <string>

namespace processing
{

// Raised when a character has no byte representation at all in the target
// encoding (not even the substitution marker), or when the input is not valid UTF-8.
class EncodingError : public std::runtime_error
{
public:
    EncodingError(const std::string& message, char32_t codepoint)
        : std::runtime_error(message)
        , codepoint_(codepoint)
    {
    }

    [[nodiscard]] char32_t codepoint() const noexcept { return codepoint_; }

private:
    char32_t codepoint_;
};

} // namespace processing
