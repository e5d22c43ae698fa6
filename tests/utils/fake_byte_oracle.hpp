#pragma once

#include "processing/IByteOracle.hpp"

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <unordered_map>
#include <unordered_set>

namespace test_utils {

// Deterministic stand-in for the Shift_JIS encoder.
// ASCII and half-width katakana are encoded like Shift_JIS; a handful of
// double-byte characters are preloaded; everything else comes back as '?'.
class FakeByteOracle : public processing::IByteOracle {
public:
    FakeByteOracle();

    // Map a codepoint to an explicit byte sequence (1..4 bytes)
    void set(char32_t codepoint, std::initializer_list<std::uint8_t> bytes);

    // encode() throws EncodingError for this codepoint
    void fail(char32_t codepoint);

    processing::EncodedChar encode(char32_t codepoint) const override;

    std::size_t calls() const { return calls_.load(); }

private:
    std::unordered_map<char32_t, processing::EncodedChar> mappings_;
    std::unordered_set<char32_t> failures_;
    mutable std::atomic<std::size_t> calls_{ 0 };
};

} // namespace test_utils
