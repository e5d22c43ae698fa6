#include "IcuShiftJisOracle.hpp"
#include "EncodingError.hpp"
#include "PermittedSymbols.hpp"

#include <mutex>
#include <sstream>
#include <stdexcept>

#include <plog/Log.h>
#include <unicode/ucnv.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

namespace processing
{

namespace
{

struct ConverterDeleter
{
    void operator()(UConverter* converter) const noexcept { ucnv_close(converter); }
};

using ConverterPointer = std::unique_ptr<UConverter, ConverterDeleter>;

std::string describe(char32_t codepoint, UErrorCode status)
{
    std::ostringstream oss;
    oss << "cannot encode U+" << std::hex << std::uppercase << static_cast<std::uint32_t>(codepoint) << ": "
        << u_errorName(status);
    return oss.str();
}

} // namespace

struct IcuShiftJisOracle::Impl
{
    std::string name;
    ConverterPointer converter;
    std::mutex mutex;
};

IcuShiftJisOracle::IcuShiftJisOracle(const std::string& converter_name)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = converter_name;

    UErrorCode status = U_ZERO_ERROR;
    impl_->converter.reset(ucnv_open(converter_name.c_str(), &status));
    if (U_FAILURE(status) || !impl_->converter)
    {
        PLOG_ERROR << "Failed to open ICU converter '" << converter_name << "': " << u_errorName(status);
        throw std::runtime_error("unknown converter: " + converter_name);
    }

    const char substitute = static_cast<char>(FALLBACK_MARKER);
    ucnv_setSubstChars(impl_->converter.get(), &substitute, 1, &status);
    if (U_FAILURE(status))
    {
        PLOG_ERROR << "Failed to set substitution character on '" << converter_name << "': " << u_errorName(status);
        throw std::runtime_error("cannot configure converter: " + converter_name);
    }
    ucnv_setFallback(impl_->converter.get(), false);

    PLOG_DEBUG << "Opened ICU converter '" << converter_name << "' ("
               << ucnv_getName(impl_->converter.get(), &status) << ")";
}

IcuShiftJisOracle::~IcuShiftJisOracle() = default;

EncodedChar IcuShiftJisOracle::encode(char32_t codepoint) const
{
    if (codepoint < 0x80u)
    {
        EncodedChar ascii;
        ascii.bytes[0] = static_cast<std::uint8_t>(codepoint);
        ascii.length = 1;
        return ascii;
    }

    UChar units[U16_MAX_LENGTH];
    int32_t unit_count = 0;
    UBool is_error = false;
    U16_APPEND(units, unit_count, U16_MAX_LENGTH, static_cast<UChar32>(codepoint), is_error);
    if (is_error)
        throw EncodingError(describe(codepoint, U_ILLEGAL_ARGUMENT_ERROR), codepoint);

    char out[8];
    int32_t written = 0;
    UErrorCode status = U_ZERO_ERROR;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ucnv_resetFromUnicode(impl_->converter.get());
        written = ucnv_fromUChars(impl_->converter.get(), out, static_cast<int32_t>(sizeof(out)), units, unit_count,
                                  &status);
    }

    if (U_FAILURE(status))
        throw EncodingError(describe(codepoint, status), codepoint);

    EncodedChar encoded;
    if (written <= 0 || static_cast<std::size_t>(written) > encoded.bytes.size())
        throw EncodingError(describe(codepoint, U_INVALID_CHAR_FOUND), codepoint);

    for (int32_t i = 0; i < written; ++i)
    {
        encoded.bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(out[i]);
    }
    encoded.length = static_cast<std::size_t>(written);
    return encoded;
}

const std::string& IcuShiftJisOracle::converterName() const noexcept { return impl_->name; }

const IByteOracle& DefaultShiftJisOracle()
{
    static const IcuShiftJisOracle oracle;
    return oracle;
}

} // namespace processing
