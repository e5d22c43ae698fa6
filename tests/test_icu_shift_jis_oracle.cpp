#include <catch2/catch_test_macros.hpp>
#include "processing/EncodingClassifier.hpp"
#include "processing/IcuShiftJisOracle.hpp"
#include "processing/ValidationPipeline.hpp"

#include <stdexcept>

using namespace processing;

namespace
{

std::string encodeHex(const IByteOracle& oracle, char32_t cp)
{
    const EncodedChar encoded = oracle.encode(cp);
    if (encoded.length == 2)
        return FormatBytePair(encoded.lead(), encoded.trail());
    return FormatBytePair(0, encoded.lead()).substr(2);
}

} // namespace

TEST_CASE("IcuShiftJisOracle - encodes unambiguous characters", "[icu]")
{
    IcuShiftJisOracle oracle;

    REQUIRE(oracle.converterName() == kDefaultShiftJisConverter);
    REQUIRE(encodeHex(oracle, U'A') == "41");
    REQUIRE(encodeHex(oracle, U'?') == "3f");
    REQUIRE(encodeHex(oracle, U'あ') == "82a0"); // あ
    REQUIRE(encodeHex(oracle, U'ア') == "8341"); // ア
    REQUIRE(encodeHex(oracle, U'亜') == "889f"); // 亜
    REQUIRE(encodeHex(oracle, U'ｱ') == "b1");   // ｱ
    REQUIRE(encodeHex(oracle, U'Ω') == "83b6"); // Ω
}

TEST_CASE("IcuShiftJisOracle - dash and tilde family follow JIS X 0208", "[icu]")
{
    IcuShiftJisOracle oracle;

    REQUIRE(encodeHex(oracle, U'\u2014') == "815c"); // — EM DASH
    REQUIRE(encodeHex(oracle, U'\u2212') == "817c"); // − MINUS SIGN
    REQUIRE(encodeHex(oracle, U'\u301C') == "8160"); // 〜 WAVE DASH
    REQUIRE(encodeHex(oracle, U'\uFF5E') == "3f");   // ～ has no JIS X 0208 code
}

TEST_CASE("IcuShiftJisOracle - ASCII keeps its own bytes", "[icu]")
{
    IcuShiftJisOracle oracle;

    REQUIRE(encodeHex(oracle, U'\\') == "5c");
    REQUIRE(encodeHex(oracle, U'~') == "7e");
    REQUIRE(encodeHex(oracle, U'-') == "2d");
    REQUIRE(encodeHex(oracle, U'\0') == "00");
}

TEST_CASE("IcuShiftJisOracle - other converters can be selected", "[icu]")
{
    IcuShiftJisOracle microsoft("windows-31j");

    REQUIRE(microsoft.converterName() == "windows-31j");
    REQUIRE(encodeHex(microsoft, U'\uFF5E') == "8160");
    REQUIRE(encodeHex(microsoft, U'\u3042') == "82a0");
}

TEST_CASE("IcuShiftJisOracle - substitutes unmappable characters", "[icu]")
{
    IcuShiftJisOracle oracle;

    const EncodedChar emoji = oracle.encode(U'\U0001F600');
    REQUIRE(emoji.length == 1);
    REQUIRE(emoji.lead() == 0x3F);

    const EncodedChar hangul = oracle.encode(U'한');
    REQUIRE(hangul.length == 1);
    REQUIRE(hangul.lead() == 0x3F);
}

TEST_CASE("IcuShiftJisOracle - repeated use does not leak converter state", "[icu]")
{
    IcuShiftJisOracle oracle;

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(encodeHex(oracle, U'\U0001F600') == "3f");
        REQUIRE(encodeHex(oracle, U'あ') == "82a0");
        REQUIRE(encodeHex(oracle, U'A') == "41");
    }
}

TEST_CASE("IcuShiftJisOracle - unknown converter is rejected", "[icu][error]")
{
    REQUIRE_THROWS_AS(IcuShiftJisOracle("no-such-charset-xyz"), std::runtime_error);
}

TEST_CASE("Entry points - default oracle", "[icu][classifier]")
{
    SECTION("Japanese text passes both variants")
    {
        REQUIRE_FALSE(IsSymbolsForbidden("こんにちは", StrictnessMode::NoExtraAllowances));
        REQUIRE_FALSE(IsKanjiForbidden("こんにちは世界", StrictnessMode::NoExtraAllowances));
        REQUIRE_FALSE(IsKanjiForbidden("", StrictnessMode::NoExtraAllowances));
    }

    SECTION("Emoji is rejected")
    {
        REQUIRE(IsSymbolsForbidden("\U0001F600", StrictnessMode::AllowAll));
        REQUIRE(IsKanjiForbidden("\U0001F600", StrictnessMode::AllowAll));
    }

    SECTION("Literal question mark is accepted")
    {
        REQUIRE_FALSE(IsSymbolsForbidden("?", StrictnessMode::NoExtraAllowances));
        REQUIRE_FALSE(IsKanjiForbidden("?", StrictnessMode::NoExtraAllowances));
    }

    SECTION("Greek only passes the kanji variant")
    {
        REQUIRE(IsSymbolsForbidden("Ω", StrictnessMode::NoExtraAllowances));
        REQUIRE_FALSE(IsKanjiForbidden("Ω", StrictnessMode::NoExtraAllowances));
    }

    SECTION("Em dash passes without allowances")
    {
        REQUIRE_FALSE(IsKanjiForbidden("—", StrictnessMode::NoExtraAllowances));
        REQUIRE_FALSE(IsSymbolsForbidden("—", StrictnessMode::NoExtraAllowances));
    }

    SECTION("Full-width tilde only passes under AllowAll")
    {
        REQUIRE(IsKanjiForbidden("～", StrictnessMode::NoExtraAllowances));
        REQUIRE(IsKanjiForbidden("～", StrictnessMode::AllowBarsAndDots));
        REQUIRE_FALSE(IsKanjiForbidden("～", StrictnessMode::AllowAll));
    }

    SECTION("Classify dispatches on the variant")
    {
        REQUIRE(Classify("Ω", StrictnessMode::NoExtraAllowances, TableVariant::Symbols) ==
                IsSymbolsForbidden("Ω", StrictnessMode::NoExtraAllowances));
        REQUIRE(Classify("Ω", StrictnessMode::NoExtraAllowances, TableVariant::Kanji) ==
                IsKanjiForbidden("Ω", StrictnessMode::NoExtraAllowances));
    }
}

TEST_CASE("ValidationPipeline - default oracle accepts normalized dashes", "[icu][pipeline]")
{
    ValidationPipeline pipeline(DefaultShiftJisOracle());

    auto dashed = pipeline.validate("あ–ん");
    REQUIRE(dashed.text == "あ—ん");
    REQUIRE(dashed.accepted());

    REQUIRE(pipeline.validate("東京都港区 1—2").accepted());
    REQUIRE(pipeline.validate("−").accepted());

    // Wave dash becomes U+FF5E, which needs AllowAll
    auto waved = pipeline.validate("10時〜18時");
    REQUIRE(waved.text == "10時～18時");
    REQUIRE(waved.unencodable);

    ValidationOptions lenient;
    lenient.mode = StrictnessMode::AllowAll;
    ValidationPipeline relaxed(DefaultShiftJisOracle(), lenient);
    REQUIRE(relaxed.validate("10時〜18時").accepted());
}
