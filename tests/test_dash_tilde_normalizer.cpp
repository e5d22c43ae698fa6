#include <catch2/catch_test_macros.hpp>
#include "processing/DashTildeNormalizer.hpp"
#include "processing/TextUtils.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

using namespace processing;

namespace
{

std::size_t countCodepoints(std::string_view text)
{
    std::size_t count = 0;
    std::size_t index = 0;
    char32_t codepoint = 0;
    while (index < text.size())
    {
        (void)decodeNextUtf8(text, index, codepoint);
        ++count;
    }
    return count;
}

} // namespace

TEST_CASE("DashTildeNormalizer - figure dash and en dash become em dash", "[normalizer]")
{
    REQUIRE(NormalizeDashesAndTildes("‒") == "—");
    REQUIRE(NormalizeDashesAndTildes("–") == "—");
    REQUIRE(NormalizeDashesAndTildes("2010–2020") == "2010—2020");
}

TEST_CASE("DashTildeNormalizer - tilde variants become full-width tilde", "[normalizer]")
{
    REQUIRE(NormalizeDashesAndTildes("〜") == "～");
    REQUIRE(NormalizeDashesAndTildes("~") == "～");
    REQUIRE(NormalizeDashesAndTildes("˜") == "～");
    REQUIRE(NormalizeDashesAndTildes("∼") == "～");
    REQUIRE(NormalizeDashesAndTildes("10時〜18時") == "10時～18時");
}

TEST_CASE("DashTildeNormalizer - permitted dashes are left alone", "[normalizer]")
{
    const std::string permitted = "-‐—─－−";
    REQUIRE(NormalizeDashesAndTildes(permitted) == permitted);
    REQUIRE(NormalizeDashesAndTildes("～") == "～");
}

TEST_CASE("DashTildeNormalizer - unrelated text is unchanged", "[normalizer]")
{
    const std::string text = "東京都港区 1-2-3 「ようこそ！」 ABC";
    REQUIRE(NormalizeDashesAndTildes(text) == text);
    REQUIRE(NormalizeDashesAndTildes("") == "");
}

TEST_CASE("DashTildeNormalizer - codepoint count is preserved", "[normalizer]")
{
    const std::string input = "a~b–c〜d‒e∼f˜g";
    const std::string output = NormalizeDashesAndTildes(input);

    REQUIRE(output == "a～b—c～d—e～f～g");
    REQUIRE(countCodepoints(output) == countCodepoints(input));
    REQUIRE(countCodepoints(input) == 13);
}

TEST_CASE("DashTildeNormalizer - normalization is idempotent", "[normalizer]")
{
    const std::string inputs[] = { "~", "–〜‒", "営業時間 9:00~17:00", "ｶﾀｶﾅ–ひらがな", "" };
    for (const auto& input : inputs)
    {
        const std::string once = NormalizeDashesAndTildes(input);
        REQUIRE(NormalizeDashesAndTildes(once) == once);
    }
}

TEST_CASE("DashTildeNormalizer - each character maps independently", "[normalizer]")
{
    const std::string left = NormalizeDashesAndTildes("x");
    const std::string right = NormalizeDashesAndTildes("–");
    REQUIRE(NormalizeDashesAndTildes("x–") == left + right);
    REQUIRE(NormalizeDashesAndTildes("y–") == NormalizeDashesAndTildes("y") + right);
}

TEST_CASE("DashTildeNormalizer - malformed bytes are copied through", "[normalizer]")
{
    const std::string input = std::string("a\xFF~", 3);
    REQUIRE(NormalizeDashesAndTildes(input) == std::string("a\xFF", 2) + "～");
}

TEST_CASE("DashTildeNormalizer - absent input stays absent", "[normalizer]")
{
    REQUIRE_FALSE(NormalizeDashesAndTildesNullable(std::nullopt).has_value());

    auto result = NormalizeDashesAndTildesNullable(std::optional<std::string>("~"));
    REQUIRE(result.has_value());
    REQUIRE(*result == "～");
}
