#include <gtest/gtest.h>
#include <cstddef>
#include <cstring>
#include <expected>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

import Core;
import Graphics;

using namespace Graphics;

// =============================================================================
// DecodeSlime
// =============================================================================

TEST(SlimeDecode, NamedStruct)
{
    auto params = DecodeSlime("Slime(value: 0.5)");
    ASSERT_TRUE(params.has_value());
    EXPECT_FLOAT_EQ(params->Value, 0.5f);
}

TEST(SlimeDecode, AnonymousStruct)
{
    auto params = DecodeSlime("(value: -2.25)");
    ASSERT_TRUE(params.has_value());
    EXPECT_FLOAT_EQ(params->Value, -2.25f);
}

TEST(SlimeDecode, WhitespaceCommentsAndTrailingComma)
{
    constexpr std::string_view text =
        "// simulation parameters\n"
        "Slime /* struct */ (\n"
        "    value: 1.5e-1, // tick\n"
        ")\n";

    auto params = DecodeSlime(text);
    ASSERT_TRUE(params.has_value());
    EXPECT_FLOAT_EQ(params->Value, 0.15f);
}

TEST(SlimeDecode, IntegerAndSignedLiterals)
{
    auto integer = DecodeSlime("(value: 3)");
    ASSERT_TRUE(integer.has_value());
    EXPECT_FLOAT_EQ(integer->Value, 3.0f);

    auto plus = DecodeSlime("(value: +0.75)");
    ASSERT_TRUE(plus.has_value());
    EXPECT_FLOAT_EQ(plus->Value, 0.75f);
}

TEST(SlimeDecode, PaddingFieldsAreIgnored)
{
    auto params = DecodeSlime("(value: 1.0, _padding0: 9.0, _padding2: 4.0)");
    ASSERT_TRUE(params.has_value());
    EXPECT_FLOAT_EQ(params->Value, 1.0f);
    EXPECT_FLOAT_EQ(params->Padding0, 0.0f);
    EXPECT_FLOAT_EQ(params->Padding2, 0.0f);
}

TEST(SlimeDecode, UnknownFieldsAreSkipped)
{
    auto params = DecodeSlime(R"(Slime(
        speed: 2.0,
        value: 0.25,
        enabled: true,
        label: "a ) b",
        offset: (1.0, -2.0),
        tags: ["x", "y"],
        mode: Fast(3),
    ))");
    ASSERT_TRUE(params.has_value());
    EXPECT_FLOAT_EQ(params->Value, 0.25f);

    // An unknown field never stands in for the required one.
    auto missing = DecodeSlime("Slime(speed: 4.0)");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), AssetError::DecodeFailed);
}

TEST(SlimeDecode, ShippedDefaultAssetDecodes)
{
    IORegistry registry;
    ASSERT_TRUE(registry.RegisterLoader(std::make_unique<SlimeLoader>()));
    Core::IO::FileIOBackend files;

    auto imported = registry.Import(Core::Filesystem::GetAssetPath("slime/default.slime"), files);
    ASSERT_TRUE(imported.has_value()) << AssetErrorToString(imported.error());
    ASSERT_TRUE(std::holds_alternative<SlimeParams>(*imported));
    EXPECT_FLOAT_EQ(std::get<SlimeParams>(*imported).Value, 0.5f);
}

TEST(SlimeDecode, RejectsMalformedInput)
{
    const std::string_view cases[] = {
        "",
        "()",                                  // missing value
        "Slime",                               // no body
        "Slime(value: 1.0",                    // unterminated
        "Other(value: 1.0)",                   // wrong struct name
        "(value 1.0)",                         // missing ':'
        "(value: abc)",                        // not a number
        "(value: 1.0, speed: )",               // unknown field without a value
        "(value: 1.0, tags: [1, 2)",           // unbalanced unknown value
        "(value: 1.0, name: \"open)",          // unterminated string
        "(value: 1.0, value: 2.0)",            // duplicate
        "(_padding1: 1.0, _padding1: 1.0, value: 0.0)",
        "(value: 1.0) extra",                  // trailing junk
        "(value: 1.0 2.0)",                    // missing ','
        "(value: 1.0) /* open",                // unterminated comment
        "(value: inf)",
        "(value: nan)",
        "(value: 1e999)",                      // out of float range
    };

    for (std::string_view text : cases)
    {
        auto params = DecodeSlime(text);
        ASSERT_FALSE(params.has_value()) << "accepted: " << text;
        EXPECT_EQ(params.error(), AssetError::DecodeFailed) << text;
    }
}

// =============================================================================
// EncodeSlime / SlimeExporter
// =============================================================================

TEST(SlimeEncode, ShortestForm)
{
    SlimeParams params;
    params.Value = 0.5f;
    EXPECT_EQ(EncodeSlime(params), "(value: 0.5)\n");

    params.Value = -3.0f;
    EXPECT_EQ(EncodeSlime(params), "(value: -3)\n");
}

TEST(SlimeEncode, DecodesToSameFloat)
{
    const float values[] = {
        0.0f, 0.01f, 0.1f, 1.0f / 3.0f, 123456.789f, -7.5e-8f,
        std::numeric_limits<float>::max(), std::numeric_limits<float>::lowest(),
    };

    for (float value : values)
    {
        SlimeParams params;
        params.Value = value;
        const std::string text = EncodeSlime(params);

        auto decoded = DecodeSlime(text);
        ASSERT_TRUE(decoded.has_value()) << text;
        EXPECT_EQ(decoded->Value, value) << text;
    }
}

TEST(SlimeEncode, PaddingIsNotWritten)
{
    SlimeParams params;
    params.Value = 1.0f;
    params.Padding1 = 5.0f;

    const std::string text = EncodeSlime(params);
    EXPECT_EQ(text.find("_padding"), std::string::npos);
}

TEST(SlimeExporter, WritesUtf8Text)
{
    SlimeExporter exporter;
    SlimeParams params;
    params.Value = 2.5f;

    auto bytes = exporter.Export(params);
    ASSERT_TRUE(bytes.has_value());

    const std::string text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    EXPECT_EQ(text, "(value: 2.5)\n");
}

TEST(SlimeExporter, RejectsNonFiniteValue)
{
    SlimeExporter exporter;
    SlimeParams params;
    params.Value = std::numeric_limits<float>::infinity();

    auto bytes = exporter.Export(params);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error(), AssetError::InvalidData);
}

// =============================================================================
// SlimeLoader
// =============================================================================

TEST(SlimeLoader, DecodesBytes)
{
    SlimeLoader loader;
    constexpr std::string_view text = "Slime(value: 4.0)";
    std::vector<std::byte> bytes(text.size());
    std::memcpy(bytes.data(), text.data(), text.size());

    LoadContext ctx;
    ctx.SourcePath = "memory.slime";
    auto result = loader.Load(bytes, ctx);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<SlimeParams>(*result));
    EXPECT_FLOAT_EQ(std::get<SlimeParams>(*result).Value, 4.0f);
}

TEST(SlimeLoader, PropagatesDecodeFailure)
{
    SlimeLoader loader;
    constexpr std::string_view text = "Slime(speed: 4.0)";
    std::vector<std::byte> bytes(text.size());
    std::memcpy(bytes.data(), text.data(), text.size());

    auto result = loader.Load(bytes, LoadContext{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AssetError::DecodeFailed);
}

TEST(SlimeParamsLayout, MatchesGpuElement)
{
    static_assert(sizeof(SlimeParams) == 16);
    static_assert(offsetof(SlimeParams, Value) == 0);

    SlimeParams params;
    EXPECT_EQ(params.Value, 0.0f);
}
