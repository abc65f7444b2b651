#include <gtest/gtest.h>

#include <canvas_codec/json_codec.hpp>

using namespace canvas_model;
using canvas_codec::Json;

TEST(ColorCodecTests, IntegerDecodesToPreset)
{
    const Color c = canvas_codec::decode_color(Json(4));
    ASSERT_TRUE(std::holds_alternative<PresetColor>(c));
    EXPECT_EQ(std::get<PresetColor>(c), PresetColor::Green);
}

TEST(ColorCodecTests, HexStringDecodesToHex)
{
    const Color c = canvas_codec::decode_color(Json("#FF0000"));
    ASSERT_TRUE(std::holds_alternative<HexColor>(c));
    const auto& hex = std::get<HexColor>(c);
    EXPECT_EQ(hex.red(), 255);
    EXPECT_EQ(hex.green(), 0);
    EXPECT_EQ(hex.blue(), 0);
}

TEST(ColorCodecTests, RejectsValuesOfNeitherShape)
{
    EXPECT_THROW(canvas_codec::decode_color(Json(7)), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json(0)), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json(-2)), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json(4.5)), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json("4")), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json("red")), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json(true)), canvas_codec::DecodeError);
    EXPECT_THROW(canvas_codec::decode_color(Json::array()), canvas_codec::DecodeError);
}

TEST(ColorCodecTests, EncodeKeepsRepresentation)
{
    EXPECT_EQ(canvas_codec::encode_color(PresetColor::Red), Json(1));
    EXPECT_EQ(canvas_codec::encode_color(PresetColor::Purple), Json(6));
    EXPECT_EQ(canvas_codec::encode_color(HexColor::rgb(255, 0, 0)), Json("#FF0000"));
}
