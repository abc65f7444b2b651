#include <gtest/gtest.h>

#include <canvas_codec/json_codec.hpp>
#include <limits>

using namespace canvas_model;
using canvas_codec::DecodeError;
using canvas_codec::Json;

TEST(NodeCodecTests, LinkNodeExposesUrlAndSharedFields)
{
    const Json j = Json::parse(R"({
        "type": "link", "id": "l1", "x": -10, "y": 20, "width": 300, "height": 150,
        "color": 2, "url": "https://jsoncanvas.org/"
    })");

    const Node n = canvas_codec::decode_node(j);
    ASSERT_EQ(n.kind(), NodeKind::Link);
    EXPECT_EQ(n.as<LinkNode>().url(), "https://jsoncanvas.org/");
    EXPECT_EQ(n.id(), "l1");
    EXPECT_EQ(n.location(), (Location{ -10, 20 }));
    EXPECT_EQ(n.dimensions(), (Dimensions{ 300, 150 }));
    EXPECT_EQ(n.color(), Color(PresetColor::Orange));
}

TEST(NodeCodecTests, UnknownTypeFails)
{
    const Json j = Json::parse(R"({"type":"bogus","id":"b","x":0,"y":0,"width":1,"height":1})");
    try {
        (void)canvas_codec::decode_node(j);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.where(), "/type");
    }
}

TEST(NodeCodecTests, MissingTypeFails)
{
    const Json j = Json::parse(R"({"id":"b","x":0,"y":0,"width":1,"height":1,"text":"t"})");
    EXPECT_THROW(canvas_codec::decode_node(j), DecodeError);
}

TEST(NodeCodecTests, RequiredFieldsAreChecked)
{
    // text node without "text"
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":0,"y":0,"width":1,"height":1})")), DecodeError);
    // file node without "file"
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"file","id":"f","x":0,"y":0,"width":1,"height":1})")), DecodeError);
    // missing geometry
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":0,"width":1,"height":1,"text":""})")), DecodeError);
    // id of the wrong type
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":5,"x":0,"y":0,"width":1,"height":1,"text":""})")), DecodeError);
}

TEST(NodeCodecTests, GeometryTypesAreChecked)
{
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":0,"y":0,"width":-1,"height":1,"text":""})")), DecodeError);
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":0.5,"y":0,"width":1,"height":1,"text":""})")), DecodeError);
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":0,"y":0,"width":1,"height":"1","text":""})")), DecodeError);

    const Node n = canvas_codec::decode_node(Json::parse(
        R"({"type":"text","id":"t","x":-9223372036854775808,"y":9223372036854775807,)"
        R"("width":18446744073709551615,"height":0,"text":""})"));
    EXPECT_EQ(n.location().x, std::numeric_limits<Coord>::min());
    EXPECT_EQ(n.location().y, std::numeric_limits<Coord>::max());
    EXPECT_EQ(n.dimensions().width, std::numeric_limits<Length>::max());
}

TEST(NodeCodecTests, RelativeUrlFails)
{
    EXPECT_THROW(canvas_codec::decode_node(Json::parse(
        R"({"type":"link","id":"l","x":0,"y":0,"width":1,"height":1,"url":"/docs/apps"})")), DecodeError);
}

TEST(NodeCodecTests, NullOptionalFieldsDecodeAsAbsent)
{
    const Node n = canvas_codec::decode_node(Json::parse(R"({
        "type":"group","id":"g","x":0,"y":0,"width":1,"height":1,
        "color":null,"label":null,"background":null,"backgroundStyle":null
    })"));
    const auto& g = n.as<GroupNode>();
    EXPECT_FALSE(n.color().has_value());
    EXPECT_FALSE(g.label().has_value());
    EXPECT_FALSE(g.background().has_value());
    EXPECT_FALSE(g.background_style().has_value());
}

TEST(NodeCodecTests, GroupBackgroundStyleIsChecked)
{
    const Node n = canvas_codec::decode_node(Json::parse(R"({
        "type":"group","id":"g","x":0,"y":0,"width":1,"height":1,
        "background":"img/bg.png","backgroundStyle":"cover"
    })"));
    EXPECT_EQ(n.as<GroupNode>().background(), std::filesystem::path("img/bg.png"));
    EXPECT_EQ(n.as<GroupNode>().background_style(), BackgroundStyle::Cover);

    EXPECT_THROW(canvas_codec::decode_node(Json::parse(R"({
        "type":"group","id":"g","x":0,"y":0,"width":1,"height":1,"backgroundStyle":"stretch"
    })")), DecodeError);
}

TEST(NodeCodecTests, UnknownKeysAreIgnored)
{
    const Node n = canvas_codec::decode_node(Json::parse(R"({
        "type":"file","id":"f","x":1,"y":2,"width":3,"height":4,"file":"a.md",
        "subpath":"#Top","futureField":{"nested":[1,2,3]}
    })"));
    EXPECT_EQ(n.as<FileNode>().subpath(), "#Top");
}

TEST(NodeCodecTests, EncodeFlattensAndOmitsAbsentOptionals)
{
    const Node n = GroupNode(GenericNode{ "g", Location{ -1, 2 }, Dimensions{ 3, 4 }, std::nullopt },
        std::nullopt, std::nullopt, BackgroundStyle::Repeat);

    const Json j = canvas_codec::encode_node(n);
    EXPECT_EQ(j.dump(),
        R"({"type":"group","id":"g","x":-1,"y":2,"width":3,"height":4,"backgroundStyle":"repeat"})");
}

TEST(NodeCodecTests, EncodeFileNodeWritesPathAndSubpath)
{
    const Node n = FileNode(GenericNode{ "f", Location{ 0, 0 }, Dimensions{ 1, 1 }, HexColor::rgb(0, 255, 127) },
        "dir/file.md", "#Sec");

    const Json j = canvas_codec::encode_node(n);
    EXPECT_EQ(j.at("type"), "file");
    EXPECT_EQ(j.at("file"), "dir/file.md");
    EXPECT_EQ(j.at("subpath"), "#Sec");
    EXPECT_EQ(j.at("color"), "#00FF7F");
    EXPECT_EQ(canvas_codec::decode_node(j), n);
}

TEST(NodeCodecTests, DecodesNodeBuiltInCode)
{
    Json j = { { "type", "text" }, { "id", "t" }, { "x", 0 }, { "y", -3 },
        { "width", 10 }, { "height", 20 }, { "text", "" } };

    const Node n = canvas_codec::decode_node(j);
    EXPECT_EQ(n.dimensions(), (Dimensions{ 10, 20 }));
    EXPECT_EQ(n.location(), (Location{ 0, -3 }));

    j["width"] = -10;
    EXPECT_THROW(canvas_codec::decode_node(j), DecodeError);
}
