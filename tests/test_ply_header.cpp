#include <gtest/gtest.h>
#include "ply_header.hpp"
#include "errors.hpp"
#include "ply_builder.hpp"

using namespace splatquery;
using test::PlyBuilder;

TEST(PlyHeaderTest, TypeSizes) {
    EXPECT_EQ(type_size(ScalarType::Int8), 1u);
    EXPECT_EQ(type_size(ScalarType::UInt16), 2u);
    EXPECT_EQ(type_size(ScalarType::Float32), 4u);
    EXPECT_EQ(type_size(ScalarType::Float64), 8u);
    EXPECT_EQ(type_size(ScalarType::Unsupported), 0u);
}

TEST(PlyHeaderTest, ClassicAndSizedTypeNames) {
    EXPECT_EQ(parse_type_name("uchar"), ScalarType::UInt8);
    EXPECT_EQ(parse_type_name("uint8"), ScalarType::UInt8);
    EXPECT_EQ(parse_type_name("short"), ScalarType::Int16);
    EXPECT_EQ(parse_type_name("int32"), ScalarType::Int32);
    EXPECT_EQ(parse_type_name("float"), ScalarType::Float32);
    EXPECT_EQ(parse_type_name("float64"), ScalarType::Float64);
    EXPECT_EQ(parse_type_name("half"), ScalarType::Unsupported);
}

TEST(PlyHeaderTest, ParsesElementsAndOffsets) {
    PlyBuilder ply;
    ply.comment("made by hand")
       .element("vertex", 3)
       .properties("float", {"x", "y", "z"})
       .property("uchar", "red")
       .property("double", "weight")
       .element("face", 1)
       .list_property("uchar", "int", "vertex_indices");

    std::string text = ply.header();
    PlyHeader header = parse_header(text);

    EXPECT_EQ(header.encoding, PlyEncoding::BinaryLittleEndian);
    EXPECT_EQ(header.version, "1.0");
    ASSERT_EQ(header.elements.size(), 2u);
    ASSERT_EQ(header.comments.size(), 1u);
    EXPECT_EQ(header.comments[0], "made by hand");
    EXPECT_EQ(header.payload_offset, text.size());

    const ElementHeader& vertex = header.elements[0];
    EXPECT_EQ(vertex.name, "vertex");
    EXPECT_EQ(vertex.count, 3u);
    ASSERT_EQ(vertex.properties.size(), 5u);
    EXPECT_EQ(vertex.properties[3].offset, 12u);
    EXPECT_EQ(vertex.properties[4].offset, 13u);
    EXPECT_EQ(vertex.stride(), 4u * 3 + 1 + 8);
    EXPECT_TRUE(vertex.fixed_size());

    const ElementHeader& face = header.elements[1];
    ASSERT_EQ(face.properties.size(), 1u);
    EXPECT_TRUE(face.properties[0].is_list());
    EXPECT_EQ(face.properties[0].count_type, ScalarType::UInt8);
    EXPECT_EQ(face.properties[0].type, ScalarType::Int32);
    EXPECT_FALSE(face.fixed_size());
    EXPECT_EQ(face.stride(), 0u);
}

TEST(PlyHeaderTest, StrideExcludesLists) {
    PlyBuilder ply;
    ply.element("mixed", 1)
       .property("int", "id")
       .list_property("uchar", "float", "values")
       .property("short", "tag");
    PlyHeader header = parse_header(ply.header());
    EXPECT_EQ(header.elements[0].stride(), 6u);
}

TEST(PlyHeaderTest, Lookups) {
    PlyBuilder ply;
    ply.element("vertex", 1).properties("float", {"x", "y", "z"});
    PlyHeader header = parse_header(ply.header());

    EXPECT_EQ(header.find_element("vertex"), 0u);
    EXPECT_EQ(header.find_element("face"), kInvalidIndex);
    ASSERT_NE(header.element("vertex"), nullptr);
    EXPECT_EQ(header.element("vertex")->find_property("y"), 1u);
    EXPECT_FALSE(header.element("vertex")->has_property("nx"));
}

TEST(PlyHeaderTest, CrlfLineEndings) {
    std::string text = "ply\r\nformat ascii 1.0\r\nelement vertex 2\r\nproperty float x\r\nend_header\r\n1\r\n2\r\n";
    PlyHeader header = parse_header(text);
    EXPECT_EQ(header.encoding, PlyEncoding::Ascii);
    ASSERT_EQ(header.elements.size(), 1u);
    EXPECT_EQ(header.elements[0].properties[0].name, "x");
    EXPECT_EQ(text.substr(header.payload_offset), "1\r\n2\r\n");
}

TEST(PlyHeaderTest, BigEndianFormat) {
    PlyBuilder ply("binary_big_endian");
    ply.element("vertex", 0).property("float", "x");
    EXPECT_EQ(parse_header(ply.header()).encoding, PlyEncoding::BinaryBigEndian);
}

TEST(PlyHeaderTest, UnsupportedTypeKeepsName) {
    PlyBuilder ply;
    ply.element("vertex", 1).property("float", "x").property("half", "h").property("float", "y");
    PlyHeader header = parse_header(ply.header());
    const auto& props = header.elements[0].properties;
    EXPECT_EQ(props[1].type, ScalarType::Unsupported);
    EXPECT_EQ(props[1].type_name, "half");
    EXPECT_EQ(props[2].offset, 4u);
}

TEST(PlyHeaderTest, ObjInfoIsIgnored) {
    std::string text = "ply\nformat ascii 1.0\nobj_info scanner v2\nelement vertex 0\nproperty float x\nend_header\n";
    PlyHeader header = parse_header(text);
    EXPECT_EQ(header.elements.size(), 1u);
}

// Malformed headers

TEST(PlyHeaderErrorTest, MissingTerminator) {
    std::string text = "ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\n1\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, MissingMagic) {
    std::string text = "format ascii 1.0\nelement vertex 1\nproperty float x\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderTest, ByteOrderMarkBeforeMagic) {
    std::string text = "\xEF\xBB\xBFply\r\nformat ascii 1.0\r\nelement vertex 1\r\nproperty float x\r\nend_header\r\n1\r\n";
    PlyHeader header = parse_header(text);
    ASSERT_EQ(header.elements.size(), 1u);
    EXPECT_EQ(header.payload_offset, text.size() - 3);
}

TEST(PlyHeaderErrorTest, MissingFormat) {
    std::string text = "ply\nelement vertex 1\nproperty float x\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, UnknownEncoding) {
    std::string text = "ply\nformat binary_middle_endian 1.0\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, NegativeElementCount) {
    std::string text = "ply\nformat ascii 1.0\nelement vertex -3\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, NonNumericElementCount) {
    std::string text = "ply\nformat ascii 1.0\nelement vertex many\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, ElementWithExtraTokens) {
    std::string text = "ply\nformat ascii 1.0\nelement vertex 3 extra\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, PropertyBeforeElement) {
    std::string text = "ply\nformat ascii 1.0\nproperty float x\nelement vertex 1\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, ScalarPropertyTokenCount) {
    std::string text = "ply\nformat ascii 1.0\nelement vertex 1\nproperty float\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, ListPropertyTokenCount) {
    std::string text = "ply\nformat ascii 1.0\nelement face 1\nproperty list uchar vertex_indices\nend_header\n";
    EXPECT_THROW(parse_header(text), MalformedHeaderError);
}

TEST(PlyHeaderErrorTest, ErrorKindIsMalformedHeader) {
    try {
        parse_header(std::string("ply\nformat ascii 1.0\n"));
        FAIL() << "Expected MalformedHeaderError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedHeader);
    }
}
