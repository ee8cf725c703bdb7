#include <gtest/gtest.h>
#include "format_classifier.hpp"
#include "ply_builder.hpp"

using namespace splatquery;
using test::PlyBuilder;

TEST(FormatClassifierTest, StandardPointCloud) {
    PlyBuilder ply("ascii");
    ply.element("vertex", 1).properties("float", {"x", "y", "z"})
       .properties("uchar", {"red", "green", "blue"});
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::Standard);
}

TEST(FormatClassifierTest, ShPerVertex) {
    PlyBuilder ply;
    ply.element("vertex", 1).properties("float", {"x", "y", "z", "f_dc_0", "f_dc_1", "f_dc_2", "opacity"});
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantA);
}

TEST(FormatClassifierTest, ScaleOnlyIsVariantA) {
    PlyBuilder ply;
    ply.element("vertex", 1).properties("float", {"x", "y", "z", "scale_0"});
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantA);
}

TEST(FormatClassifierTest, CodebookWinsOverShProperties) {
    PlyBuilder ply;
    ply.element("codebook_centers", 4).properties("float", {"f_dc_0", "f_dc_1", "f_dc_2"})
       .element("vertex", 1).properties("float", {"x", "y", "z"}).property("uint", "codebook_index");
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantB);
}

TEST(FormatClassifierTest, ChunkElement) {
    PlyBuilder ply;
    ply.element("chunk", 1).properties("float", {"min_x", "max_x"})
       .element("vertex", 1).property("uint", "packed_position");
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantC);
}

TEST(FormatClassifierTest, PackedPropertyWithoutChunk) {
    PlyBuilder ply;
    ply.element("vertex", 1).property("uint", "packed_color");
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantC);
}

TEST(FormatClassifierTest, ChunkedBeforeShPerVertex) {
    PlyBuilder ply;
    ply.element("chunk", 1).property("float", "min_x")
       .element("vertex", 1).property("uint", "packed_position")
       .element("sh", 1).property("uchar", "f_rest_0");
    EXPECT_EQ(classify_format(ply.header()), PlyVariant::VendorVariantC);
}

TEST(FormatClassifierTest, MissingMagicIsUnknown) {
    EXPECT_EQ(classify_format(std::string("solid cube\nfacet normal 0 0 1\n")), PlyVariant::Unknown);
    EXPECT_EQ(classify_format(std::string()), PlyVariant::Unknown);
    EXPECT_EQ(classify_format(std::string("\xEF\xBB\xBFply\nformat ascii 1.0\nend_header\n")), PlyVariant::Unknown);
}

TEST(FormatClassifierTest, PayloadIsIgnored) {
    PlyBuilder ply;
    ply.element("vertex", 1).properties("float", {"x", "y", "z"});
    std::string stream = ply.header() + "f_dc_0 element chunk";
    EXPECT_EQ(classify_format(stream), PlyVariant::Standard);
}

TEST(FormatClassifierTest, OnlyPrefixIsInspected) {
    PlyBuilder ply("ascii");
    ply.element("vertex", 1).properties("float", {"x", "y", "z"});
    for (int i = 0; i < 100; ++i) {
        ply.comment("padding padding padding padding");
    }
    std::string header = ply.header();
    ASSERT_GT(header.size(), kClassifierPrefixBytes);

    // A marker beyond the first kilobyte is not seen
    std::string late = header.substr(0, header.size() - 11) + "property float f_dc_0\nend_header\n";
    EXPECT_EQ(classify_format(late), PlyVariant::Standard);

    const auto* bytes = reinterpret_cast<const uint8_t*>(late.data());
    EXPECT_EQ(classify_format(bytes, late.size()), PlyVariant::Standard);
}

TEST(FormatClassifierTest, VariantNames) {
    EXPECT_STREQ(to_string(PlyVariant::Standard), "standard");
    EXPECT_STREQ(to_string(PlyVariant::VendorVariantB), "codebook");
    EXPECT_STREQ(to_string(PlyVariant::Unknown), "unknown");
}
