#include "core/dxf_reader.h"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace aidcis::plate;

namespace {

const char* const kDrawing =
    "  0\nSECTION\n  2\nHEADER\n  9\n$ACADVER\n  1\nAC1015\n  0\nENDSEC\n"
    "  0\nSECTION\n  2\nENTITIES\n"
    "  0\nCIRCLE\n  8\nHOLES\n 10\n100.0\n 20\n-50.5\n 30\n0.0\n 40\n8.865\n"
    "  0\nARC\n  8\nHOLES\n 10\n200.0\n 20\n0.0\n 40\n8.865\n 50\n0.0\n 51\n180.0\n"
    "  0\nLINE\n  8\nOUTLINE\n 10\n0.0\n 20\n0.0\n 11\n10.0\n 21\n10.0\n"
    "  0\nCIRCLE\n  8\nOUTLINE\n 10\n0.0\n 20\n0.0\n 40\n2300\n"
    "  0\nENDSEC\n  0\nEOF\n";

} // anonymous namespace

TEST(DxfReaderTest, ReadsCirclesAndArcsFromEntities) {
    std::istringstream input(kDrawing);
    DxfReader reader;
    ASSERT_TRUE(reader.parse(input)) << reader.getLastError();

    const auto& primitives = reader.getPrimitives();
    ASSERT_EQ(primitives.size(), 3u);

    EXPECT_EQ(primitives[0].kind, PrimitiveKind::CIRCLE);
    EXPECT_DOUBLE_EQ(primitives[0].centerX, 100.0);
    EXPECT_DOUBLE_EQ(primitives[0].centerY, -50.5);
    EXPECT_DOUBLE_EQ(primitives[0].radius, 8.865);
    EXPECT_EQ(primitives[0].layer, "HOLES");

    EXPECT_EQ(primitives[1].kind, PrimitiveKind::ARC);
    EXPECT_DOUBLE_EQ(primitives[1].startAngle, 0.0);
    EXPECT_DOUBLE_EQ(primitives[1].endAngle, 180.0);

    EXPECT_DOUBLE_EQ(primitives[2].radius, 2300.0);
    EXPECT_EQ(primitives[2].layer, "OUTLINE");

    auto ignored = reader.getIgnoredEntities();
    EXPECT_EQ(ignored["LINE"], 1);

    auto layers = reader.getLayerCounts();
    EXPECT_EQ(layers["HOLES"], 2);
    EXPECT_EQ(layers["OUTLINE"], 1);
}

TEST(DxfReaderTest, HandlesWindowsLineEndings) {
    std::string drawing = kDrawing;
    std::string crlf;
    for (char c : drawing) {
        if (c == '\n') {
            crlf += '\r';
        }
        crlf += c;
    }

    std::istringstream input(crlf);
    DxfReader reader;
    ASSERT_TRUE(reader.parse(input)) << reader.getLastError();
    EXPECT_EQ(reader.getPrimitives().size(), 3u);
}

TEST(DxfReaderTest, EntitiesOutsideEntitiesSectionAreIgnored) {
    std::istringstream input(
        "0\nSECTION\n2\nBLOCKS\n0\nCIRCLE\n10\n1\n20\n1\n40\n5\n0\nENDSEC\n"
        "0\nSECTION\n2\nENTITIES\n0\nENDSEC\n0\nEOF\n");
    DxfReader reader;
    ASSERT_TRUE(reader.parse(input));
    EXPECT_TRUE(reader.getPrimitives().empty());
}

TEST(DxfReaderTest, IncompleteEntityIsCounted) {
    std::istringstream input(
        "0\nSECTION\n2\nENTITIES\n0\nCIRCLE\n10\n1\n20\n1\n0\nENDSEC\n0\nEOF\n");
    DxfReader reader;
    ASSERT_TRUE(reader.parse(input));
    EXPECT_TRUE(reader.getPrimitives().empty());
    EXPECT_EQ(reader.getIgnoredEntities().at("INCOMPLETE"), 1);
}

TEST(DxfReaderTest, ArcWithoutBothAnglesIsIncomplete) {
    std::istringstream input(
        "0\nSECTION\n2\nENTITIES\n"
        "0\nARC\n10\n100\n20\n0\n40\n8.865\n50\n0\n"
        "0\nARC\n10\n200\n20\n0\n40\n8.865\n51\n180\n"
        "0\nARC\n10\n300\n20\n0\n40\n8.865\n50\n0\n51\nabc\n"
        "0\nCIRCLE\n10\n400\n20\n0\n40\n8.865\n"
        "0\nENDSEC\n0\nEOF\n");
    DxfReader reader;
    ASSERT_TRUE(reader.parse(input));
    ASSERT_EQ(reader.getPrimitives().size(), 1u);
    EXPECT_EQ(reader.getPrimitives()[0].kind, PrimitiveKind::CIRCLE);
    EXPECT_EQ(reader.getIgnoredEntities().at("INCOMPLETE"), 3);
}

TEST(DxfReaderTest, MalformedGroupCodeFails) {
    std::istringstream input(
        "0\nSECTION\n2\nENTITIES\nabc\nCIRCLE\n0\nENDSEC\n0\nEOF\n");
    DxfReader reader;
    EXPECT_FALSE(reader.parse(input));
    EXPECT_FALSE(reader.getLastError().empty());
}

TEST(DxfReaderTest, MissingEntitiesSectionFails) {
    std::istringstream empty("");
    DxfReader reader;
    EXPECT_FALSE(reader.parse(empty));

    std::istringstream headerOnly("0\nSECTION\n2\nHEADER\n0\nENDSEC\n0\nEOF\n");
    EXPECT_FALSE(reader.parse(headerOnly));
    EXPECT_NE(reader.getLastError().find("ENTITIES"), std::string::npos);
}

TEST(DxfReaderTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "dxf_reader_test.dxf";
    {
        std::ofstream file(path);
        file << kDrawing;
    }

    DxfReader reader;
    ASSERT_TRUE(reader.loadFromFile(path)) << reader.getLastError();
    EXPECT_EQ(reader.getPrimitives().size(), 3u);

    EXPECT_FALSE(reader.loadFromFile(path + ".missing"));
    EXPECT_TRUE(reader.getPrimitives().empty());
}
