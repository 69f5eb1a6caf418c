#include <gtest/gtest.h>
#include "AsciiReport.hpp"
#include "KeySpace.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

// Every block glyph is three bytes of UTF-8
static size_t glyphCount(const std::string& s) {
    return s.size() / 3;
}

TEST(AsciiReportTest, CanonicalLayoutPicture) {
    const KeySpace& ks = KeySpace::standard();
    std::vector<std::string> lines = splitLines(formatLayoutAscii(ks, ks.canonicalLayout()));

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "1 2 3 4 5 6 7 8 9 0 - =");
    EXPECT_EQ(lines[1], " q w e r t y u i o p [ ] \\");
    EXPECT_EQ(lines[2], "  a s d f g h j k l ; '");
    EXPECT_EQ(lines[3], "   z x c v b n m , . /");
}

TEST(AsciiReportTest, LayoutStringIsTheLayout) {
    EXPECT_EQ(layoutString("qwerty"), "qwerty");
}

TEST(SparklineTest, RisingSeriesUsesEveryLevel) {
    EXPECT_EQ(sparkline({0, 1, 2, 3, 4, 5, 6, 7}), "▁▂▃▄▅▆▇█");
}

TEST(SparklineTest, FlatSeriesIsLowestBlock) {
    EXPECT_EQ(sparkline({3.0, 3.0, 3.0}), "▁▁▁");
    EXPECT_EQ(glyphCount(sparkline(std::vector<double>(100, 1.0), 60)), 60u);
}

TEST(SparklineTest, LongSeriesIsDownsampled) {
    std::vector<double> values;
    for (int i = 0; i < 120; ++i) values.push_back(i);

    std::string line = sparkline(values, 60);
    EXPECT_EQ(glyphCount(line), 60u);
    EXPECT_EQ(line.substr(0, 3), "▁");
}

TEST(SparklineTest, EmptySeries) {
    EXPECT_EQ(sparkline({}), "");
}

TEST(AsciiReportTest, KeyCostGrid) {
    const KeySpace& ks = KeySpace::standard();
    KeyCostMap costs;
    costs['a'] = 45.0;
    costs['/'] = 1234.4;

    std::vector<std::string> lines = splitLines(formatKeyCostGrid(ks, costs));

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[2].find("a:     45"), std::string::npos);
    EXPECT_NE(lines[3].find("/:   1234"), std::string::npos);
    // Missing keys show zero
    EXPECT_NE(lines[0].find("1:      0"), std::string::npos);
}

TEST(AsciiReportTest, WritesLayoutFile) {
    KeySpace ks("abcdef", {3, 3});
    std::string path = ::testing::TempDir() + "layoutga_best_layout.txt";

    writeLayoutFile(path, ks, "fedcba");

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "fedcba\n\nf e d\n c b a\n");
}

TEST(AsciiReportTest, UnwritableLayoutFileThrows) {
    EXPECT_THROW(writeLayoutFile("/nonexistent/dir/best_layout.txt", KeySpace::standard(),
                                 KeySpace::standard().canonicalLayout()),
                 std::runtime_error);
}
