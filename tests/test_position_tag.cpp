#include <gtest/gtest.h>
#include <doc_chunker/position_tag.h>
#include <doc_chunker/section.h>

using namespace doc_chunker;

class PositionTagTest : public ::testing::Test {
protected:
    PositionTag MakeTag(std::vector<int> pages, double left, double right,
                        double top, double bottom) {
        PositionTag tag;
        tag.pages = std::move(pages);
        tag.left = left;
        tag.right = right;
        tag.top = top;
        tag.bottom = bottom;
        return tag;
    }
};

TEST_F(PositionTagTest, FormatUsesOneBasedPages) {
    auto tag = MakeTag({0}, 72, 540.5, 100, 118.5);
    EXPECT_EQ(format_position_tag(tag), "@@1\t72.0\t540.5\t100.0\t118.5##");

    auto spanning = MakeTag({2, 3}, 10, 20, 30, 40);
    EXPECT_EQ(format_position_tag(spanning), "@@3-4\t10.0\t20.0\t30.0\t40.0##");
}

TEST_F(PositionTagTest, ExtractParsesEveryTagInOrder) {
    std::string blob = "Intro@@1\t10.0\t20.0\t30.0\t40.0##\nBody@@2-3\t1.5\t2.5\t3.5\t4.5##";
    auto tags = extract_positions(blob);

    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0], MakeTag({0}, 10, 20, 30, 40));
    EXPECT_EQ(tags[1].pages, (std::vector<int>{1, 2}));
    EXPECT_DOUBLE_EQ(tags[1].bottom, 4.5);
}

TEST_F(PositionTagTest, ExtractSkipsMalformedTags) {
    std::string blob = "a@@1\t10.0\t20.0##b@@1\t1.0.0\t2\t3\t4##c@@1--2\t1\t2\t3\t4##"
                       "d@@5\t1\t2\t3\t4##";
    auto tags = extract_positions(blob);

    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].pages, std::vector<int>{4});
}

TEST_F(PositionTagTest, ExtractFromUntaggedText) {
    EXPECT_TRUE(extract_positions("no tags here").empty());
    EXPECT_TRUE(extract_positions("").empty());
}

TEST_F(PositionTagTest, RemoveTagStripsAllTags) {
    std::string blob = "First@@1\t10.0\t20.0\t30.0\t40.0##\nSecond@@2\t1.0\t2.0\t3.0\t4.0##";
    EXPECT_EQ(remove_tag(blob), "First\nSecond");
    EXPECT_EQ(remove_tag("plain"), "plain");
}

TEST_F(PositionTagTest, VisibleTextStopsAtFirstAt) {
    EXPECT_EQ(visible_text("  Chapter 1 @@1\t1.0\t2.0\t3.0\t4.0##"), "Chapter 1");
    EXPECT_EQ(visible_text("no tag "), "no tag");
    EXPECT_EQ(visible_text("@@1\t1.0\t2.0\t3.0\t4.0##"), "");
}

TEST_F(PositionTagTest, FormattedTagRoundTripsThroughExtract) {
    auto tag = MakeTag({4, 5}, 12.5, 300, 48.5, 96);
    auto parsed = extract_positions("text" + format_position_tag(tag));

    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0], tag);
}

TEST_F(PositionTagTest, SectionPositionString) {
    EXPECT_EQ(Section::plain("x").position_string(), "");

    auto section = Section::with_position("x", MakeTag({0}, 1, 2, 3, 4));
    EXPECT_EQ(section.kind, Section::Kind::WithPosition);
    EXPECT_EQ(section.position_string(), "@@1\t1.0\t2.0\t3.0\t4.0##");
}

TEST_F(PositionTagTest, NegativeCoordinatesRoundTrip) {
    auto tag = MakeTag({0}, -3.5, 200, -12, 40);
    std::string text = "Header" + format_position_tag(tag);

    auto parsed = extract_positions(text);
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0], tag);
    EXPECT_EQ(remove_tag(text), "Header");

    EXPECT_TRUE(extract_positions("x@@1\t-\t2\t3\t4##").empty());
}
