#include <gtest/gtest.h>
#include <doc_chunker/bullet_patterns.h>
#include <algorithm>

using namespace doc_chunker;

namespace {
constexpr int kChineseLegal = 0;
constexpr int kEnglishKeywords = 3;
constexpr int kMarkdown = 4;
}

TEST(PatternRegistryTest, CatalogShape) {
    const auto& registry = PatternRegistry::instance();

    ASSERT_EQ(registry.body_styles().size(), 5u);
    EXPECT_EQ(registry.body_style(kChineseLegal).size(), 5u);
    EXPECT_EQ(registry.body_style(kMarkdown).size(), 6u);
    EXPECT_EQ(registry.question_style().size(), 11u);
    EXPECT_EQ(&registry, &PatternRegistry::instance());
}

TEST(PatternRegistryTest, NotBulletRules) {
    EXPECT_TRUE(not_bullet("0 items in stock"));
    EXPECT_TRUE(not_bullet("3 个月"));
    EXPECT_TRUE(not_bullet("12......"));
    EXPECT_FALSE(not_bullet("1. Introduction"));
    EXPECT_FALSE(not_bullet("第一章 总则"));
}

TEST(PatternRegistryTest, NotTitle) {
    EXPECT_FALSE(not_title("Introduction"));
    EXPECT_FALSE(not_title("第三条 本办法自发布之日起施行，"));
    EXPECT_TRUE(not_title("Hello, world"));
    EXPECT_TRUE(not_title("one two three four five six seven eight nine ten eleven twelve thirteen"));
    EXPECT_TRUE(not_title("abcdefghijklmnopqrstuvwxyzabcdefgh"));
}

TEST(BulletsCategoryTest, ChineseLegalDocument) {
    std::vector<std::string> texts = {
        "第一章 总则",
        "第一条 为了规范管理，制定本办法。",
        "第二条 本办法适用于全体员工。",
        "第二章 附则",
    };
    EXPECT_EQ(bullets_category(texts), kChineseLegal);
}

TEST(BulletsCategoryTest, EnglishKeywords) {
    std::vector<std::string> texts = {
        "Chapter I Introduction",
        "Section 1 Scope",
        "Article 2 Terms",
        "plain text follows",
    };
    EXPECT_EQ(bullets_category(texts), kEnglishKeywords);
}

TEST(BulletsCategoryTest, MarkdownRegardlessOfOrder) {
    std::vector<std::string> texts = {"# Title", "## Sub", "body text", "### Deep"};
    EXPECT_EQ(bullets_category(texts), kMarkdown);

    std::reverse(texts.begin(), texts.end());
    EXPECT_EQ(bullets_category(texts), kMarkdown);

    std::rotate(texts.begin(), texts.begin() + 1, texts.end());
    EXPECT_EQ(bullets_category(texts), kMarkdown);
}

TEST(BulletsCategoryTest, TieGoesToFirstStyle) {
    // "第一章" is a heading in both the legal and the mixed catalogs
    EXPECT_EQ(bullets_category({"第一章 总则"}), kChineseLegal);
}

TEST(BulletsCategoryTest, NoMatch) {
    EXPECT_EQ(bullets_category({"just prose", "more prose"}), -1);
    EXPECT_EQ(bullets_category({}), -1);
}

TEST(AssignLevelTest, RuleIndexTitleAndBody) {
    EXPECT_EQ(assign_level(kChineseLegal, Section::plain("第一章 总则")), 1);
    EXPECT_EQ(assign_level(kChineseLegal, Section::plain("第十二条 内容")), 3);
    EXPECT_EQ(assign_level(kChineseLegal, Section::plain("（一）说明")), 4);
    EXPECT_EQ(assign_level(kChineseLegal, Section::with_layout("Overview", "title")), 5);
    EXPECT_EQ(assign_level(kChineseLegal, Section::plain("Body text.")), 6);
    EXPECT_EQ(assign_level(kChineseLegal, Section::with_layout("This is, a sentence", "title")), 6);
}

TEST(AssignLevelTest, WideSpaceIsNormalized) {
    EXPECT_EQ(assign_level(kChineseLegal, Section::plain("　第一章　总则")), 1);
}

TEST(AssignLevelTest, Markdown) {
    EXPECT_EQ(assign_level(kMarkdown, Section::plain("# Title")), 0);
    EXPECT_EQ(assign_level(kMarkdown, Section::plain("## Sub")), 1);
    EXPECT_EQ(assign_level(kMarkdown, Section::plain("### Deep")), 2);
    // "^###" also takes deeper headings
    EXPECT_EQ(assign_level(kMarkdown, Section::plain("#### Deeper")), 2);
    EXPECT_EQ(assign_level(kMarkdown, Section::plain("text")), 7);
}

TEST(TitleFrequencyTest, MostFrequentHeadingLevel) {
    std::vector<Section> sections = {
        Section::plain("第一章 总则"),
        Section::plain("第一条 内容"),
        Section::plain("第二条 内容"),
        Section::plain("plain body"),
    };
    auto [most, levels] = title_frequency(kChineseLegal, sections);

    EXPECT_EQ(most, 3);
    EXPECT_EQ(levels, (std::vector<int>{1, 3, 3, 6}));
}

TEST(TitleFrequencyTest, NegativeStyle) {
    auto [most, levels] = title_frequency(-1, {Section::plain("a"), Section::plain("b")});

    EXPECT_EQ(most, -1);
    EXPECT_EQ(levels, (std::vector<int>{-1, -1}));
}

TEST(QBulletsTest, CategoryReturnsPatternText) {
    auto [index, pattern] = qbullets_category({"1. What is it?", "2. How does it work?"});

    EXPECT_EQ(index, 5);
    EXPECT_EQ(pattern, "([0-9]{1,2})[. 、]");
    EXPECT_EQ(qbullets_category({"no numbering"}).first, -1);
}

class HasQBulletTest : public ::testing::Test {
protected:
    const std::string pattern_ = "([0-9]{1,2})[. 、]";

    QaBox MakeBox(const std::string& text, double x0, double top) {
        QaBox box;
        box.text = text;
        box.x0 = x0;
        box.top = top;
        return box;
    }
};

TEST_F(HasQBulletTest, AcceptsNextQuestion) {
    QaBox last = MakeBox("The answer is short.", 50, 150);
    std::vector<double> x0s = {50};

    auto result = has_qbullet(pattern_, MakeBox("2. How does it work", 50, 200), last, 1, false, x0s);

    EXPECT_TRUE(result.is_question);
    ASSERT_TRUE(result.index.has_value());
    EXPECT_EQ(*result.index, 2);
    EXPECT_EQ(x0s.size(), 2u);
}

TEST_F(HasQBulletTest, RejectsLineTooCloseToPrevious) {
    QaBox last = MakeBox("The answer is short.", 50, 150);
    std::vector<double> x0s = {50};

    auto result = has_qbullet(pattern_, MakeBox("2. How", 50, 160), last, 1, false, x0s);

    EXPECT_FALSE(result.is_question);
    ASSERT_TRUE(result.index.has_value());
    EXPECT_EQ(*result.index, 1);
    EXPECT_EQ(x0s.size(), 1u);
}

TEST_F(HasQBulletTest, RejectsAfterTrailingColon) {
    QaBox last = MakeBox("Steps:", 50, 150);
    std::vector<double> x0s;

    auto result = has_qbullet(pattern_, MakeBox("1. Open the box", 50, 200), last, std::nullopt,
                              false, x0s);
    EXPECT_FALSE(result.is_question);
}

TEST_F(HasQBulletTest, FillsMissingCoordinates) {
    QaBox last;
    last.text = "Intro";
    std::vector<double> x0s;

    has_qbullet(pattern_, MakeBox("1. What", 40, 90), last, std::nullopt, true, x0s);

    ASSERT_TRUE(last.x0.has_value());
    EXPECT_DOUBLE_EQ(*last.x0, 40);
    EXPECT_DOUBLE_EQ(*last.top, 90);
}

TEST(BulletsCategoryTest, VeryLongMarkdownLine) {
    std::string heading = "### " + std::string(100000, 'a');

    EXPECT_EQ(bullets_category({"# Title", heading}), kMarkdown);
    EXPECT_EQ(assign_level(kMarkdown, Section::plain(heading)), 2);
}
