#include <gtest/gtest.h>
#include <doc_chunker/naive_merger.h>

using namespace doc_chunker;

class NaiveMergerTest : public ::testing::Test {
protected:
    WordTokenizer tokenizer_;

    MergeOptions Options(size_t chunk_tokens, int overlap = 0,
                         const std::string& delimiter = "\n。；！？") {
        MergeOptions options;
        options.chunk_token_num = chunk_tokens;
        options.overlapped_percent = overlap;
        options.delimiter = delimiter;
        return options;
    }

    PositionTag Tag(int page) {
        PositionTag tag;
        tag.pages = {page};
        tag.left = 10;
        tag.right = 20;
        tag.top = 30;
        tag.bottom = 40;
        return tag;
    }
};

TEST_F(NaiveMergerTest, DelimiterParsing) {
    EXPECT_EQ(custom_delimiters("`\n\n`。`##`"), (std::vector<std::string>{"\n\n", "##"}));
    EXPECT_EQ(custom_delimiters("`abc``d`"), (std::vector<std::string>{"abc", "d"}));
    EXPECT_TRUE(custom_delimiters("\n。；！？").empty());

    EXPECT_EQ(get_delimiters("\n。；！？"), "\n|。|；|！|？");
    EXPECT_EQ(get_delimiters("`##`;"), "##|;");
    EXPECT_EQ(get_delimiters("?."), "\\?|\\.");
    EXPECT_EQ(get_delimiters(""), "");
}

TEST_F(NaiveMergerTest, RespectsTokenBudget) {
    std::vector<Section> sections = {
        Section::plain("one two three"),
        Section::plain("four five six"),
        Section::plain("seven eight"),
        Section::plain("nine"),
    };

    auto chunks = naive_merge(sections, tokenizer_, Options(5));

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "\none two three\nfour five six");
    EXPECT_EQ(chunks[0].token_count, 6u);
    EXPECT_EQ(chunks[1].text, "\nseven eight\nnine");
    EXPECT_EQ(chunks[1].token_count, 3u);
}

TEST_F(NaiveMergerTest, OverlapSeedsNextChunk) {
    std::vector<Section> sections = {
        Section::plain("alpha beta gamma"),
        Section::plain("delta"),
    };

    auto chunks = naive_merge(sections, tokenizer_, Options(4, 50));

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[1].text, "eta gamma\ndelta");
    EXPECT_EQ(chunks[1].token_count, 1u);
}

TEST_F(NaiveMergerTest, PositionTagOnlyForLongFragments) {
    std::vector<Section> long_section = {
        Section::with_position("This sentence has exactly eight plain word tokens", Tag(0)),
    };
    auto chunks = naive_merge(long_section, tokenizer_, Options(128));

    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_EQ(chunks[0].position_tags.size(), 1u);
    EXPECT_EQ(chunks[0].position_tags[0], Tag(0));
    EXPECT_NE(chunks[0].text.find("@@1\t10.0\t20.0\t30.0\t40.0##"), std::string::npos);

    std::vector<Section> short_section = {Section::with_position("Too short", Tag(0))};
    chunks = naive_merge(short_section, tokenizer_, Options(128));

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "\nToo short");
    EXPECT_TRUE(chunks[0].position_tags.empty());
}

TEST_F(NaiveMergerTest, DuplicateTagIsNotRepeated) {
    std::string body = "This sentence has exactly eight plain word tokens";
    std::vector<Section> sections = {
        Section::with_position(body, Tag(1)),
        Section::with_position(body, Tag(1)),
    };

    auto chunks = naive_merge(sections, tokenizer_, Options(128));

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].position_tags.size(), 1u);
}

TEST_F(NaiveMergerTest, CustomDelimiterSplitsEveryPiece) {
    std::vector<Section> sections = {Section::plain("a\n\nb\n\nc")};

    auto chunks = naive_merge(sections, tokenizer_, Options(128, 0, "`\n\n`"));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].text, "\na");
    EXPECT_EQ(chunks[1].text, "\nb");
    EXPECT_EQ(chunks[2].text, "\nc");
}

TEST_F(NaiveMergerTest, CustomDelimiterKeepsEmptyPieces) {
    std::vector<Section> sections = {Section::plain("a\n\n\n\nb")};

    auto chunks = naive_merge(sections, tokenizer_, Options(128, 0, "`\n\n`"));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[1].text, "\n");
    EXPECT_EQ(chunks[1].token_count, 0u);
}

TEST_F(NaiveMergerTest, EmptyInput) {
    EXPECT_TRUE(naive_merge({}, tokenizer_).empty());
}

TEST_F(NaiveMergerTest, ImageMergeRequiresMatchingSizes) {
    std::vector<Section> sections = {Section::plain("a b"), Section::plain("c d")};

    EXPECT_TRUE(naive_merge_with_images(sections, {Image()}, tokenizer_).empty());

    auto chunks = naive_merge_with_images(sections, {Image(), Image()}, tokenizer_);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_FALSE(chunks[0].image);
}

TEST_F(NaiveMergerTest, ImageMergeStacksDistinctImages) {
    auto context = MupdfContext::create();
    Image top = Image::create(context, 4, 2, 255);
    Image bottom = Image::create(context, 3, 5, 0);
    std::vector<Section> sections = {Section::plain("a b"), Section::plain("c d")};

    auto chunks = naive_merge_with_images(sections, {top, bottom}, tokenizer_, Options(128));

    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_TRUE(chunks[0].image);
    EXPECT_EQ(chunks[0].image.height(), 7);
    EXPECT_EQ(chunks[0].image.width(), 4);
}

TEST_F(NaiveMergerTest, ImageMergeKeepsRepeatedImageOnce) {
    auto context = MupdfContext::create();
    Image picture = Image::create(context, 4, 2, 128);
    Image twin = Image::create(context, 4, 2, 128);
    std::vector<Section> sections = {Section::plain("a b"), Section::plain("c d")};

    auto same = naive_merge_with_images(sections, {picture, picture}, tokenizer_, Options(128));
    ASSERT_EQ(same.size(), 1u);
    EXPECT_TRUE(same[0].image.same_as(picture));
    EXPECT_EQ(same[0].image.height(), 2);

    auto identical = naive_merge_with_images(sections, {picture, twin}, tokenizer_, Options(128));
    ASSERT_EQ(identical.size(), 1u);
    EXPECT_EQ(identical[0].image.height(), 2);
}

TEST_F(NaiveMergerTest, ImageMergeCustomDelimiterKeepsSectionImage) {
    auto context = MupdfContext::create();
    Image first = Image::create(context, 2, 2, 10);
    Image second = Image::create(context, 2, 3, 20);
    std::vector<Section> sections = {Section::plain("a##b"), Section::plain("c")};

    auto chunks = naive_merge_with_images(sections, {first, second}, tokenizer_,
                                          Options(128, 0, "`##`"));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].text, "\na");
    EXPECT_TRUE(chunks[0].image.same_as(first));
    EXPECT_TRUE(chunks[1].image.same_as(first));
    EXPECT_TRUE(chunks[2].image.same_as(second));
}

TEST_F(NaiveMergerTest, OverlapPercentOutOfRangeIsClamped) {
    std::vector<Section> sections = {
        Section::plain("one two three"),
        Section::plain("four five six"),
        Section::plain("seven eight"),
        Section::plain("nine"),
    };

    auto high = naive_merge(sections, tokenizer_, Options(5, 150));
    ASSERT_EQ(high.size(), 4u);
    EXPECT_EQ(high[1].text, "\none two three\nfour five six");
    EXPECT_EQ(high[1].token_count, 3u);

    auto negative = naive_merge(sections, tokenizer_, Options(5, -20));
    auto plain = naive_merge(sections, tokenizer_, Options(5));
    ASSERT_EQ(negative.size(), plain.size());
    for (size_t i = 0; i < plain.size(); ++i) {
        EXPECT_EQ(negative[i].text, plain[i].text);
    }
}

TEST_F(NaiveMergerTest, DocxMergeClosesPastBudget) {
    std::vector<std::pair<std::string, Image>> sections = {
        {"a b", Image()},
        {"c d", Image()},
        {"e", Image()},
    };

    auto chunks = naive_merge_docx(sections, tokenizer_, Options(3));

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "\na b\nc d");
    EXPECT_EQ(chunks[0].token_count, 4u);
    EXPECT_EQ(chunks[1].text, "\ne");
}

TEST_F(NaiveMergerTest, DocxCustomDelimiterSkipsEmptyPieces) {
    std::vector<std::pair<std::string, Image>> sections = {{"a##b####c", Image()}};

    auto chunks = naive_merge_docx(sections, tokenizer_, Options(128, 0, "`##`"));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].text, "\nc");
}
