#include <gtest/gtest.h>
#include <doc_chunker/media_context.h>

using namespace doc_chunker;

class MediaContextTest : public ::testing::Test {
protected:
    WordTokenizer tokenizer_;

    ChunkDocument Text(const std::string& text) {
        ChunkDocument doc;
        tokenize(doc, text, tokenizer_);
        return doc;
    }

    ChunkDocument Media(const std::string& text, const std::string& type) {
        ChunkDocument doc = Text(text);
        doc.doc_type_kwd = type;
        return doc;
    }

    ChunkDocument At(ChunkDocument doc, double page, double top) {
        add_positions(doc, {PositionBox{page, 0, 100, top, top + 10}});
        return doc;
    }
};

TEST_F(MediaContextTest, SplitSentencesKeepsTerminators) {
    auto sentences = split_sentences("One. Two! 三。tail");

    ASSERT_EQ(sentences.size(), 4u);
    EXPECT_EQ(sentences[0], "One.");
    EXPECT_EQ(sentences[1], " Two!");
    EXPECT_EQ(sentences[2], " 三。");
    EXPECT_EQ(sentences[3], "tail");
}

TEST_F(MediaContextTest, TrimToTokensIncludesCrossingSentence) {
    std::string text = "First one. Second one. Third one.";

    EXPECT_EQ(trim_to_tokens(text, 2, tokenizer_), "First one.");
    EXPECT_EQ(trim_to_tokens(text, 4, tokenizer_), "First one. Second one.");
    EXPECT_EQ(trim_to_tokens(text, 2, tokenizer_, true), " Third one.");
    EXPECT_EQ(trim_to_tokens(text, 0, tokenizer_), "");
}

TEST_F(MediaContextTest, ContextStopsAtOtherMedia) {
    std::vector<ChunkDocument> docs = {
        Text("Before text."),
        Media("<table><tr><td>x</td></tr></table>", "table"),
        Text("After text."),
        Media("", "image"),
        Text("Last."),
    };

    attach_media_context(docs, tokenizer_, 10, 10);

    ASSERT_EQ(docs.size(), 5u);
    EXPECT_EQ(docs[1].content_with_weight,
              "Before text.\n<table><tr><td>x</td></tr></table>\nAfter text.");
    EXPECT_EQ(docs[3].content_with_weight, "After text.\nLast.");
    EXPECT_EQ(docs[3].content_ltks, "after text . last .");
    EXPECT_EQ(docs[0].content_with_weight, "Before text.");
}

TEST_F(MediaContextTest, ContextRespectsBudget) {
    std::vector<ChunkDocument> docs = {
        Text("First one. Second one."),
        Media("<table></table>", "table"),
    };

    attach_media_context(docs, tokenizer_, 2, 0);

    EXPECT_EQ(docs[1].content_with_weight, " Second one.\n<table></table>");
}

TEST_F(MediaContextTest, ZeroBudgetsLeaveDocumentsAlone) {
    std::vector<ChunkDocument> docs = {Text("Before."), Media("<table></table>", "table")};

    attach_media_context(docs, tokenizer_, 0, 0);

    EXPECT_EQ(docs[1].content_with_weight, "<table></table>");
}

TEST_F(MediaContextTest, PositionedDocumentsFollowReadingOrder) {
    std::vector<ChunkDocument> docs = {
        At(Text("Page two."), 1, 10),
        At(Media("<table></table>", "table"), 0, 50),
        At(Text("Page one top."), 0, 5),
        Text("Unplaced."),
    };

    attach_media_context(docs, tokenizer_, 100, 0);

    ASSERT_EQ(docs.size(), 4u);
    EXPECT_EQ(docs[0].content_with_weight, "Page one top.");
    EXPECT_EQ(docs[1].content_with_weight,
              "Page one top.\n<table></table>\nPage two.\nUnplaced.");
    EXPECT_EQ(docs[2].content_with_weight, "Page two.");
    EXPECT_EQ(docs[3].content_with_weight, "Unplaced.");
}
