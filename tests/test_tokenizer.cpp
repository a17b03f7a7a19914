#include <gtest/gtest.h>
#include <doc_chunker/tiktoken_tokenizer.h>
#include <doc_chunker/tokenizer.h>
#include <filesystem>
#include <sstream>

using namespace doc_chunker;

TEST(WordTokenizerTest, CountsWordsAndPunctuation) {
    WordTokenizer tokenizer;

    EXPECT_EQ(tokenizer.count_tokens("Hello, world!"), 4u);
    EXPECT_EQ(tokenizer.count_tokens("第一章 总则"), 5u);
    EXPECT_EQ(tokenizer.count_tokens(""), 0u);
    EXPECT_EQ(tokenizer.count_tokens(" \n\t　"), 0u);
}

TEST(WordTokenizerTest, TokenizeLowercasesAndSpaces) {
    WordTokenizer tokenizer;

    EXPECT_EQ(tokenizer.tokenize("Hello, World"), "hello , world");
    EXPECT_EQ(tokenizer.tokenize("第一条"), "第 一 条");
}

TEST(WordTokenizerTest, FineGrainedSplitsLettersFromDigits) {
    WordTokenizer tokenizer;

    EXPECT_EQ(tokenizer.fine_grained_tokenize("abc123"), "abc 123");
    EXPECT_EQ(tokenizer.fine_grained_tokenize("hello , world"), "hello , world");
}

TEST(WordTokenizerTest, Deterministic) {
    WordTokenizer tokenizer;
    std::string text = "Section 4.2: 规则 apply to 12 items.";

    EXPECT_EQ(tokenizer.count_tokens(text), tokenizer.count_tokens(text));
    EXPECT_EQ(tokenizer.tokenize(text), tokenizer.tokenize(text));
}

class TiktokenTokenizerTest : public ::testing::Test {
protected:
    // "Hello", ",", " world", "!"
    std::unique_ptr<TiktokenTokenizer> MakeTokenizer() {
        std::istringstream vocabulary(
            "SGVsbG8= 1000\n"
            "LA== 1001\n"
            "IHdvcmxk 1002\n"
            "IQ== 1003\n");
        return std::make_unique<TiktokenTokenizer>(vocabulary);
    }
};

TEST_F(TiktokenTokenizerTest, LoadsVocabulary) {
    auto tokenizer = MakeTokenizer();
    EXPECT_EQ(tokenizer->vocabulary_size(), 4u);
}

TEST_F(TiktokenTokenizerTest, EncodesLongestMatch) {
    auto tokenizer = MakeTokenizer();
    auto ids = tokenizer->encode("Hello, world!");

    EXPECT_EQ(ids, (std::vector<int>{1000, 1001, 1002, 1003}));
    EXPECT_EQ(tokenizer->decode(ids), "Hello, world!");
    EXPECT_EQ(tokenizer->count_tokens("Hello, world!"), 4u);
}

TEST_F(TiktokenTokenizerTest, UnknownBytesFallBack) {
    auto tokenizer = MakeTokenizer();
    auto ids = tokenizer->encode("Hello?");

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[1], static_cast<int>('?'));
    EXPECT_EQ(tokenizer->decode(ids), "Hello?");
}

TEST_F(TiktokenTokenizerTest, TokenizeDropsWhitespace) {
    auto tokenizer = MakeTokenizer();
    EXPECT_EQ(tokenizer->tokenize("Hello, world!"), "Hello , world !");
}

TEST_F(TiktokenTokenizerTest, EmptyVocabularyThrows) {
    std::istringstream empty("");
    EXPECT_THROW(TiktokenTokenizer tokenizer(empty), std::runtime_error);
    EXPECT_THROW(TiktokenTokenizer::from_file("/nonexistent/vocab.tiktoken"), std::runtime_error);
}

TEST_F(TiktokenTokenizerTest, PublishedVocabulary) {
    std::string path = std::string(DOC_CHUNKER_TEST_DATA_DIR) + "/cl100k_base.tiktoken";
    if (!std::filesystem::exists(path)) {
        GTEST_SKIP() << "Vocabulary file not found: " << path;
    }

    auto tokenizer = TiktokenTokenizer::from_file(path);
    EXPECT_GT(tokenizer->vocabulary_size(), 100000u);
    EXPECT_EQ(tokenizer->count_tokens("Hello, world!"), 4u);
}
