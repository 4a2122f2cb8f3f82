#include "engine/tokenizer.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cadence;
using namespace cadence::engine;

namespace {

    class TokenizerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            m_path = std::filesystem::temp_directory_path() / "cadence_tokenizer_vocab.txt";
            std::ofstream out(m_path);
            for (int i = 0; i < 103; ++i) out << "[unused" << i << "]\n";
            out << "lo\n-\nfi\ndream\n##y\n"; // ids 103..107
        }

        void TearDown() override {
            std::filesystem::remove(m_path);
        }

        std::filesystem::path m_path;
    };

}

TEST_F(TokenizerTest, SplitsPunctuationAndWordPieces)
{
    Tokenizer tokenizer(m_path.string());
    EXPECT_EQ(tokenizer.vocab_size(), 108u);
    EXPECT_EQ(tokenizer.encode("Lo-fi dreamy"),
              (std::vector<int64_t>{Tokenizer::kCls, 103, 104, 105, 106, 107, Tokenizer::kSep}));
}

TEST_F(TokenizerTest, UnknownWordsMapToUnk)
{
    Tokenizer tokenizer(m_path.string());
    EXPECT_EQ(tokenizer.encode("xyz"), (std::vector<int64_t>{Tokenizer::kCls, Tokenizer::kUnk, Tokenizer::kSep}));
}

TEST_F(TokenizerTest, TruncatesToMaxLength)
{
    Tokenizer tokenizer(m_path.string());
    auto ids = tokenizer.encode("lo - fi dream", 4);
    EXPECT_EQ(ids, (std::vector<int64_t>{Tokenizer::kCls, 103, 104, Tokenizer::kSep}));
}

TEST(TokenizerLoadTest, MissingVocabThrows)
{
    EXPECT_THROW(Tokenizer("/nonexistent/cadence/vocab.txt"), EmbedderError);
}
