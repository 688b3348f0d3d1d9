#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "emb/WordPieceTokenizer.hpp"

using namespace emb;

// ids follow line order: [PAD]=0 [UNK]=1 [CLS]=2 [SEP]=3 ...
static std::string write_vocab(const char* name) {
    auto dir = std::filesystem::temp_directory_path() / "netmatch_tokenizer_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;

    std::ofstream out(path);
    for (const char* tok : {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "senior", "engineer", "at",
                            "open", "##ai", "##s", "ml", ",", "!", "py", "##torch"}) {
        out << tok << "\n";
    }
    return path.string();
}

TEST(TokenizerTest, SplitsWordsAndPunctuation) {
    WordPieceTokenizer tok;
    tok.load_vocab(write_vocab("vocab.txt"));

    EXPECT_EQ(tok.vocab_size(), 15u);
    EXPECT_EQ(tok.tokenize("Senior Engineers at OpenAI!"),
              (std::vector<std::string>{"senior", "engineer", "##s", "at", "open", "##ai", "!"}));
}

TEST(TokenizerTest, UnmatchedSuffixMakesWholeWordUnknown) {
    WordPieceTokenizer tok;
    tok.load_vocab(write_vocab("vocab.txt"));

    EXPECT_EQ(tok.tokenize("PyTorch pyxyz"),
              (std::vector<std::string>{"py", "##torch", "[UNK]"}));
}

TEST(TokenizerTest, EncodeWrapsInClsSep) {
    WordPieceTokenizer tok;
    tok.load_vocab(write_vocab("vocab.txt"));

    EXPECT_EQ(tok.encode("ML engineer", 16), (std::vector<int64_t>{2, 10, 5, 3}));
    EXPECT_EQ(tok.encode("", 16), (std::vector<int64_t>{2, 3}));
}

TEST(TokenizerTest, EncodeTruncatesToMaxLen) {
    WordPieceTokenizer tok;
    tok.load_vocab(write_vocab("vocab.txt"));

    auto ids = tok.encode("senior engineer at openai", 4);
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids.front(), tok.cls_id());
    EXPECT_EQ(ids.back(), tok.sep_id());
    EXPECT_THROW(tok.encode("x", 1), std::invalid_argument);
}

TEST(TokenizerTest, BatchPadsToWidestSequence) {
    WordPieceTokenizer tok;
    tok.load_vocab(write_vocab("vocab.txt"));

    auto batch = tok.encode_batch({"ml", "senior ml engineer"}, 32);
    ASSERT_EQ(batch.size(), 2u);
    ASSERT_EQ(batch[0].input_ids.size(), 5u);
    ASSERT_EQ(batch[1].input_ids.size(), 5u);

    EXPECT_EQ(batch[0].input_ids, (std::vector<int64_t>{2, 10, 3, 0, 0}));
    EXPECT_EQ(batch[0].attention_mask, (std::vector<int64_t>{1, 1, 1, 0, 0}));
    EXPECT_EQ(batch[1].attention_mask, (std::vector<int64_t>{1, 1, 1, 1, 1}));
    EXPECT_EQ(batch[1].token_type_ids, (std::vector<int64_t>(5, 0)));
}

TEST(TokenizerTest, RejectsUnusableVocab) {
    WordPieceTokenizer tok;
    EXPECT_THROW(tok.encode("hello", 8), std::runtime_error);
    EXPECT_THROW(tok.load_vocab("/nonexistent/vocab.txt"), std::runtime_error);

    auto dir = std::filesystem::temp_directory_path() / "netmatch_tokenizer_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "no_specials.txt";
    {
        std::ofstream out(path);
        out << "hello\nworld\n";
    }
    EXPECT_THROW(tok.load_vocab(path.string()), std::runtime_error);
}
