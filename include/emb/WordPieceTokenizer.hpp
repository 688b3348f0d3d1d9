#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// One encoded sequence, already padded to the batch width.
struct Encoding {
    std::vector<int64_t> input_ids;
    std::vector<int64_t> attention_mask;   // 1 = real token, 0 = padding
    std::vector<int64_t> token_type_ids;
};

// BERT uncased WordPiece (ASCII basic tokenizer + greedy longest-match).
class WordPieceTokenizer {
public:
    // std::runtime_error if the file is unreadable or lacks [CLS]/[SEP]/[UNK]/[PAD]
    void load_vocab(const std::string& vocab_path);

    // [CLS] ... [SEP], at most max_len ids, no padding
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // every sequence padded to the longest one in the batch
    std::vector<Encoding> encode_batch(const std::vector<std::string>& texts, size_t max_len) const;

    std::vector<std::string> tokenize(const std::string& text) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t pad_id() const { return m_pad; }
    int64_t unk_id() const { return m_unk; }
    int64_t cls_id() const { return m_cls; }
    int64_t sep_id() const { return m_sep; }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    int64_t m_pad = -1;
    int64_t m_unk = -1;
    int64_t m_cls = -1;
    int64_t m_sep = -1;

    // words longer than this map straight to [UNK]
    static constexpr size_t kMaxCharsPerWord = 100;

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<std::string>& out) const;
};

} // namespace emb
