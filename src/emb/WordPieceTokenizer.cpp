#include "emb/WordPieceTokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <stdexcept>

namespace emb {

static bool is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// ASCII punctuation as BERT defines it; bytes >= 0x80 stay inside words
static bool is_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
           (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

void WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) throw std::runtime_error("cannot open vocab: " + vocab_path);

    std::vector<std::string> id_to_tok;
    std::unordered_map<std::string, int64_t> tok_to_id;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        tok_to_id.emplace(line, static_cast<int64_t>(id_to_tok.size()));
        id_to_tok.push_back(line);
    }

    auto special = [&](const char* tok) {
        auto it = tok_to_id.find(tok);
        if (it == tok_to_id.end()) {
            throw std::runtime_error(std::string("vocab ") + vocab_path + " has no " + tok + " token");
        }
        return it->second;
    };

    m_pad = special("[PAD]");
    m_unk = special("[UNK]");
    m_cls = special("[CLS]");
    m_sep = special("[SEP]");
    m_id_to_tok = std::move(id_to_tok);
    m_tok_to_id = std::move(tok_to_id);
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;

    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (is_ws(c) || c < 32) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else if (is_punct(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
            words.emplace_back(1, ch);
        } else {
            cur.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > kMaxCharsPerWord) {
        out.push_back("[UNK]");
        return;
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        bool found = false;

        for (; end > start; --end) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub.insert(0, "##");
            if (m_tok_to_id.count(sub)) {
                pieces.push_back(std::move(sub));
                found = true;
                break;
            }
        }

        // whole word becomes [UNK] if any suffix cannot be matched
        if (!found) {
            out.push_back("[UNK]");
            return;
        }
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : basic_tokenize(text)) wordpiece(w, out);
    return out;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (m_tok_to_id.empty()) throw std::runtime_error("WordPieceTokenizer: vocab not loaded");
    if (max_len < 2) throw std::invalid_argument("WordPieceTokenizer: max_len must be >= 2");

    std::vector<int64_t> ids;
    ids.reserve(std::min<size_t>(max_len, 64));
    ids.push_back(m_cls);

    for (const auto& tok : tokenize(text)) {
        if (ids.size() + 1 >= max_len) break;  // room for [SEP]
        auto it = m_tok_to_id.find(tok);
        ids.push_back(it == m_tok_to_id.end() ? m_unk : it->second);
    }

    ids.push_back(m_sep);
    return ids;
}

std::vector<Encoding> WordPieceTokenizer::encode_batch(const std::vector<std::string>& texts, size_t max_len) const {
    std::vector<Encoding> out;
    out.reserve(texts.size());

    size_t width = 0;
    for (const auto& t : texts) {
        Encoding e;
        e.input_ids = encode(t, max_len);
        width = std::max(width, e.input_ids.size());
        out.push_back(std::move(e));
    }

    for (auto& e : out) {
        const size_t n = e.input_ids.size();
        e.attention_mask.assign(width, 0);
        std::fill(e.attention_mask.begin(), e.attention_mask.begin() + static_cast<std::ptrdiff_t>(n), 1);
        e.token_type_ids.assign(width, 0);
        e.input_ids.resize(width, m_pad);
    }
    return out;
}

} // namespace emb
