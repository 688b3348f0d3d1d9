#pragma once
#include "emb/Embedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

// Sentence embeddings from an exported MiniLM (all-MiniLM-L6-v2 style) ONNX
// model: mean pooling over the attention mask, then L2 normalization.
// Documents and queries share one encoder, so the purpose is ignored.
class MiniLmEmbedder final : public Embedder {
public:
    // throws std::runtime_error if the vocab or model cannot be loaded
    MiniLmEmbedder(const std::string& model_path,
                   const std::string& vocab_path,
                   size_t max_len = 256,
                   size_t batch_size = 16);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          EmbedPurpose purpose) const override;

private:
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const;

    WordPieceTokenizer m_tok;
    size_t m_max_len;
    size_t m_batch_size;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "netmatch"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    bool m_has_type_input = true;
    std::string m_out_name;
};

} // namespace emb
