#pragma once
#include "emb/Embedder.hpp"

#include <string>
#include <vector>

namespace emb {

// Embeddings from a local Ollama server (/api/embed, batched input).
// Optional per-purpose prefixes for models trained with them
// (nomic-embed-text: "search_document: " / "search_query: ").
class OllamaEmbedder final : public Embedder {
    std::string model_;
    std::string base_url_;
    std::string document_prefix_;
    std::string query_prefix_;
    int timeout_seconds_;

public:
    OllamaEmbedder(const std::string& model,
                   const std::string& base_url = "http://127.0.0.1:11434",
                   const std::string& document_prefix = "",
                   const std::string& query_prefix = "",
                   int timeout_seconds = 120);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          EmbedPurpose purpose) const override;
};

} // namespace emb
