#pragma once
#include "emb/Embedder.hpp"
#include "llm/Reranker.hpp"

namespace emb {

// Reranks by cosine between the query embedding and each document embedding.
// relevance_score is the cosine (may be negative); ties keep document order.
class EmbeddingReranker final : public llm::Reranker {
public:
    explicit EmbeddingReranker(const Embedder& embedder) : m_embedder(embedder) {}

    std::vector<llm::RerankHit> rerank(const std::string& query,
                                       const std::vector<llm::RerankDocument>& documents,
                                       size_t top_n) override;

private:
    const Embedder& m_embedder;
};

} // namespace emb
