#include "emb/EmbeddingReranker.hpp"
#include "emb/EmbeddingIndex.hpp"

#include <stdexcept>

namespace emb {

std::vector<llm::RerankHit> EmbeddingReranker::rerank(const std::string& query,
                                                      const std::vector<llm::RerankDocument>& documents,
                                                      size_t top_n) {
    if (documents.empty() || top_n == 0) return {};

    std::vector<std::string> ids;
    std::vector<std::string> texts;
    ids.reserve(documents.size());
    texts.reserve(documents.size());
    for (const auto& d : documents) {
        ids.push_back(d.id);
        texts.push_back(d.text);
    }

    const auto qv = m_embedder.embed({query}, EmbedPurpose::Query);
    if (qv.size() != 1 || qv.front().empty()) {
        throw std::runtime_error("EmbeddingReranker: no query embedding");
    }

    const auto dv = m_embedder.embed(texts, EmbedPurpose::Document);
    if (dv.size() != documents.size()) {
        throw std::runtime_error("EmbeddingReranker: embedder returned " + std::to_string(dv.size()) +
                                 " vectors for " + std::to_string(documents.size()) + " documents");
    }

    const size_t dim = qv.front().size();
    std::vector<float> flat;
    flat.reserve(dim * dv.size());
    for (const auto& v : dv) {
        if (v.size() != dim) throw std::runtime_error("EmbeddingReranker: embedding dimension mismatch");
        flat.insert(flat.end(), v.begin(), v.end());
    }

    EmbeddingIndex idx;
    idx.set(std::move(ids), std::move(flat), dim);

    std::vector<llm::RerankHit> hits;
    int rank = 0;
    for (const auto& h : idx.topk(qv.front(), top_n)) {
        llm::RerankHit hit;
        hit.id = h.id;
        hit.relevance_score = h.score;
        hit.rank = ++rank;
        hits.push_back(std::move(hit));
    }
    return hits;
}

} // namespace emb
