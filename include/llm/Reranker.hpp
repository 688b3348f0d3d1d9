#pragma once
#include <string>
#include <vector>

namespace llm {

struct RerankDocument {
    std::string id;
    std::string text;
};

struct RerankHit {
    std::string id;
    double relevance_score = 0.0;  // collaborator-defined scale
    int rank = 0;                  // 1-based
};

class Reranker {
public:
    virtual ~Reranker() = default;

    // At most top_n hits, best first. Throws on failure.
    virtual std::vector<RerankHit> rerank(const std::string& query,
                                          const std::vector<RerankDocument>& documents,
                                          size_t top_n) = 0;
};

} // namespace llm
