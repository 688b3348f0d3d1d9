#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "emb/EmbeddingIndex.hpp"
#include "graph/Profile.hpp"
#include "llm/QueryParser.hpp"
#include "llm/Reranker.hpp"
#include "match/Similarity.hpp"

namespace netmatch {

enum class RankingMode {
    Local,
    Rerank
};

const char* ranking_mode_str(RankingMode m);

// "local" | "rerank"; ValidationError otherwise
RankingMode parse_ranking_mode(const std::string& s);

// Read-only inputs shared by every candidate of one matching call.
struct RankingContext {
    const Profile* requester = nullptr;
    std::vector<const Profile*> candidates;

    std::string query;
    const llm::ParsedQuery* parsed_query = nullptr;
    const std::vector<float>* query_embedding = nullptr;   // null when degraded
    const emb::EmbeddingIndex* profile_embeddings = nullptr;

    SimilarityWeights weights;
};

struct RankedCandidate {
    const Profile* profile = nullptr;
    double total_score = 0.0;

    std::optional<MetricScores> metrics;   // local scoring
    std::optional<double> rerank_score;    // external rerank
};

class RankingStrategy {
public:
    virtual ~RankingStrategy() = default;

    virtual RankingMode mode() const = 0;

    // best first, at most top_n
    virtual std::vector<RankedCandidate> rank(const RankingContext& ctx, size_t top_n) const = 0;
};

// Composite score per candidate, descending, ties by candidate id ascending.
class LocalScoringStrategy final : public RankingStrategy {
public:
    // 0 = sequential; otherwise candidates are scored on up to `workers` threads
    explicit LocalScoringStrategy(size_t workers = 0) : m_workers(workers) {}

    RankingMode mode() const override { return RankingMode::Local; }
    std::vector<RankedCandidate> rank(const RankingContext& ctx, size_t top_n) const override;

private:
    size_t m_workers;
};

// Delegates ordering to an external reranker over formatted profile text.
class RerankStrategy final : public RankingStrategy {
public:
    explicit RerankStrategy(llm::Reranker& reranker) : m_reranker(reranker) {}

    RankingMode mode() const override { return RankingMode::Rerank; }
    std::vector<RankedCandidate> rank(const RankingContext& ctx, size_t top_n) const override;

private:
    llm::Reranker& m_reranker;
};

// reranker is required for RankingMode::Rerank (ValidationError otherwise)
std::unique_ptr<RankingStrategy> make_ranking_strategy(RankingMode mode,
                                                       llm::Reranker* reranker,
                                                       size_t workers = 0);

}  // namespace netmatch
