#include "match/RankingStrategy.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "match/ProfileText.hpp"
#include "util/Errors.hpp"
#include "util/TextUtil.hpp"

namespace netmatch {

const char* ranking_mode_str(RankingMode m) {
    switch (m) {
        case RankingMode::Local: return "local";
        case RankingMode::Rerank: return "rerank";
        default: return "unknown";
    }
}

RankingMode parse_ranking_mode(const std::string& s) {
    const std::string k = textutil::normalize_key(s);
    if (k == "local") return RankingMode::Local;
    if (k == "rerank") return RankingMode::Rerank;
    throw ValidationError("unknown ranking strategy: " + s + " (expected local|rerank)");
}

static std::vector<float> embedding_of(const emb::EmbeddingIndex* idx, const Profile& p) {
    if (!idx) return {};
    return idx->get(p.id);
}

static void score_range(const RankingContext& ctx,
                        const std::vector<float>& requester_emb,
                        std::vector<RankedCandidate>& out,
                        size_t begin,
                        size_t end) {
    for (size_t i = begin; i < end; ++i) {
        const Profile* cand = ctx.candidates[i];
        const std::vector<float> cand_emb = embedding_of(ctx.profile_embeddings, *cand);

        ScoringInputs in;
        in.requester_embedding = requester_emb.empty() ? nullptr : &requester_emb;
        in.candidate_embedding = cand_emb.empty() ? nullptr : &cand_emb;
        in.query = ctx.parsed_query;
        in.query_embedding = ctx.query_embedding;

        RankedCandidate rc;
        rc.profile = cand;
        rc.metrics = composite_score(*ctx.requester, *cand, in, ctx.weights);
        rc.total_score = rc.metrics->composite;
        out[i] = std::move(rc);
    }
}

std::vector<RankedCandidate> LocalScoringStrategy::rank(const RankingContext& ctx, size_t top_n) const {
    if (!ctx.requester) throw std::invalid_argument("LocalScoringStrategy: missing requester");

    const std::vector<float> requester_emb = embedding_of(ctx.profile_embeddings, *ctx.requester);

    const size_t n = ctx.candidates.size();
    std::vector<RankedCandidate> scored(n);

    // each slot is written by exactly one worker
    if (m_workers <= 1 || n < 2 * m_workers) {
        score_range(ctx, requester_emb, scored, 0, n);
    } else {
        const size_t chunk = (n + m_workers - 1) / m_workers;
        std::vector<std::future<void>> jobs;
        for (size_t begin = 0; begin < n; begin += chunk) {
            const size_t end = std::min(n, begin + chunk);
            jobs.push_back(std::async(std::launch::async, [&, begin, end]() {
                score_range(ctx, requester_emb, scored, begin, end);
            }));
        }
        for (auto& j : jobs) j.get();
    }

    std::sort(scored.begin(), scored.end(),
              [](const RankedCandidate& a, const RankedCandidate& b) {
                  if (a.total_score != b.total_score) return a.total_score > b.total_score;
                  return a.profile->id < b.profile->id;
              });

    if (scored.size() > top_n) scored.resize(top_n);
    return scored;
}

std::vector<RankedCandidate> RerankStrategy::rank(const RankingContext& ctx, size_t top_n) const {
    std::vector<llm::RerankDocument> docs;
    docs.reserve(ctx.candidates.size());

    std::unordered_map<std::string, const Profile*> by_id;
    by_id.reserve(ctx.candidates.size() * 2 + 8);

    for (const Profile* p : ctx.candidates) {
        docs.push_back(llm::RerankDocument{p->id, format_profile_text(*p)});
        by_id.emplace(p->id, p);
    }

    if (docs.empty()) return {};

    const std::vector<llm::RerankHit> hits = m_reranker.rerank(ctx.query, docs, top_n);

    std::vector<RankedCandidate> out;
    out.reserve(std::min(hits.size(), top_n));
    std::unordered_set<std::string> seen;
    for (const auto& h : hits) {
        if (out.size() >= top_n) break;

        auto it = by_id.find(h.id);
        if (it == by_id.end()) {
            throw std::runtime_error("reranker returned unknown document id: " + h.id);
        }
        if (!seen.insert(h.id).second) {
            throw std::runtime_error("reranker returned document id twice: " + h.id);
        }

        RankedCandidate rc;
        rc.profile = it->second;
        rc.total_score = h.relevance_score;
        rc.rerank_score = h.relevance_score;
        out.push_back(std::move(rc));
    }
    return out;
}

std::unique_ptr<RankingStrategy> make_ranking_strategy(RankingMode mode, llm::Reranker* reranker, size_t workers) {
    switch (mode) {
        case RankingMode::Local:
            return std::make_unique<LocalScoringStrategy>(workers);
        case RankingMode::Rerank:
            if (!reranker) throw ValidationError("rerank strategy requires a reranker");
            return std::make_unique<RerankStrategy>(*reranker);
        default:
            throw ValidationError("unsupported ranking strategy");
    }
}

}  // namespace netmatch
