#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "emb/Embedder.hpp"
#include "emb/EmbeddingIndex.hpp"
#include "graph/GraphQueries.hpp"
#include "graph/NetworkStats.hpp"
#include "graph/ProfileStore.hpp"
#include "llm/QueryParser.hpp"
#include "match/MatchConfig.hpp"
#include "match/RankingStrategy.hpp"

namespace netmatch {

// Everything one matching call reads. Never mutated once published.
struct NetworkSnapshot {
    std::shared_ptr<const ProfileStore> store;
    std::shared_ptr<const emb::EmbeddingIndex> embeddings;   // may be empty
};

struct LoadSummary {
    size_t profile_count = 0;
    size_t connection_count = 0;
};

struct MatchResult {
    int rank = 0;                       // 1-based
    Profile profile;
    double total_score = 0.0;

    std::optional<MetricScores> metrics;
    std::optional<double> rerank_score;

    std::vector<ProfileSummary> mutual_connections;
    PathClassification path;
    std::string explanation;            // empty unless requested
};

struct MatchMetadata {
    size_t total_candidates_evaluated = 0;
    double processing_time_seconds = 0.0;
    std::string timestamp;              // ISO-8601 UTC
    RankingMode ranking_strategy = RankingMode::Local;
    bool query_embedding_available = false;
};

struct MatchResponse {
    std::string query;
    llm::ParsedQuery parsed_query;
    ProfileSummary requester;
    std::vector<MatchResult> results;
    MatchMetadata metadata;
};

struct ProfileFilter {
    std::string company;      // case-insensitive substring; empty = any
    std::string job_title;
    size_t limit = 50;
    size_t offset = 0;
};

struct ProfilePage {
    size_t total = 0;         // matches before limit/offset
    std::vector<ProfileSummary> profiles;
};

class MatchEngine {
public:
    // embedder may be null: no query embeddings, semantic metric contributes 0
    MatchEngine(llm::QueryParser& parser,
                const emb::Embedder* embedder,
                std::unique_ptr<RankingStrategy> strategy,
                MatchConfig config = {});

    // synthetic population of `candidate_count` profiles
    LoadSummary initialize(size_t candidate_count, uint32_t seed = 42);

    // All-or-nothing: on failure the previous network stays active.
    LoadSummary load(std::vector<Profile> profiles, const std::vector<ConnectionEdge>& edges = {});

    // Replaces the profile vectors of the active network.
    void set_profile_embeddings(emb::EmbeddingIndex index);

    bool initialized() const;

    MatchResponse find_connections(const std::string& requester_id,
                                   const std::string& query,
                                   int max_results = 10,
                                   bool include_explanations = true) const;

    NetworkStats network_stats() const;

    std::vector<ProfileSummary> mutual_connections(const std::string& a, const std::string& b) const;
    PathClassification connection_path(const std::string& a, const std::string& b) const;

    Profile profile(const std::string& id) const;

    ProfilePage list_profiles(const ProfileFilter& filter) const;

    const MatchConfig& config() const { return m_config; }
    RankingMode ranking_mode() const { return m_strategy->mode(); }

private:
    std::shared_ptr<const NetworkSnapshot> snapshot() const;
    std::shared_ptr<const NetworkSnapshot> require_snapshot() const;
    void publish(std::shared_ptr<const NetworkSnapshot> snap);

    emb::EmbeddingIndex embed_profiles(const ProfileStore& store) const;

    llm::QueryParser& m_parser;
    const emb::Embedder* m_embedder;
    std::unique_ptr<RankingStrategy> m_strategy;
    MatchConfig m_config;

    mutable std::mutex m_mu;
    std::shared_ptr<const NetworkSnapshot> m_snapshot;
};

}  // namespace netmatch
