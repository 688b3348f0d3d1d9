#pragma once

#include "graph/NetworkStats.hpp"
#include "match/RankingStrategy.hpp"
#include "match/Similarity.hpp"

namespace netmatch {

// mutual connections reported per match
constexpr size_t kMaxMutualConnections = 5;

struct MatchConfig {
    SimilarityWeights weights;

    RankingMode strategy = RankingMode::Local;

    size_t mutual_limit = kMaxMutualConnections;   // 1..kMaxMutualConnections

    // bulk-embed profile documents on load (fatal on failure)
    bool embed_profiles = false;

    // local scoring fan-out; 0 = sequential
    size_t scoring_workers = 0;

    StatsOptions stats;

    // ValidationError on bad weights or limits
    void validate() const;
};

}  // namespace netmatch
