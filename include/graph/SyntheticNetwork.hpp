#pragma once
#include <cstdint>
#include <ctime>
#include <vector>

#include "graph/Profile.hpp"

namespace netmatch {

struct SyntheticOptions {
    size_t profiles = 20;
    uint32_t seed = 42;

    // "today" for generated dates, fixed so output is reproducible (2024-06-01 UTC)
    std::time_t reference_time = 1717200000;

    size_t min_connections = 10;
    size_t max_connections = 30;
    double interaction_rate = 0.3;   // share of connections with an interaction record
};

// Fixture population: companies, titles, skills, education, work history,
// connections biased toward same company / industry, interaction strengths
// derived from recency and frequency. Same options -> same output.
// Connection lists are one-directional; ProfileStore::load adds back-edges.
std::vector<Profile> generate_synthetic_network(const SyntheticOptions& opts);

}  // namespace netmatch
