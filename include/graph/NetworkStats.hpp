#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "graph/ProfileStore.hpp"

namespace netmatch {

struct StatsOptions {
    size_t top_companies = 10;
    size_t top_industries = 5;
    size_t top_job_titles = 10;
};

using CountedValue = std::pair<std::string, size_t>;

struct NetworkStats {
    size_t total_profiles = 0;
    size_t total_connections = 0;     // undirected edges
    double average_degree = 0.0;
    size_t min_degree = 0;
    size_t max_degree = 0;
    std::map<size_t, size_t> degree_histogram;  // degree -> profile count

    // count desc, ties in first-seen order
    std::vector<CountedValue> top_companies;
    std::vector<CountedValue> top_industries;
    std::vector<CountedValue> top_job_titles;
};

NetworkStats compute_network_stats(const ProfileStore& store, const StatsOptions& opts = {});

}  // namespace netmatch
