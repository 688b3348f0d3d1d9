#pragma once

#include <vector>

#include "graph/NetworkStats.hpp"
#include "graph/Profile.hpp"
#include "match/MatchEngine.hpp"
#include "nlohmann/json.hpp"

namespace netmatch {

nlohmann::json profile_summary_to_json(const ProfileSummary& s);

nlohmann::json metric_scores_to_json(const MetricScores& m);

// {query, parsed_query, requester, matches: [...], metadata: {...}}
nlohmann::json match_response_to_json(const MatchResponse& r);

nlohmann::json network_stats_to_json(const NetworkStats& s);

nlohmann::json profile_page_to_json(const ProfilePage& page, const ProfileFilter& filter);

}  // namespace netmatch
