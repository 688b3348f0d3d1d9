#include "match/MatchArtifact.hpp"

#include "io/JsonIO.hpp"

namespace netmatch {

nlohmann::json profile_summary_to_json(const ProfileSummary& s) {
    return {
        {"id", s.id},
        {"name", s.name},
        {"job_title", s.job_title},
        {"company", s.company}
    };
}

nlohmann::json metric_scores_to_json(const MetricScores& m) {
    return {
        {"semantic_similarity", m.semantic_similarity},
        {"relationship_strength", m.relationship_strength},
        {"mutual_connections", m.mutual_connections},
        {"company_overlap", m.company_overlap},
        {"education_similarity", m.education_similarity},
        {"query_relevance", m.query_relevance}
    };
}

static nlohmann::json match_result_to_json(const MatchResult& r) {
    nlohmann::json j;

    j["rank"] = r.rank;
    j["profile"] = profile_to_json(r.profile);
    j["total_score"] = r.total_score;

    if (r.metrics) {
        j["score_breakdown"] = metric_scores_to_json(*r.metrics);
    } else if (r.rerank_score) {
        j["score_breakdown"] = {{"rerank_score", *r.rerank_score}};
    } else {
        j["score_breakdown"] = nlohmann::json::object();
    }

    nlohmann::json mutuals = nlohmann::json::array();
    for (const auto& m : r.mutual_connections) mutuals.push_back(profile_summary_to_json(m));
    j["mutual_connections"] = mutuals;

    j["connection_path"] = r.path.labels();
    j["explanation"] = r.explanation;

    return j;
}

nlohmann::json match_response_to_json(const MatchResponse& r) {
    nlohmann::json j;

    j["query"] = r.query;
    j["parsed_query"] = r.parsed_query.to_json();
    j["requester"] = profile_summary_to_json(r.requester);

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : r.results) matches.push_back(match_result_to_json(m));
    j["matches"] = matches;

    j["metadata"] = {
        {"total_candidates_evaluated", r.metadata.total_candidates_evaluated},
        {"processing_time_seconds", r.metadata.processing_time_seconds},
        {"timestamp", r.metadata.timestamp},
        {"ranking_strategy", ranking_mode_str(r.metadata.ranking_strategy)},
        {"query_embedding_available", r.metadata.query_embedding_available}
    };

    return j;
}

static nlohmann::json counted_to_json(const std::vector<CountedValue>& values) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : values) {
        arr.push_back({{"name", v.first}, {"count", v.second}});
    }
    return arr;
}

nlohmann::json network_stats_to_json(const NetworkStats& s) {
    nlohmann::json j;

    j["total_profiles"] = s.total_profiles;
    j["total_connections"] = s.total_connections;
    j["average_degree"] = s.average_degree;
    j["min_degree"] = s.min_degree;
    j["max_degree"] = s.max_degree;

    nlohmann::json hist = nlohmann::json::object();
    for (const auto& kv : s.degree_histogram) hist[std::to_string(kv.first)] = kv.second;
    j["degree_histogram"] = hist;

    j["top_companies"] = counted_to_json(s.top_companies);
    j["top_industries"] = counted_to_json(s.top_industries);
    j["top_job_titles"] = counted_to_json(s.top_job_titles);

    return j;
}

nlohmann::json profile_page_to_json(const ProfilePage& page, const ProfileFilter& filter) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : page.profiles) arr.push_back(profile_summary_to_json(p));

    return {
        {"profiles", arr},
        {"total", page.total},
        {"limit", filter.limit},
        {"offset", filter.offset}
    };
}

}  // namespace netmatch
