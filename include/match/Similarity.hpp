#pragma once

#include <string>
#include <vector>

#include "graph/Profile.hpp"
#include "llm/QueryParser.hpp"

namespace netmatch {

// Convex combination used for the composite score. Defaults reproduce the
// reference rankings; override through the config file.
struct SimilarityWeights {
    double semantic = 0.25;
    double relationship = 0.20;
    double mutual = 0.15;
    double company = 0.15;
    double education = 0.10;
    double query_relevance = 0.15;

    double sum() const;

    // ValidationError unless every weight is >= 0 and they sum to 1 (+-1e-6)
    void validate() const;
};

struct MetricScores {
    double semantic_similarity = 0.0;
    double relationship_strength = 0.0;
    double mutual_connections = 0.0;
    double company_overlap = 0.0;
    double education_similarity = 0.0;
    double query_relevance = 0.0;

    double composite = 0.0;   // weighted sum, clamped to [0,1]
};

// Borrowed views; nullptr / empty means "absent".
struct ScoringInputs {
    const std::vector<float>* requester_embedding = nullptr;
    const std::vector<float>* candidate_embedding = nullptr;
    const llm::ParsedQuery* query = nullptr;
    const std::vector<float>* query_embedding = nullptr;
};

// cosine floored at 0; 0 if either side is absent, empty, zero or of another dimension
double semantic_similarity(const std::vector<float>* a, const std::vector<float>* b);

double relationship_strength(const Profile& a, const Profile& b);

// Jaccard over connection ids
double mutual_connection_overlap(const Profile& a, const Profile& b);

// Jaccard over {current company} U {work history companies}, case-insensitive
double company_overlap(const Profile& a, const Profile& b);

double education_similarity(const Profile& a, const Profile& b);

// Mean over the criteria the query actually populated; 0 when there are none.
double query_relevance(const Profile& candidate,
                       const llm::ParsedQuery& query,
                       const std::vector<float>* query_embedding,
                       const std::vector<float>* candidate_embedding);

MetricScores composite_score(const Profile& requester,
                             const Profile& candidate,
                             const ScoringInputs& in,
                             const SimilarityWeights& w = {});

// " • "-joined reasons for a local-scoring match
std::string explain_metrics(const MetricScores& s);

}  // namespace netmatch
