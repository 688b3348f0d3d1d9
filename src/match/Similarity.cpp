#include "match/Similarity.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <unordered_set>

#include "emb/EmbeddingIndex.hpp"
#include "util/Errors.hpp"
#include "util/TextUtil.hpp"

namespace netmatch {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

template <typename Set>
static double jaccard(const Set& a, const Set& b) {
    if (a.empty() || b.empty()) return 0.0;

    size_t inter = 0;
    for (const auto& x : a) {
        if (b.find(x) != b.end()) ++inter;
    }
    const size_t uni = a.size() + b.size() - inter;
    if (uni == 0) return 0.0;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

static std::unordered_set<std::string> company_set(const Profile& p) {
    std::unordered_set<std::string> out;
    const std::string cur = textutil::normalize_key(p.company);
    if (!cur.empty()) out.insert(cur);
    for (const auto& w : p.work_history) {
        const std::string c = textutil::normalize_key(w.company);
        if (!c.empty()) out.insert(c);
    }
    return out;
}

enum class DegreeLevel {
    Unknown,
    Bachelor,
    Master,
    Doctorate
};

static DegreeLevel degree_level(const std::string& degree) {
    std::string k;
    for (char c : textutil::normalize_key(degree)) {
        if (c != '.' && c != '\'' && c != ' ') k.push_back(c);
    }

    static const std::unordered_set<std::string> bachelor = {
        "bs", "ba", "bsc", "bachelor", "bachelors", "beng", "ab"
    };
    static const std::unordered_set<std::string> master = {
        "ms", "ma", "msc", "master", "masters", "meng", "mba"
    };
    static const std::unordered_set<std::string> doctorate = {
        "phd", "dphil", "doctorate", "doctor"
    };

    if (bachelor.count(k)) return DegreeLevel::Bachelor;
    if (master.count(k)) return DegreeLevel::Master;
    if (doctorate.count(k)) return DegreeLevel::Doctorate;
    return DegreeLevel::Unknown;
}

static bool adjacent_levels(DegreeLevel a, DegreeLevel b) {
    if (a == DegreeLevel::Unknown || b == DegreeLevel::Unknown) return false;
    if (a == DegreeLevel::Bachelor && b == DegreeLevel::Bachelor) return true;
    const bool a_grad = (a == DegreeLevel::Master || a == DegreeLevel::Doctorate);
    const bool b_grad = (b == DegreeLevel::Master || b == DegreeLevel::Doctorate);
    return a_grad && b_grad;
}

static bool has_text(const std::optional<std::string>& s) {
    return s.has_value() && !textutil::trim(*s).empty();
}

static bool title_has_any(const std::string& lowered_title, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (lowered_title.find(w) != std::string::npos) return true;
    }
    return false;
}

static bool experience_matches(llm::ExperienceLevel lvl, const std::string& job_title) {
    const std::string t = textutil::to_lower(job_title);
    switch (lvl) {
        case llm::ExperienceLevel::Senior:
            return title_has_any(t, {"senior", "principal", "staff"});
        case llm::ExperienceLevel::Junior:
            return title_has_any(t, {"junior"}) || !title_has_any(t, {"senior", "principal"});
        case llm::ExperienceLevel::Executive:
            return title_has_any(t, {"vp", "director", "head", "ceo", "cto", "cpo"});
        case llm::ExperienceLevel::Any:
        default:
            return true;
    }
}

double SimilarityWeights::sum() const {
    return semantic + relationship + mutual + company + education + query_relevance;
}

void SimilarityWeights::validate() const {
    const double ws[] = {semantic, relationship, mutual, company, education, query_relevance};
    for (double w : ws) {
        if (!(w >= 0.0)) throw ValidationError("similarity weights must be non-negative");
    }
    if (std::fabs(sum() - 1.0) > 1e-6) {
        throw ValidationError("similarity weights must sum to 1.0");
    }
}

double semantic_similarity(const std::vector<float>* a, const std::vector<float>* b) {
    if (!a || !b) return 0.0;
    if (a->empty() || a->size() != b->size()) return 0.0;

    const double cos = emb::EmbeddingIndex::cosine(a->data(), b->data(), a->size());
    return clamp01(cos);
}

double relationship_strength(const Profile& a, const Profile& b) {
    double strength = 0.0;

    auto ab = a.interactions.find(b.id);
    if (ab != a.interactions.end()) strength = std::max(strength, ab->second.strength);

    auto ba = b.interactions.find(a.id);
    if (ba != b.interactions.end()) strength = std::max(strength, ba->second.strength);

    return clamp01(strength);
}

double mutual_connection_overlap(const Profile& a, const Profile& b) {
    std::unordered_set<std::string> ca(a.connections.begin(), a.connections.end());
    std::unordered_set<std::string> cb(b.connections.begin(), b.connections.end());
    return jaccard(ca, cb);
}

double company_overlap(const Profile& a, const Profile& b) {
    return jaccard(company_set(a), company_set(b));
}

double education_similarity(const Profile& a, const Profile& b) {
    if (!a.education || !b.education) return 0.0;
    const Education& ea = *a.education;
    const Education& eb = *b.education;

    double sim = 0.0;

    if (has_text(ea.university) && has_text(eb.university) &&
        textutil::iequals(*ea.university, *eb.university)) {
        sim += 0.7;
    }

    if (has_text(ea.degree) && has_text(eb.degree)) {
        if (textutil::iequals(*ea.degree, *eb.degree)) {
            sim += 0.3;
        } else if (adjacent_levels(degree_level(*ea.degree), degree_level(*eb.degree))) {
            sim += 0.15;
        }
    }

    return sim;
}

double query_relevance(const Profile& candidate,
                       const llm::ParsedQuery& query,
                       const std::vector<float>* query_embedding,
                       const std::vector<float>* candidate_embedding) {
    double relevance = 0.0;
    int criteria = 0;

    if (!query.job_titles.empty()) {
        ++criteria;
        const std::string title = textutil::normalize_key(candidate.job_title);
        if (!title.empty()) {
            for (const auto& qt : query.job_titles) {
                if (textutil::icontains(title, qt) || textutil::icontains(qt, title)) {
                    relevance += 1.0;
                    break;
                }
            }
        }
    }

    if (!query.companies.empty()) {
        ++criteria;
        const auto companies = company_set(candidate);
        for (const auto& qc : query.companies) {
            if (companies.count(textutil::normalize_key(qc))) {
                relevance += 1.0;
                break;
            }
        }
    }

    if (!query.skills.empty()) {
        ++criteria;
        std::unordered_set<std::string> skills;
        for (const auto& s : candidate.skills) skills.insert(textutil::normalize_key(s));

        size_t matched = 0;
        for (const auto& qs : query.skills) {
            if (skills.count(textutil::normalize_key(qs))) ++matched;
        }
        relevance += static_cast<double>(matched) / static_cast<double>(query.skills.size());
    }

    if (!query.industries.empty()) {
        ++criteria;
        for (const auto& qi : query.industries) {
            if (textutil::icontains(candidate.industry, qi)) {
                relevance += 1.0;
                break;
            }
        }
    }

    if (!query.education.empty()) {
        ++criteria;
        if (candidate.education) {
            const std::string uni = candidate.education->university.value_or("");
            const std::string deg = candidate.education->degree.value_or("");
            for (const auto& qe : query.education) {
                if (textutil::icontains(uni, qe) || textutil::icontains(deg, qe)) {
                    relevance += 1.0;
                    break;
                }
            }
        }
    }

    if (query.experience_level != llm::ExperienceLevel::Any) {
        ++criteria;
        if (experience_matches(query.experience_level, candidate.job_title)) relevance += 1.0;
    }

    if (query_embedding && candidate_embedding &&
        !query_embedding->empty() && !candidate_embedding->empty()) {
        ++criteria;
        relevance += semantic_similarity(query_embedding, candidate_embedding);
    }

    return criteria > 0 ? relevance / criteria : 0.0;
}

MetricScores composite_score(const Profile& requester,
                             const Profile& candidate,
                             const ScoringInputs& in,
                             const SimilarityWeights& w) {
    MetricScores s;
    s.semantic_similarity = semantic_similarity(in.requester_embedding, in.candidate_embedding);
    s.relationship_strength = relationship_strength(requester, candidate);
    s.mutual_connections = mutual_connection_overlap(requester, candidate);
    s.company_overlap = company_overlap(requester, candidate);
    s.education_similarity = education_similarity(requester, candidate);

    if (in.query) {
        s.query_relevance = query_relevance(candidate, *in.query, in.query_embedding, in.candidate_embedding);
    }

    const double total =
        s.semantic_similarity * w.semantic +
        s.relationship_strength * w.relationship +
        s.mutual_connections * w.mutual +
        s.company_overlap * w.company +
        s.education_similarity * w.education +
        s.query_relevance * w.query_relevance;

    s.composite = clamp01(total);
    return s;
}

std::string explain_metrics(const MetricScores& s) {
    std::vector<std::string> reasons;

    if (s.semantic_similarity > 0.7) reasons.push_back("Strong professional profile alignment");
    else if (s.semantic_similarity > 0.5) reasons.push_back("Good professional background match");

    if (s.relationship_strength > 0.5) reasons.push_back("Existing email communication history");

    if (s.mutual_connections > 0.1) reasons.push_back("Shared connections");

    if (s.company_overlap > 0.5) reasons.push_back("Worked at same companies");
    else if (s.company_overlap > 0.0) reasons.push_back("Some company overlap in career history");

    if (s.education_similarity > 0.5) reasons.push_back("Similar educational background");

    if (s.query_relevance > 0.7) reasons.push_back("Excellent match for your specific criteria");
    else if (s.query_relevance > 0.4) reasons.push_back("Good match for your requirements");

    if (reasons.empty()) reasons.push_back("Potential networking opportunity");
    return textutil::join(reasons, " \xE2\x80\xA2 ");
}

}  // namespace netmatch
