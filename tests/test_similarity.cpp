#include <gtest/gtest.h>

#include <random>

#include "Fakes.hpp"
#include "match/Similarity.hpp"
#include "util/Errors.hpp"

using namespace netmatch;
using fakes::make_profile;

static Profile with_education(Profile p, const std::string& uni, const std::string& degree) {
    Education e;
    e.university = uni;
    e.degree = degree;
    e.field = "Computer Science";
    p.education = e;
    return p;
}

// ─── Jaccard metrics ───────────────────────────────────────────

TEST(SimilarityTest, MutualOverlapZeroWhenEitherSideEmpty) {
    Profile a = make_profile("a", "Ann");
    Profile b = make_profile("b", "Ben");
    a.connections = {"x", "y"};

    EXPECT_DOUBLE_EQ(mutual_connection_overlap(a, b), 0.0);
    EXPECT_DOUBLE_EQ(mutual_connection_overlap(b, a), 0.0);
    EXPECT_DOUBLE_EQ(mutual_connection_overlap(b, b), 0.0);
}

TEST(SimilarityTest, MutualOverlapOneForIdenticalSets) {
    Profile a = make_profile("a", "Ann");
    Profile b = make_profile("b", "Ben");
    a.connections = {"x", "y", "z"};
    b.connections = {"z", "x", "y"};

    EXPECT_DOUBLE_EQ(mutual_connection_overlap(a, b), 1.0);
}

TEST(SimilarityTest, MutualOverlapPartial) {
    Profile a = make_profile("a", "Ann");
    Profile b = make_profile("b", "Ben");
    a.connections = {"x", "y"};
    b.connections = {"y", "z"};

    EXPECT_NEAR(mutual_connection_overlap(a, b), 1.0 / 3.0, 1e-12);
}

TEST(SimilarityTest, CompanyOverlapUsesHistoryCaseInsensitive) {
    Profile a = make_profile("a", "Ann", "Engineer", "Google");
    Profile b = make_profile("b", "Ben", "Engineer", "Stripe");
    a.work_history.push_back(WorkEntry{"Stripe", "Intern", "2019-01-01", std::string("2019-06-01"), false});
    b.work_history.push_back(WorkEntry{"google ", "Engineer", "2020-01-01", std::string("2021-01-01"), false});

    EXPECT_DOUBLE_EQ(company_overlap(a, b), 1.0);
}

TEST(SimilarityTest, CompanyOverlapZeroWhenNoCompanies) {
    Profile a = make_profile("a", "Ann", "Engineer", "");
    Profile b = make_profile("b", "Ben", "Engineer", "Acme");

    EXPECT_DOUBLE_EQ(company_overlap(a, b), 0.0);
}

// ─── Education ────────────────────────────────────────────────

TEST(SimilarityTest, EducationSameSchoolMastersVsPhd) {
    Profile a = with_education(make_profile("a", "Ann"), "X", "MS");
    Profile b = with_education(make_profile("b", "Ben"), "X", "PhD");

    EXPECT_NEAR(education_similarity(a, b), 0.85, 1e-12);
}

TEST(SimilarityTest, EducationExactMatch) {
    Profile a = with_education(make_profile("a", "Ann"), "MIT", "BS");
    Profile b = with_education(make_profile("b", "Ben"), "mit", "bs");

    EXPECT_NEAR(education_similarity(a, b), 1.0, 1e-12);
}

TEST(SimilarityTest, EducationBachelorFamilyIsAdjacent) {
    Profile a = with_education(make_profile("a", "Ann"), "MIT", "BS");
    Profile b = with_education(make_profile("b", "Ben"), "Stanford University", "B.A.");

    EXPECT_NEAR(education_similarity(a, b), 0.15, 1e-12);
}

TEST(SimilarityTest, EducationBachelorVsMasterNotAdjacent) {
    Profile a = with_education(make_profile("a", "Ann"), "MIT", "BS");
    Profile b = with_education(make_profile("b", "Ben"), "Caltech", "MS");

    EXPECT_DOUBLE_EQ(education_similarity(a, b), 0.0);
}

TEST(SimilarityTest, EducationAbsentRecordScoresZero) {
    Profile a = with_education(make_profile("a", "Ann"), "MIT", "BS");
    Profile b = make_profile("b", "Ben");

    EXPECT_DOUBLE_EQ(education_similarity(a, b), 0.0);
}

// ─── Relationship strength ─────────────────────────────────────

TEST(SimilarityTest, RelationshipStrengthTakesMaxDirection) {
    Profile a = make_profile("a", "Ann");
    Profile b = make_profile("b", "Ben");
    a.interactions["b"] = Interaction{4, "2024-05-20", 0.3, ""};
    b.interactions["a"] = Interaction{12, "2024-05-30", 0.8, ""};

    EXPECT_DOUBLE_EQ(relationship_strength(a, b), 0.8);
    EXPECT_DOUBLE_EQ(relationship_strength(b, a), 0.8);
}

TEST(SimilarityTest, RelationshipStrengthZeroWithoutInteractions) {
    EXPECT_DOUBLE_EQ(relationship_strength(make_profile("a", "Ann"), make_profile("b", "Ben")), 0.0);
}

// ─── Semantic ──────────────────────────────────────────────────

TEST(SimilarityTest, SemanticSimilarityHandlesAbsentAndMismatched) {
    std::vector<float> a{1.0f, 0.0f};
    std::vector<float> b{0.0f, 1.0f, 0.0f};
    std::vector<float> zero{0.0f, 0.0f};
    std::vector<float> opposite{-1.0f, 0.0f};

    EXPECT_DOUBLE_EQ(semantic_similarity(&a, nullptr), 0.0);
    EXPECT_DOUBLE_EQ(semantic_similarity(&a, &b), 0.0);
    EXPECT_DOUBLE_EQ(semantic_similarity(&a, &zero), 0.0);
    EXPECT_DOUBLE_EQ(semantic_similarity(&a, &opposite), 0.0);
    EXPECT_NEAR(semantic_similarity(&a, &a), 1.0, 1e-6);
}

// ─── Query relevance ───────────────────────────────────────────

TEST(SimilarityTest, QueryRelevanceZeroWithoutCriteria) {
    llm::ParsedQuery q;
    EXPECT_DOUBLE_EQ(query_relevance(make_profile("a", "Ann"), q, nullptr, nullptr), 0.0);
}

TEST(SimilarityTest, QueryRelevanceAveragesPopulatedCriteria) {
    Profile p = make_profile("a", "Ann", "Senior AI Engineer", "OpenAI");
    p.skills = {"Python", "PyTorch"};
    p.industry = "AI Research";

    llm::ParsedQuery q;
    q.job_titles = {"AI Engineer"};           // 1
    q.companies = {"Google"};                 // 0
    q.skills = {"python", "Rust"};            // 0.5
    q.experience_level = llm::ExperienceLevel::Senior;  // 1

    EXPECT_NEAR(query_relevance(p, q, nullptr, nullptr), 2.5 / 4.0, 1e-12);
}

TEST(SimilarityTest, QueryRelevanceEmptyTitleNeverMatches) {
    Profile p = make_profile("a", "Ann", "", "Acme");

    llm::ParsedQuery q;
    q.job_titles = {"Engineer"};

    EXPECT_DOUBLE_EQ(query_relevance(p, q, nullptr, nullptr), 0.0);
}

TEST(SimilarityTest, QueryRelevanceAddsSemanticCriterionWhenBothEmbeddingsPresent) {
    Profile p = make_profile("a", "Ann", "Designer", "Acme");

    llm::ParsedQuery q;
    q.job_titles = {"Engineer"};

    std::vector<float> qv{1.0f, 0.0f};
    std::vector<float> pv{1.0f, 0.0f};

    EXPECT_NEAR(query_relevance(p, q, &qv, &pv), 0.5, 1e-6);
    EXPECT_DOUBLE_EQ(query_relevance(p, q, &qv, nullptr), 0.0);
}

TEST(SimilarityTest, ExecutiveLevelMatchesLeadershipTitles) {
    llm::ParsedQuery q;
    q.experience_level = llm::ExperienceLevel::Executive;

    EXPECT_DOUBLE_EQ(query_relevance(make_profile("a", "Ann", "VP of Engineering"), q, nullptr, nullptr), 1.0);
    EXPECT_DOUBLE_EQ(query_relevance(make_profile("b", "Ben", "Data Analyst"), q, nullptr, nullptr), 0.0);
}

TEST(SimilarityTest, IndustryCriterionIsCaseInsensitiveSubstring) {
    Profile p = make_profile("a", "Ann");
    p.industry = "Financial Technology";

    llm::ParsedQuery fintech;
    fintech.industries = {"healthcare", "TECHNOLOGY"};
    EXPECT_DOUBLE_EQ(query_relevance(p, fintech, nullptr, nullptr), 1.0);

    llm::ParsedQuery retail;
    retail.industries = {"Retail"};
    EXPECT_DOUBLE_EQ(query_relevance(p, retail, nullptr, nullptr), 0.0);
}

TEST(SimilarityTest, EducationCriterionMatchesUniversityOrDegree) {
    Profile grad = with_education(make_profile("a", "Ann"), "Stanford University", "PhD");

    llm::ParsedQuery by_school;
    by_school.education = {"stanford"};
    EXPECT_DOUBLE_EQ(query_relevance(grad, by_school, nullptr, nullptr), 1.0);

    llm::ParsedQuery by_degree;
    by_degree.education = {"phd"};
    EXPECT_DOUBLE_EQ(query_relevance(grad, by_degree, nullptr, nullptr), 1.0);

    llm::ParsedQuery elsewhere;
    elsewhere.education = {"Berkeley"};
    EXPECT_DOUBLE_EQ(query_relevance(grad, elsewhere, nullptr, nullptr), 0.0);

    // counted as a criterion even when the candidate has no education record
    Profile dropout = make_profile("b", "Ben");
    llm::ParsedQuery mixed;
    mixed.education = {"Stanford"};
    mixed.industries = {"Technology"};
    EXPECT_DOUBLE_EQ(query_relevance(dropout, mixed, nullptr, nullptr), 0.5);
}

TEST(SimilarityTest, JuniorLevelMatchesUnlessTitleIsSenior) {
    llm::ParsedQuery q;
    q.experience_level = llm::ExperienceLevel::Junior;

    EXPECT_DOUBLE_EQ(query_relevance(make_profile("a", "Ann", "Junior Developer"), q, nullptr, nullptr), 1.0);
    EXPECT_DOUBLE_EQ(query_relevance(make_profile("b", "Ben", "Data Analyst"), q, nullptr, nullptr), 1.0);
    EXPECT_DOUBLE_EQ(query_relevance(make_profile("c", "Cat", "Senior Engineer"), q, nullptr, nullptr), 0.0);
    EXPECT_DOUBLE_EQ(query_relevance(make_profile("d", "Dan", "Principal Architect"), q, nullptr, nullptr), 0.0);
}

// ─── Composite ─────────────────────────────────────────────────

TEST(SimilarityTest, DefaultWeightsSumToOne) {
    SimilarityWeights w;
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
    EXPECT_NO_THROW(w.validate());
}

TEST(SimilarityTest, WeightsValidationRejectsBadSums) {
    SimilarityWeights w;
    w.semantic = 0.5;
    EXPECT_THROW(w.validate(), ValidationError);

    SimilarityWeights neg;
    neg.semantic = -0.25;
    neg.relationship = 0.70;
    EXPECT_THROW(neg.validate(), ValidationError);
}

TEST(SimilarityTest, CompositeIsWeightedSum) {
    Profile a = with_education(make_profile("a", "Ann", "Engineer", "Acme"), "X", "MS");
    Profile b = with_education(make_profile("b", "Ben", "Engineer", "Acme"), "X", "PhD");
    a.connections = {"c"};
    b.connections = {"c"};
    a.interactions["b"] = Interaction{5, "2024-05-01", 0.4, ""};

    ScoringInputs in;
    MetricScores s = composite_score(a, b, in);

    EXPECT_DOUBLE_EQ(s.semantic_similarity, 0.0);
    EXPECT_DOUBLE_EQ(s.relationship_strength, 0.4);
    EXPECT_DOUBLE_EQ(s.mutual_connections, 1.0);
    EXPECT_DOUBLE_EQ(s.company_overlap, 1.0);
    EXPECT_NEAR(s.education_similarity, 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(s.query_relevance, 0.0);
    EXPECT_NEAR(s.composite, 0.4 * 0.20 + 0.15 + 0.15 + 0.85 * 0.10, 1e-12);
}

TEST(SimilarityTest, CompositeStaysWithinBoundsForRandomProfiles) {
    std::mt19937 gen(7);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const std::vector<std::string> companies = {"Acme", "Globex", "Initech", "Umbrella"};
    const std::vector<std::string> people = {"p0", "p1", "p2", "p3", "p4", "p5"};

    for (int round = 0; round < 200; ++round) {
        Profile a = make_profile("a", "Ann", "Senior Engineer", companies[gen() % companies.size()]);
        Profile b = make_profile("b", "Ben", "Engineer", companies[gen() % companies.size()]);
        for (const auto& id : people) {
            if (gen() % 2) a.connections.push_back(id);
            if (gen() % 2) b.connections.push_back(id);
        }
        a.interactions["b"] = Interaction{1, "", unit(gen), ""};
        b.interactions["a"] = Interaction{1, "", unit(gen), ""};
        if (gen() % 2) a = with_education(a, "MIT", "MS");
        if (gen() % 2) b = with_education(b, "MIT", "PhD");

        std::vector<float> ea{(float)unit(gen), (float)unit(gen), (float)unit(gen)};
        std::vector<float> eb{(float)unit(gen), (float)unit(gen), (float)unit(gen)};

        llm::ParsedQuery q;
        q.job_titles = {"Engineer"};
        q.companies = {companies[gen() % companies.size()]};
        q.experience_level = llm::ExperienceLevel::Senior;

        ScoringInputs in;
        in.requester_embedding = &ea;
        in.candidate_embedding = &eb;
        in.query = &q;
        in.query_embedding = &ea;

        const MetricScores s = composite_score(a, b, in);
        EXPECT_GE(s.composite, 0.0);
        EXPECT_LE(s.composite, 1.0);
    }
}

TEST(SimilarityTest, ExplainMetricsFallsBackToGenericReason) {
    MetricScores s;
    EXPECT_EQ(explain_metrics(s), "Potential networking opportunity");

    s.relationship_strength = 0.9;
    s.company_overlap = 1.0;
    EXPECT_EQ(explain_metrics(s), "Existing email communication history \xE2\x80\xA2 Worked at same companies");
}
