#include <gtest/gtest.h>

#include <string>

#include "llm/MockQueryParser.hpp"
#include "llm/QueryParser.hpp"

using namespace llm;

static std::string data_path(const std::string& name) {
    return std::string(NETMATCH_TEST_DATA_DIR) + "/" + name;
}

TEST(QueryParserTest, ParsesFullObject) {
    ParsedQuery q = parse_query_json(std::string(R"({
        "job_titles": ["AI Engineer"],
        "companies": ["OpenAI", "Anthropic"],
        "skills": ["Python"],
        "industries": [],
        "experience_level": "Senior",
        "education": ["Stanford"],
        "other_criteria": "remote"
    })"));

    EXPECT_EQ(q.job_titles, std::vector<std::string>{"AI Engineer"});
    EXPECT_EQ(q.companies, (std::vector<std::string>{"OpenAI", "Anthropic"}));
    EXPECT_TRUE(q.industries.empty());
    EXPECT_EQ(q.experience_level, ExperienceLevel::Senior);
    EXPECT_EQ(q.education, std::vector<std::string>{"Stanford"});
    EXPECT_EQ(q.other_criteria, "remote");
}

TEST(QueryParserTest, ToleratesScalarsNullsAndMissingFields) {
    ParsedQuery q = parse_query_json(std::string(R"({
        "job_titles": "  Data Scientist ",
        "skills": null,
        "companies": ["Google", null, ""],
        "experience_level": "wizard",
        "other_criteria": ["a", "b"]
    })"));

    EXPECT_EQ(q.job_titles, std::vector<std::string>{"Data Scientist"});
    EXPECT_TRUE(q.skills.empty());
    EXPECT_EQ(q.companies, std::vector<std::string>{"Google"});
    EXPECT_EQ(q.experience_level, ExperienceLevel::Any);
    EXPECT_EQ(q.other_criteria, "a; b");
    EXPECT_TRUE(q.education.empty());
}

TEST(QueryParserTest, ExtractsObjectWrappedInProse) {
    ParsedQuery q = parse_query_json(std::string(
        "Sure! Here is the JSON:\n```json\n{\"skills\": [\"Rust\"]}\n```\nLet me know."));
    EXPECT_EQ(q.skills, std::vector<std::string>{"Rust"});
}

TEST(QueryParserTest, RejectsMalformedResponses) {
    EXPECT_THROW(parse_query_json(std::string("no json here")), ParseError);
    EXPECT_THROW(parse_query_json(std::string("{\"skills\": [}")), ParseError);
    EXPECT_THROW(parse_query_json(std::string(R"({"skills": 42})")), ParseError);
    EXPECT_THROW(parse_query_json(std::string(R"({"skills": ["ok", 3]})")), ParseError);
    EXPECT_THROW(parse_query_json(std::string(R"({"experience_level": 2})")), ParseError);
    EXPECT_THROW(parse_query_json(nlohmann::json::array()), ParseError);
}

TEST(QueryParserTest, ToJsonUsesLevelNames) {
    ParsedQuery q;
    q.skills = {"Go"};
    q.experience_level = ExperienceLevel::Executive;

    nlohmann::json j = q.to_json();
    EXPECT_EQ(j["experience_level"], "executive");
    EXPECT_EQ(j["skills"], nlohmann::json::array({"Go"}));
    EXPECT_TRUE(j["companies"].empty());
    EXPECT_EQ(j["other_criteria"], "");
}

TEST(QueryParserTest, MockServesFixtureByNormalizedText) {
    MockQueryParser parser(data_path("query_fixture.json"));
    EXPECT_EQ(parser.size(), 2u);

    ParsedQuery q = parser.parse("  looking for SENIOR AI engineers at startups ");
    EXPECT_EQ(q.job_titles, (std::vector<std::string>{"AI Engineer", "ML Engineer"}));
    EXPECT_EQ(q.experience_level, ExperienceLevel::Senior);
    EXPECT_EQ(q.other_criteria, "startup experience");

    ParsedQuery pm = parser.parse("Product managers in fintech");
    EXPECT_EQ(pm.job_titles, std::vector<std::string>{"Product Manager"});
    EXPECT_EQ(pm.experience_level, ExperienceLevel::Any);
}

TEST(QueryParserTest, MockFallsBackToDefault) {
    MockQueryParser parser(data_path("query_fixture.json"));
    ParsedQuery q = parser.parse("something nobody asked before");
    EXPECT_EQ(q.other_criteria, "general networking");
    EXPECT_TRUE(q.job_titles.empty());
}

TEST(QueryParserTest, MockRejectsMissingFixture) {
    EXPECT_THROW(MockQueryParser(data_path("does_not_exist.json")), ParseError);
}
