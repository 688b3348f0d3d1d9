#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "graph/ProfileStore.hpp"
#include "graph/SyntheticNetwork.hpp"
#include "match/ProfileText.hpp"
#include "match/RankingStrategy.hpp"
#include "util/Errors.hpp"

using namespace netmatch;
using fakes::make_profile;

static RankingContext context_for(const ProfileStore& store, const std::string& requester) {
    RankingContext ctx;
    ctx.requester = &store.get(requester);
    ctx.candidates = store.all_except(requester);
    ctx.query = "engineers";
    return ctx;
}

TEST(RankingStrategyTest, ParsesModeNames) {
    EXPECT_EQ(parse_ranking_mode("local"), RankingMode::Local);
    EXPECT_EQ(parse_ranking_mode(" Rerank "), RankingMode::Rerank);
    EXPECT_THROW(parse_ranking_mode("llm"), ValidationError);
    EXPECT_STREQ(ranking_mode_str(RankingMode::Rerank), "rerank");
}

TEST(RankingStrategyTest, LocalSortsByScoreThenId) {
    Profile r = make_profile("r", "Req", "Engineer", "Acme");
    Profile same = make_profile("z-same", "Same", "Engineer", "Acme");
    Profile tie1 = make_profile("b-other", "B", "Engineer", "Globex");
    Profile tie2 = make_profile("a-other", "A", "Engineer", "Initech");

    ProfileStore store;
    store.load({r, same, tie1, tie2});

    LocalScoringStrategy local;
    auto ranked = local.rank(context_for(store, "r"), 10);

    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].profile->id, "z-same");
    EXPECT_EQ(ranked[1].profile->id, "a-other");
    EXPECT_EQ(ranked[2].profile->id, "b-other");
    EXPECT_DOUBLE_EQ(ranked[1].total_score, ranked[2].total_score);

    for (const auto& rc : ranked) {
        ASSERT_TRUE(rc.metrics.has_value());
        EXPECT_FALSE(rc.rerank_score.has_value());
        EXPECT_DOUBLE_EQ(rc.total_score, rc.metrics->composite);
    }
}

TEST(RankingStrategyTest, LocalTruncatesToTopN) {
    SyntheticOptions opts;
    opts.profiles = 30;
    ProfileStore store;
    store.load(generate_synthetic_network(opts));

    LocalScoringStrategy local;
    auto ranked = local.rank(context_for(store, "p0001"), 4);
    ASSERT_EQ(ranked.size(), 4u);
    for (size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_GE(ranked[i - 1].total_score, ranked[i].total_score);
    }
}

TEST(RankingStrategyTest, ParallelScoringMatchesSequential) {
    SyntheticOptions opts;
    opts.profiles = 80;
    ProfileStore store;
    store.load(generate_synthetic_network(opts));

    llm::ParsedQuery q;
    q.job_titles = {"Engineer"};
    q.companies = {"Google"};

    RankingContext ctx = context_for(store, "p0003");
    ctx.parsed_query = &q;

    auto seq = LocalScoringStrategy(0).rank(ctx, 20);
    auto par = LocalScoringStrategy(4).rank(ctx, 20);

    ASSERT_EQ(seq.size(), par.size());
    for (size_t i = 0; i < seq.size(); ++i) {
        EXPECT_EQ(seq[i].profile->id, par[i].profile->id);
        EXPECT_DOUBLE_EQ(seq[i].total_score, par[i].total_score);
    }
}

TEST(RankingStrategyTest, RerankMapsHitsBackToProfiles) {
    ProfileStore store;
    store.load({make_profile("r", "Req"), make_profile("a", "Ann"),
                make_profile("b", "Ben"), make_profile("c", "Cat")});

    fakes::FakeReranker reranker;
    RerankStrategy strategy(reranker);
    auto ranked = strategy.rank(context_for(store, "r"), 2);

    EXPECT_EQ(reranker.calls.load(), 1);
    EXPECT_EQ(reranker.last_doc_count, 3u);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].profile->id, "c");
    EXPECT_EQ(ranked[1].profile->id, "b");
    ASSERT_TRUE(ranked[0].rerank_score.has_value());
    EXPECT_DOUBLE_EQ(*ranked[0].rerank_score, 1.0);
    EXPECT_DOUBLE_EQ(ranked[1].total_score, 0.99);
    EXPECT_FALSE(ranked[0].metrics.has_value());
}

TEST(RankingStrategyTest, RerankRejectsUnknownIds) {
    ProfileStore store;
    store.load({make_profile("r", "Req"), make_profile("a", "Ann")});

    fakes::FakeReranker reranker;
    reranker.unknown_id = true;
    RerankStrategy strategy(reranker);
    EXPECT_THROW(strategy.rank(context_for(store, "r"), 5), std::runtime_error);
}

TEST(RankingStrategyTest, RerankRejectsRepeatedIds) {
    ProfileStore store;
    store.load({make_profile("r", "Req"), make_profile("a", "Ann"), make_profile("b", "Ben")});

    fakes::FakeReranker reranker;
    reranker.repeat_first = true;
    RerankStrategy strategy(reranker);
    EXPECT_THROW(strategy.rank(context_for(store, "r"), 5), std::runtime_error);

    // a single hit cannot repeat
    EXPECT_EQ(strategy.rank(context_for(store, "r"), 1).size(), 1u);
}

TEST(RankingStrategyTest, RerankWithNoCandidatesSkipsCollaborator) {
    ProfileStore store;
    store.load({make_profile("r", "Req")});

    fakes::FakeReranker reranker;
    RerankStrategy strategy(reranker);
    EXPECT_TRUE(strategy.rank(context_for(store, "r"), 5).empty());
    EXPECT_EQ(reranker.calls.load(), 0);
}

TEST(RankingStrategyTest, FactoryRequiresRerankerForRerankMode) {
    EXPECT_THROW(make_ranking_strategy(RankingMode::Rerank, nullptr), ValidationError);

    fakes::FakeReranker reranker;
    EXPECT_EQ(make_ranking_strategy(RankingMode::Rerank, &reranker)->mode(), RankingMode::Rerank);
    EXPECT_EQ(make_ranking_strategy(RankingMode::Local, nullptr)->mode(), RankingMode::Local);
}

TEST(RankingStrategyTest, ProfileTextOmitsAbsentFields) {
    Profile p = make_profile("a", "Ann", "Engineer", "Acme");
    p.industry.clear();
    p.skills = {"Go", "Rust"};

    const std::string text = format_profile_text(p);
    EXPECT_NE(text.find("Name: Ann"), std::string::npos);
    EXPECT_NE(text.find("Role: Engineer"), std::string::npos);
    EXPECT_NE(text.find("Skills: Go, Rust"), std::string::npos);
    EXPECT_EQ(text.find("Industry"), std::string::npos);
    EXPECT_EQ(text.find("Education"), std::string::npos);
}
