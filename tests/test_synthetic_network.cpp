#include <gtest/gtest.h>

#include <set>

#include "graph/ProfileStore.hpp"
#include "graph/SyntheticNetwork.hpp"

using namespace netmatch;

static std::vector<std::string> ids_of(const std::vector<Profile>& ps) {
    std::vector<std::string> out;
    for (const auto& p : ps) out.push_back(p.id);
    return out;
}

TEST(SyntheticNetworkTest, SameSeedSameNetwork) {
    SyntheticOptions opts;
    opts.profiles = 30;
    opts.seed = 7;

    auto a = generate_synthetic_network(opts);
    auto b = generate_synthetic_network(opts);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, b[i].id);
        EXPECT_EQ(a[i].name, b[i].name);
        EXPECT_EQ(a[i].job_title, b[i].job_title);
        EXPECT_EQ(a[i].company, b[i].company);
        EXPECT_EQ(a[i].skills, b[i].skills);
        EXPECT_EQ(a[i].bio, b[i].bio);
        EXPECT_EQ(a[i].connections, b[i].connections);
        EXPECT_EQ(a[i].interactions.size(), b[i].interactions.size());
    }
}

TEST(SyntheticNetworkTest, DifferentSeedsDiffer) {
    SyntheticOptions opts;
    opts.profiles = 30;
    auto a = generate_synthetic_network(opts);
    opts.seed = 43;
    auto b = generate_synthetic_network(opts);

    bool differs = false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].connections != b[i].connections) differs = true;
    }
    EXPECT_TRUE(differs);
}

TEST(SyntheticNetworkTest, ProducesRequestedCountWithUniqueIds) {
    SyntheticOptions opts;
    opts.profiles = 50;
    auto ps = generate_synthetic_network(opts);

    ASSERT_EQ(ps.size(), 50u);
    auto ids = ids_of(ps);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 50u);
    EXPECT_EQ(ps.front().id, "p0001");
    EXPECT_EQ(ps.back().id, "p0050");
}

TEST(SyntheticNetworkTest, ProfilesAreFullyPopulated) {
    SyntheticOptions opts;
    opts.profiles = 25;
    for (const auto& p : generate_synthetic_network(opts)) {
        EXPECT_FALSE(p.name.empty());
        EXPECT_FALSE(p.job_title.empty());
        EXPECT_FALSE(p.company.empty());
        EXPECT_FALSE(p.industry.empty());
        EXPECT_FALSE(p.bio.empty());
        EXPECT_FALSE(p.skills.empty());
        EXPECT_LE(p.skills.size(), 8u);
        ASSERT_TRUE(p.education.has_value());
        ASSERT_FALSE(p.work_history.empty());
        EXPECT_TRUE(p.work_history.front().is_current);
        EXPECT_EQ(p.work_history.front().company, p.company);
    }
}

TEST(SyntheticNetworkTest, LoadsCleanlyIntoStore) {
    SyntheticOptions opts;
    opts.profiles = 60;
    auto ps = generate_synthetic_network(opts);

    for (const auto& p : ps) {
        EXPECT_GE(p.connections.size(), opts.min_connections);
        for (const auto& c : p.connections) EXPECT_NE(c, p.id);
        for (const auto& kv : p.interactions) {
            EXPECT_GE(kv.second.strength, 0.0);
            EXPECT_LE(kv.second.strength, 1.0);
            EXPECT_GE(kv.second.frequency, 1);
            EXPECT_FALSE(kv.second.type.empty());
        }
    }

    ProfileStore store;
    EXPECT_NO_THROW(store.load(ps));
    EXPECT_EQ(store.size(), 60u);
}

TEST(SyntheticNetworkTest, SmallNetworkCapsConnections) {
    SyntheticOptions opts;
    opts.profiles = 3;
    opts.min_connections = 2;
    opts.max_connections = 2;

    auto ps = generate_synthetic_network(opts);
    for (const auto& p : ps) EXPECT_EQ(p.connections.size(), 2u);

    ProfileStore store;
    EXPECT_NO_THROW(store.load(ps));
}
