#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "graph/GraphQueries.hpp"
#include "graph/ProfileStore.hpp"
#include "util/Errors.hpp"

using namespace netmatch;
using fakes::make_profile;

// A{B,C}, D{C,E}
static ProfileStore small_store() {
    Profile a = make_profile("A", "Ava");
    Profile b = make_profile("B", "Bo");
    Profile c = make_profile("C", "Cyrus");
    Profile d = make_profile("D", "Dara");
    Profile e = make_profile("E", "Eli");
    Profile f = make_profile("F", "Fern");
    a.connections = {"B", "C"};
    d.connections = {"C", "E"};

    ProfileStore store;
    store.load({a, b, c, d, e, f});
    return store;
}

TEST(GraphQueriesTest, MutualOfSharedNeighbour) {
    ProfileStore store = small_store();

    auto m = mutual_connections(store, "A", "D");
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].id, "C");
    EXPECT_EQ(m[0].name, "Cyrus");
}

TEST(GraphQueriesTest, TwoHopNamesTheBridge) {
    ProfileStore store = small_store();

    PathClassification pc = classify_path(store, "A", "D");
    EXPECT_EQ(pc.kind, PathKind::TwoHop);
    EXPECT_EQ(pc.labels(), (std::vector<std::string>{"2-hop", "Cyrus"}));
}

TEST(GraphQueriesTest, DirectConnection) {
    ProfileStore store = small_store();

    EXPECT_EQ(classify_path(store, "A", "B").labels(), std::vector<std::string>{"direct"});
    // back-edge was inserted on load
    EXPECT_EQ(classify_path(store, "B", "A").labels(), std::vector<std::string>{"direct"});
}

TEST(GraphQueriesTest, NoPathWhenNothingShared) {
    ProfileStore store = small_store();

    EXPECT_EQ(classify_path(store, "A", "F").labels(), std::vector<std::string>{"no_direct_path"});
    EXPECT_TRUE(mutual_connections(store, "A", "F").empty());
}

TEST(GraphQueriesTest, MutualsAreSymmetricAsSets) {
    ProfileStore store = small_store();

    auto ab = mutual_connections(store, "A", "D");
    auto ba = mutual_connections(store, "D", "A");
    ASSERT_EQ(ab.size(), ba.size());
    EXPECT_EQ(ab[0].id, ba[0].id);
}

TEST(GraphQueriesTest, MutualsFollowRequesterOrderAndLimit) {
    Profile a = make_profile("A", "Ava");
    Profile z = make_profile("Z", "Zed");
    std::vector<Profile> all = {a, z};
    for (const char* id : {"m5", "m1", "m3", "m2", "m4", "m6", "m7"}) {
        all.push_back(make_profile(id, id));
        all[0].connections.push_back(id);
        all[1].connections.push_back(id);
    }

    ProfileStore store;
    store.load(all);

    auto m = mutual_connections(store, "A", "Z", 5);
    ASSERT_EQ(m.size(), 5u);
    EXPECT_EQ(m[0].id, "m5");
    EXPECT_EQ(m[1].id, "m1");
    EXPECT_EQ(m[4].id, "m4");

    EXPECT_EQ(mutual_connections(store, "A", "Z", 100).size(), 7u);
}

TEST(GraphQueriesTest, UnknownIdThrowsNotFound) {
    ProfileStore store = small_store();

    EXPECT_THROW(mutual_connections(store, "A", "nobody"), NotFoundError);
    EXPECT_THROW(mutual_connections(store, "nobody", "A"), NotFoundError);
    EXPECT_THROW(classify_path(store, "nobody", "A"), NotFoundError);
}
