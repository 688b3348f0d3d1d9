#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "commands/Common.hpp"
#include "util/Errors.hpp"

using netmatch::ValidationError;

namespace {

// argv view over owned strings
struct Argv {
    std::vector<std::string> args;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        for (auto& s : args) ptrs.push_back(&s[0]);
    }
    int argc() const { return (int)ptrs.size(); }
    char** argv() { return ptrs.data(); }
};

}  // namespace

TEST(CliArgsTest, BoundedIntUsesDefaultWhenAbsent) {
    Argv a({"netmatch", "match"});
    EXPECT_EQ(cli::get_int_in(a.argc(), a.argv(), "--max_results", 10, 1, 1000000), 10);
}

TEST(CliArgsTest, BoundedIntAcceptsValuesInRange) {
    Argv a({"netmatch", "match", "--max_results", "3"});
    EXPECT_EQ(cli::get_int_in(a.argc(), a.argv(), "--max_results", 10, 1, 1000000), 3);
}

TEST(CliArgsTest, BoundedIntRejectsValuesThatWouldWrap) {
    Argv low({"netmatch", "match", "--max_results", "-4294967295"});
    EXPECT_THROW(cli::get_int_in(low.argc(), low.argv(), "--max_results", 10, 1, 1000000), ValidationError);

    Argv high({"netmatch", "match", "--max_results", "4294967297"});
    EXPECT_THROW(cli::get_int_in(high.argc(), high.argv(), "--max_results", 10, 1, 1000000), ValidationError);

    Argv zero({"netmatch", "match", "--max_results", "0"});
    EXPECT_THROW(cli::get_int_in(zero.argc(), zero.argv(), "--max_results", 10, 1, 1000000), ValidationError);

    Argv junk({"netmatch", "match", "--max_results", "ten"});
    EXPECT_THROW(cli::get_int_in(junk.argc(), junk.argv(), "--max_results", 10, 1, 1000000), ValidationError);
}

TEST(CliArgsTest, MutualLimitAboveFiveIsRejected) {
    Argv a({"netmatch", "match", "--mutual_limit", "8"});
    EXPECT_THROW(cli::load_config(a.argc(), a.argv()), ValidationError);

    Argv ok({"netmatch", "match", "--mutual_limit", "2"});
    EXPECT_EQ(cli::load_config(ok.argc(), ok.argv()).mutual_limit, 2u);
}
