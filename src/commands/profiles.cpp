#include "commands/profiles.hpp"
#include "commands/Common.hpp"
#include "io/JsonIO.hpp"
#include "match/MatchArtifact.hpp"
#include "util/Errors.hpp"

#include <iostream>
#include <string>

using namespace netmatch;

int cmd_profiles(int argc, char** argv) {
    return cli::run_guarded("profiles", [&]() {
        MatchConfig cfg = cli::load_config(argc, argv);
        cfg.strategy = RankingMode::Local;
        cfg.embed_profiles = false;

        cli::OfflineQueryParser parser;
        MatchEngine engine(parser, nullptr, make_ranking_strategy(RankingMode::Local, nullptr), cfg);
        cli::load_network_into(engine, argc, argv);

        const std::string id = cli::get_arg(argc, argv, "--id", "");
        if (!id.empty()) {
            std::cout << profile_to_json(engine.profile(id)).dump(2) << "\n";
            return 0;
        }

        ProfileFilter filter;
        filter.company = cli::get_arg(argc, argv, "--company", "");
        filter.job_title = cli::get_arg(argc, argv, "--title", "");

        const long limit = cli::get_int(argc, argv, "--limit", 50);
        const long offset = cli::get_int(argc, argv, "--offset", 0);
        if (limit <= 0) throw ValidationError("--limit must be > 0");
        if (offset < 0) throw ValidationError("--offset must be >= 0");
        filter.limit = (size_t)limit;
        filter.offset = (size_t)offset;

        const ProfilePage page = engine.list_profiles(filter);

        if (cli::has_flag(argc, argv, "--json")) {
            std::cout << profile_page_to_json(page, filter).dump(2) << "\n";
            return 0;
        }

        for (const auto& p : page.profiles) {
            std::cout << p.id << "  " << p.name << " | " << p.job_title << " @ " << p.company << "\n";
        }
        std::cout << "(" << page.profiles.size() << " of " << page.total << " matching)\n";
        return 0;
    });
}
