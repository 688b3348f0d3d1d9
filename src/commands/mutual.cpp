#include "commands/mutual.hpp"
#include "commands/Common.hpp"
#include "match/MatchArtifact.hpp"

#include <iostream>
#include <string>

using namespace netmatch;

int cmd_mutual(int argc, char** argv) {
    return cli::run_guarded("mutual", [&]() {
        const std::string a = cli::require_arg(argc, argv, "--a");
        const std::string b = cli::require_arg(argc, argv, "--b");

        MatchConfig cfg = cli::load_config(argc, argv);
        cfg.strategy = RankingMode::Local;
        cfg.embed_profiles = false;

        cli::OfflineQueryParser parser;
        MatchEngine engine(parser, nullptr, make_ranking_strategy(RankingMode::Local, nullptr), cfg);
        cli::load_network_into(engine, argc, argv);

        const Profile pa = engine.profile(a);
        const Profile pb = engine.profile(b);
        const auto mutuals = engine.mutual_connections(a, b);

        std::cout << pa.name << " <-> " << pb.name << "\n";
        std::cout << "path: " << path_kind_str(engine.connection_path(a, b).kind) << "\n";
        std::cout << "mutual connections (" << mutuals.size() << "):\n";
        for (const auto& m : mutuals) {
            std::cout << "  " << m.id << "  " << m.name << " | " << m.job_title << " @ " << m.company << "\n";
        }
        return 0;
    });
}
