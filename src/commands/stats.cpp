#include "commands/stats.hpp"
#include "commands/Common.hpp"
#include "io/JsonIO.hpp"
#include "match/MatchArtifact.hpp"

#include <iostream>
#include <string>

using namespace netmatch;

int cmd_stats(int argc, char** argv) {
    return cli::run_guarded("stats", [&]() {
        const std::string outp = cli::get_arg(argc, argv, "--out", "");

        MatchConfig cfg = cli::load_config(argc, argv);
        cfg.strategy = RankingMode::Local;
        cfg.embed_profiles = false;

        cli::OfflineQueryParser parser;
        MatchEngine engine(parser, nullptr, make_ranking_strategy(RankingMode::Local, nullptr), cfg);
        cli::load_network_into(engine, argc, argv);

        const nlohmann::json j = network_stats_to_json(engine.network_stats());
        std::cout << j.dump(2) << "\n";

        if (!outp.empty()) {
            write_json(outp, j);
            std::cout << "OUT_STATS: " << outp << "\n";
        }
        return 0;
    });
}
