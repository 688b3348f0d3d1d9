#include "commands/match.hpp"
#include "commands/Common.hpp"
#include "io/JsonIO.hpp"
#include "match/MatchArtifact.hpp"
#include "util/Errors.hpp"

#include <cstdio>
#include <iostream>
#include <string>

using namespace netmatch;

static void print_results(const MatchResponse& resp) {
    std::cout << "requester: " << resp.requester.name << " (" << resp.requester.job_title
              << " @ " << resp.requester.company << ")\n";
    std::cout << "query: " << resp.query << "\n";
    std::cout << "candidates evaluated: " << resp.metadata.total_candidates_evaluated
              << ", strategy: " << ranking_mode_str(resp.metadata.ranking_strategy)
              << ", query embedding: " << (resp.metadata.query_embedding_available ? "yes" : "no") << "\n\n";

    for (const auto& r : resp.results) {
        char score[16];
        std::snprintf(score, sizeof(score), "%.3f", r.total_score);

        std::cout << "#" << r.rank << "  " << score << "  " << r.profile.name
                  << " | " << r.profile.job_title << " @ " << r.profile.company
                  << "  [" << path_kind_str(r.path.kind);
        if (r.path.kind == PathKind::TwoHop) std::cout << " via " << r.path.via;
        std::cout << "]\n";

        if (!r.explanation.empty()) std::cout << "    " << r.explanation << "\n";
    }
}

int cmd_match(int argc, char** argv) {
    return cli::run_guarded("match", [&]() {
        const std::string requester = cli::require_arg(argc, argv, "--requester");
        const std::string query     = cli::require_arg(argc, argv, "--query");
        const int max_results       = cli::get_int_in(argc, argv, "--max_results", 10, 1, 1000000);
        const bool explain          = !cli::has_flag(argc, argv, "--no_explanations");
        const std::string outp      = cli::get_arg(argc, argv, "--out", "out/match.json");

        MatchConfig cfg = cli::load_config(argc, argv);
        cli::Collaborators collab = cli::make_collaborators(argc, argv);

        if (cfg.strategy == RankingMode::Rerank && !collab.reranker) {
            throw ValidationError("--strategy rerank needs an embedder (--embedder onnx|ollama)");
        }

        MatchEngine engine(*collab.parser,
                           collab.embedder.get(),
                           make_ranking_strategy(cfg.strategy, collab.reranker.get(), cfg.scoring_workers),
                           cfg);

        cli::load_network_into(engine, argc, argv);
        cli::load_embedding_cache(engine, argc, argv);

        MatchResponse resp = engine.find_connections(requester, query, max_results, explain);

        print_results(resp);

        write_json(outp, match_response_to_json(resp));
        std::cout << "\nOUT_MATCH: " << outp << "\n";
        return 0;
    });
}
