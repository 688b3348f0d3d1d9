#include "commands/embed.hpp"
#include "commands/generate.hpp"
#include "commands/match.hpp"
#include "commands/mutual.hpp"
#include "commands/profiles.hpp"
#include "commands/stats.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  netmatch generate [args]\n"
        << "  netmatch match --requester <id> --query \"<text>\" [args]\n"
        << "  netmatch stats [args]\n"
        << "  netmatch mutual --a <id> --b <id> [args]\n"
        << "  netmatch profiles [args]\n"
        << "  netmatch embed --network <file> [args]\n"
        << "  netmatch help\n"
        << "\n"
        << "run `netmatch <command> --help` for options\n";
    return 2;
}

static const char* kNetworkHelp =
    "network:\n"
    "  --network <file>             network JSON (profiles + connections)\n"
    "  --synthetic <n>              otherwise: generate n profiles, default: 50\n"
    "  --seed <n>                   synthetic seed, default: 42\n"
    "  --config <file>              MatchConfig JSON (weights, strategy, limits)\n";

static int print_generate_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch generate [options]\n"
        << "\n"
        << "options:\n"
        << "  --count <n>                  default: 50\n"
        << "  --seed <n>                   default: 42\n"
        << "  --out <path>                 default: data/network.json\n";
    return 0;
}

static int print_match_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch match --requester <id> --query \"<text>\" [options]\n"
        << "\n"
        << "common:\n"
        << "  --requester <id>             (required)\n"
        << "  --query <str>                (required)\n"
        << "  --max_results <n>            1..1000000, default: 10\n"
        << "  --no_explanations            omit explanation strings\n"
        << "  --out <path>                 default: out/match.json\n"
        << "\n"
        << kNetworkHelp
        << "\n"
        << "ranking:\n"
        << "  --strategy <local|rerank>    default: local (or config)\n"
        << "  --mutual_limit <n>           default: 5\n"
        << "  --workers <n>                local scoring threads, default: 0 (sequential)\n"
        << "  --embed_profiles             embed every profile on load\n"
        << "  --emb_cache <path>           precomputed profile vectors from `netmatch embed`\n"
        << "\n"
        << "query parser:\n"
        << "  --parser <ollama|mock>       default: ollama\n"
        << "  --parser_mock <file>         fixture JSON for the mock parser\n"
        << "  --llm_model <str>            default: llama3.1:8b\n"
        << "  --llm_url <url>              default: http://127.0.0.1:11434\n"
        << "  --llm_cache <dir>            default: out/llm_cache\n"
        << "\n"
        << "embedder:\n"
        << "  --embedder <none|onnx|ollama> default: none\n"
        << "  --emb_model <path>           default: models/emb/model.onnx\n"
        << "  --emb_vocab <path>           default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n"
        << "  --emb_ollama_model <str>     default: nomic-embed-text\n";
    return 0;
}

static int print_stats_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch stats [options]\n"
        << "\n"
        << kNetworkHelp
        << "  --out <path>                 optional: also write the JSON to a file\n";
    return 0;
}

static int print_mutual_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch mutual --a <id> --b <id> [options]\n"
        << "\n"
        << kNetworkHelp
        << "  --mutual_limit <n>           default: 5\n";
    return 0;
}

static int print_profiles_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch profiles [options]\n"
        << "\n"
        << kNetworkHelp
        << "\n"
        << "listing:\n"
        << "  --id <id>                    print one full profile as JSON\n"
        << "  --company <str>              substring filter, case-insensitive\n"
        << "  --title <str>                substring filter on job title\n"
        << "  --limit <n>                  default: 50\n"
        << "  --offset <n>                 default: 0\n"
        << "  --json                       JSON output\n";
    return 0;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  netmatch embed --network <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: data/embeddings/profiles.bin\n"
        << "  --embedder <onnx|ollama>     default: onnx\n"
        << "  --emb_model <path>           default: models/emb/model.onnx\n"
        << "  --emb_vocab <path>           default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n"
        << "  --emb_ollama_model <str>     default: nomic-embed-text\n"
        << "  --llm_url <url>              default: http://127.0.0.1:11434\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    const bool want_help = argc >= 3 && std::string(argv[2]) == "--help";

    if (cmd == "generate") return want_help ? print_generate_help() : cmd_generate(argc - 1, argv + 1);
    if (cmd == "match")    return want_help ? print_match_help()    : cmd_match(argc - 1, argv + 1);
    if (cmd == "stats")    return want_help ? print_stats_help()    : cmd_stats(argc - 1, argv + 1);
    if (cmd == "mutual")   return want_help ? print_mutual_help()   : cmd_mutual(argc - 1, argv + 1);
    if (cmd == "profiles") return want_help ? print_profiles_help() : cmd_profiles(argc - 1, argv + 1);
    if (cmd == "embed")    return want_help ? print_embed_help()    : cmd_embed(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
