#pragma once

#include <functional>
#include <memory>
#include <string>

#include "emb/Embedder.hpp"
#include "llm/QueryParser.hpp"
#include "llm/Reranker.hpp"
#include "match/MatchConfig.hpp"
#include "match/MatchEngine.hpp"

namespace cli {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
bool has_flag(int argc, char** argv, const std::string& key);

// ValidationError when the value is present but not a number
long get_int(int argc, char** argv, const std::string& key, long def);

// get_int narrowed to int; ValidationError outside [lo, hi]
int get_int_in(int argc, char** argv, const std::string& key, int def, int lo, int hi);

// ValidationError naming the missing flag
std::string require_arg(int argc, char** argv, const std::string& key);

// For graph-only commands, which never parse a query.
class OfflineQueryParser final : public llm::QueryParser {
public:
    llm::ParsedQuery parse(const std::string&) override {
        throw llm::ParseError("query parsing is not available in this command");
    }
};

// Owns whatever adapters the flags asked for.
struct Collaborators {
    std::unique_ptr<llm::QueryParser> parser;
    std::unique_ptr<emb::Embedder> embedder;   // null for --embedder none
    std::unique_ptr<llm::Reranker> reranker;   // only with an embedder
};

// --parser ollama|mock, --parser_mock, --llm_model, --llm_url, --llm_cache
std::unique_ptr<llm::QueryParser> make_parser(int argc, char** argv);

// --embedder none|onnx|ollama, --emb_model, --emb_vocab, --emb_ollama_model, --llm_url
std::unique_ptr<emb::Embedder> make_embedder(int argc, char** argv, const std::string& default_kind);

Collaborators make_collaborators(int argc, char** argv);

// --config file, then --strategy / --mutual_limit / --embed_profiles / --workers overrides
netmatch::MatchConfig load_config(int argc, char** argv);

// --network <file> or a synthetic population (--synthetic <n>, --seed <n>)
netmatch::LoadSummary load_network_into(netmatch::MatchEngine& engine, int argc, char** argv);

// --emb_cache <file>: install precomputed profile vectors
void load_embedding_cache(netmatch::MatchEngine& engine, int argc, char** argv);

// Runs a command body and maps exceptions to exit codes:
// 2 usage / validation / not found / data integrity, 1 collaborator or system failure.
int run_guarded(const char* command, const std::function<int()>& body);

} // namespace cli
