#include "commands/Common.hpp"

#include "emb/EmbeddingReranker.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "emb/OllamaEmbedder.hpp"
#include "io/JsonIO.hpp"
#include "llm/MockQueryParser.hpp"
#include "llm/OllamaQueryParser.hpp"
#include "util/Errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using netmatch::ValidationError;

namespace cli {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

long get_int(int argc, char** argv, const std::string& key, long def) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return def;

    char* end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0') {
        throw ValidationError(key + " expects an integer, got '" + v + "'");
    }
    return n;
}

int get_int_in(int argc, char** argv, const std::string& key, int def, int lo, int hi) {
    const long n = get_int(argc, argv, key, def);
    if (n < lo || n > hi) {
        throw ValidationError(key + " must be in " + std::to_string(lo) + ".." + std::to_string(hi) +
                              ", got " + std::to_string(n));
    }
    return (int)n;
}

std::string require_arg(int argc, char** argv, const std::string& key) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) throw ValidationError("missing required option " + key);
    return v;
}

std::unique_ptr<llm::QueryParser> make_parser(int argc, char** argv) {
    const std::string mock = get_arg(argc, argv, "--parser_mock", "");
    const std::string kind = get_arg(argc, argv, "--parser", mock.empty() ? "ollama" : "mock");

    if (kind == "mock") {
        if (mock.empty()) throw ValidationError("--parser mock requires --parser_mock <file>");
        return std::make_unique<llm::MockQueryParser>(mock);
    }
    if (kind == "ollama") {
        return std::make_unique<llm::OllamaQueryParser>(
            get_arg(argc, argv, "--llm_model", "llama3.1:8b"),
            get_arg(argc, argv, "--llm_url", "http://127.0.0.1:11434"),
            get_arg(argc, argv, "--llm_cache", "out/llm_cache"));
    }
    throw ValidationError("unknown --parser '" + kind + "' (expected ollama|mock)");
}

std::unique_ptr<emb::Embedder> make_embedder(int argc, char** argv, const std::string& default_kind) {
    const std::string kind = get_arg(argc, argv, "--embedder", default_kind);

    if (kind == "none") return nullptr;
    if (kind == "onnx") {
        return std::make_unique<emb::MiniLmEmbedder>(
            get_arg(argc, argv, "--emb_model", "models/emb/model.onnx"),
            get_arg(argc, argv, "--emb_vocab", "models/emb/vocab.txt"),
            (size_t)get_int(argc, argv, "--max_len", 256));
    }
    if (kind == "ollama") {
        return std::make_unique<emb::OllamaEmbedder>(
            get_arg(argc, argv, "--emb_ollama_model", "nomic-embed-text"),
            get_arg(argc, argv, "--llm_url", "http://127.0.0.1:11434"),
            get_arg(argc, argv, "--emb_doc_prefix", ""),
            get_arg(argc, argv, "--emb_query_prefix", ""));
    }
    throw ValidationError("unknown --embedder '" + kind + "' (expected none|onnx|ollama)");
}

Collaborators make_collaborators(int argc, char** argv) {
    Collaborators c;
    c.parser = make_parser(argc, argv);
    c.embedder = make_embedder(argc, argv, "none");
    if (c.embedder) c.reranker = std::make_unique<emb::EmbeddingReranker>(*c.embedder);
    return c;
}

netmatch::MatchConfig load_config(int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--config", "");
    netmatch::MatchConfig cfg = path.empty() ? netmatch::MatchConfig{} : netmatch::load_match_config(path);

    const std::string strategy = get_arg(argc, argv, "--strategy", "");
    if (!strategy.empty()) cfg.strategy = netmatch::parse_ranking_mode(strategy);

    const long mutual_limit = get_int(argc, argv, "--mutual_limit", (long)cfg.mutual_limit);
    if (mutual_limit <= 0 || mutual_limit > (long)netmatch::kMaxMutualConnections) {
        throw ValidationError("--mutual_limit must be in 1.." + std::to_string(netmatch::kMaxMutualConnections));
    }
    cfg.mutual_limit = (size_t)mutual_limit;

    const long workers = get_int(argc, argv, "--workers", (long)cfg.scoring_workers);
    if (workers < 0) throw ValidationError("--workers must be >= 0");
    cfg.scoring_workers = (size_t)workers;

    if (has_flag(argc, argv, "--embed_profiles")) cfg.embed_profiles = true;

    cfg.validate();
    return cfg;
}

netmatch::LoadSummary load_network_into(netmatch::MatchEngine& engine, int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--network", "");
    if (!path.empty()) {
        netmatch::NetworkData data = netmatch::load_network(path);
        return engine.load(std::move(data.profiles), data.edges);
    }

    const long n = get_int(argc, argv, "--synthetic", 50);
    const long seed = get_int(argc, argv, "--seed", 42);
    if (n <= 0) throw ValidationError("--synthetic must be > 0");
    return engine.initialize((size_t)n, (uint32_t)seed);
}

void load_embedding_cache(netmatch::MatchEngine& engine, int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--emb_cache", "");
    if (path.empty()) return;

    emb::EmbeddingIndex idx;
    if (!idx.load(path)) {
        throw std::runtime_error("failed to read embedding cache: " + path);
    }
    std::cerr << "loaded profile embeddings: " << path << " (n=" << idx.size() << ", dim=" << idx.dim() << ")\n";
    engine.set_profile_embeddings(std::move(idx));
}

int run_guarded(const char* command, const std::function<int()>& body) {
    try {
        return body();
    } catch (const netmatch::NotFoundError& e) {
        std::cerr << command << ": not found: " << e.what() << "\n";
        return 2;
    } catch (const netmatch::ValidationError& e) {
        std::cerr << command << ": invalid input: " << e.what() << "\n";
        return 2;
    } catch (const netmatch::DataIntegrityError& e) {
        std::cerr << command << ": bad network data: " << e.what() << "\n";
        return 2;
    } catch (const netmatch::CollaboratorError& e) {
        std::cerr << command << ": upstream failure: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << command << ": error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace cli
