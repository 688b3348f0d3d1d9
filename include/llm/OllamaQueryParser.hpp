#pragma once

#include "llm/QueryParser.hpp"

#include <filesystem>
#include <string>

namespace llm {

// Query parsing through a local Ollama server (/api/generate, format=json).
// Successful responses are cached on disk by model + query.
class OllamaQueryParser final : public QueryParser {
    std::string model_;
    std::string base_url_;
    std::filesystem::path cache_dir_;   // empty = no cache
    int timeout_seconds_;

public:
    OllamaQueryParser(const std::string& model,
                      const std::string& base_url = "http://127.0.0.1:11434",
                      const std::string& cache_dir = "",
                      int timeout_seconds = 60);

    ParsedQuery parse(const std::string& query) override;

private:
    std::string prompt_parse(const std::string& query) const;

    // the model's "response" field; throws on transport or envelope errors
    std::string run_ollama_json(const std::string& prompt) const;

    std::string cache_key(const std::string& input) const;
    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

} // namespace llm
