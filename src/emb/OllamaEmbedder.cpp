#include "emb/OllamaEmbedder.hpp"
#include "llm/ProcUtil.hpp"
#include "nlohmann/json.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace emb {

OllamaEmbedder::OllamaEmbedder(const std::string& model,
                               const std::string& base_url,
                               const std::string& document_prefix,
                               const std::string& query_prefix,
                               int timeout_seconds)
    : model_(model),
      base_url_(base_url),
      document_prefix_(document_prefix),
      query_prefix_(query_prefix),
      timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::vector<std::vector<float>> OllamaEmbedder::embed(const std::vector<std::string>& texts,
                                                      EmbedPurpose purpose) const {
    if (texts.empty()) return {};

    const std::string& prefix = purpose == EmbedPurpose::Query ? query_prefix_ : document_prefix_;

    json input = json::array();
    for (const auto& t : texts) input.push_back(prefix + t);

    json payload = {
        {"model", model_},
        {"input", input}
    };

    const std::string body = procutil::curl_post_json(base_url_ + "/api/embed", payload.dump(), timeout_seconds_);

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("ollama embed: invalid JSON response: ") + e.what());
    }

    if (j.contains("error") && j["error"].is_string()) {
        throw std::runtime_error("ollama embed: " + j["error"].get<std::string>());
    }
    if (!j.contains("embeddings") || !j["embeddings"].is_array()) {
        throw std::runtime_error("ollama embed: response has no 'embeddings' array");
    }

    const json& arr = j["embeddings"];
    if (arr.size() != texts.size()) {
        throw std::runtime_error("ollama embed: expected " + std::to_string(texts.size()) +
                                 " vectors, got " + std::to_string(arr.size()));
    }

    std::vector<std::vector<float>> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_array()) throw std::runtime_error("ollama embed: embedding is not an array");
        out.push_back(v.get<std::vector<float>>());
    }
    return out;
}

} // namespace emb
