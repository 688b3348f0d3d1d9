#include "llm/OllamaQueryParser.hpp"
#include "llm/ProcUtil.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// very small FNV-1a hash for cache keys (deterministic, no deps)
static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

OllamaQueryParser::OllamaQueryParser(const std::string& model,
                                     const std::string& base_url,
                                     const std::string& cache_dir,
                                     int timeout_seconds)
    : model_(model), base_url_(base_url), cache_dir_(cache_dir), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();

    if (!cache_dir_.empty()) {
        std::error_code ec;
        fs::create_directories(cache_dir_, ec);
        if (ec) {
            std::cerr << "OllamaQueryParser: cache disabled, cannot create " << cache_dir_.string()
                      << ": " << ec.message() << "\n";
            cache_dir_.clear();
        }
    }
}

std::string OllamaQueryParser::cache_key(const std::string& input) const {
    std::string s = model_ + "\n" + input;
    return "parse_v1-" + hex_u64(fnv1a64(s));
}

bool OllamaQueryParser::load_cache(const std::string& key, std::string& out) const {
    if (cache_dir_.empty()) return false;
    fs::path p = cache_dir_ / (key + ".json");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return !out.empty();
}

void OllamaQueryParser::save_cache(const std::string& key, const std::string& content) const {
    if (cache_dir_.empty()) return;
    fs::path p = cache_dir_ / (key + ".json");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "OllamaQueryParser: failed to write cache entry " << p.string() << "\n";
        return;
    }
    f << content;
}

std::string OllamaQueryParser::prompt_parse(const std::string& query) const {
    std::ostringstream p;
    p <<
R"(Parse this professional networking query and extract structured criteria.
Return ONLY valid JSON. No markdown. No commentary.

Output schema:
{
  "job_titles": ["..."],
  "companies": ["..."],
  "skills": ["..."],
  "industries": ["..."],
  "experience_level": "junior|senior|executive|any",
  "education": ["..."],
  "other_criteria": "..."
}

Rules:
- job_titles: job titles mentioned (e.g. "AI Engineer", "Software Engineer").
- companies: companies mentioned (e.g. "Google", "Microsoft").
- skills: skills or tools mentioned (e.g. "Python", "Machine Learning").
- industries: industries mentioned (e.g. "Technology", "Healthcare").
- experience_level: "any" unless the query states a level.
- education: schools or degrees mentioned (e.g. "Stanford", "PhD").
- Use [] for list fields with nothing mentioned and "" for other_criteria.

Query: )" << json(query).dump();
    return p.str();
}

std::string OllamaQueryParser::run_ollama_json(const std::string& prompt) const {
    json payload = {
        {"model", model_},
        {"prompt", prompt},
        {"stream", false},
        {"format", "json"},
        {"options", {
            {"temperature", 0},
            {"num_predict", 512}
        }}
    };

    const std::string body = procutil::curl_post_json(base_url_ + "/api/generate", payload.dump(), timeout_seconds_);

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("ollama returned non-JSON envelope: ") + e.what());
    }

    if (j.contains("error") && j["error"].is_string()) {
        throw std::runtime_error("ollama error: " + j["error"].get<std::string>());
    }
    if (!j.contains("response") || !j["response"].is_string()) {
        throw ParseError("ollama envelope has no 'response' string");
    }
    return j["response"].get<std::string>();
}

ParsedQuery OllamaQueryParser::parse(const std::string& query) {
    const std::string key = cache_key(query);

    std::string cached;
    if (load_cache(key, cached)) {
        try {
            return parse_query_json(cached);
        } catch (const ParseError& e) {
            std::cerr << "OllamaQueryParser: ignoring bad cache entry " << key << ": " << e.what() << "\n";
        }
    }

    const std::string out = run_ollama_json(prompt_parse(query));

    // throws ParseError before anything is cached
    ParsedQuery parsed = parse_query_json(out);
    save_cache(key, out);
    return parsed;
}

} // namespace llm
