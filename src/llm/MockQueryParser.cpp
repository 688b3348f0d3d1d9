#include "llm/MockQueryParser.hpp"
#include "nlohmann/json.hpp"
#include "util/TextUtil.hpp"

#include <fstream>

using json = nlohmann::json;

namespace llm {

MockQueryParser::MockQueryParser(const std::string& fixture_path) {
    std::ifstream f(fixture_path);
    if (!f) throw ParseError("cannot open query fixture: " + fixture_path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ParseError("invalid JSON in query fixture " + fixture_path + ": " + e.what());
    }

    if (!j.is_object()) throw ParseError("query fixture root must be an object");

    if (j.contains("queries")) {
        const json& qs = j.at("queries");
        if (!qs.is_object()) throw ParseError("query fixture 'queries' must be an object");
        for (auto it = qs.begin(); it != qs.end(); ++it) {
            by_query_[textutil::normalize_key(it.key())] = parse_query_json(it.value());
        }
    }

    if (j.contains("default") && !j.at("default").is_null()) {
        fallback_ = parse_query_json(j.at("default"));
    }
}

ParsedQuery MockQueryParser::parse(const std::string& query) {
    auto it = by_query_.find(textutil::normalize_key(query));
    if (it == by_query_.end()) return fallback_;
    return it->second;
}

} // namespace llm
