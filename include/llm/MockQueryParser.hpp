#pragma once

#include "llm/QueryParser.hpp"

#include <string>
#include <unordered_map>

namespace llm {

// Canned parses from a fixture file:
//   {"queries": {"<query text>": {...parsed query...}}, "default": {...}}
// Lookup is on trimmed, lowercased query text. Unknown queries get "default"
// when present, an empty ParsedQuery otherwise.
class MockQueryParser final : public QueryParser {
    std::unordered_map<std::string, ParsedQuery> by_query_;
    ParsedQuery fallback_;

public:
    // throws ParseError on unreadable or malformed fixtures
    explicit MockQueryParser(const std::string& fixture_path);

    ParsedQuery parse(const std::string& query) override;

    size_t size() const { return by_query_.size(); }
};

} // namespace llm
