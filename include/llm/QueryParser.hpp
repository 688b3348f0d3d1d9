#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace llm {

enum class ExperienceLevel {
    Any,
    Junior,
    Senior,
    Executive
};

const char* experience_level_str(ExperienceLevel lvl);

// unknown / empty -> Any
ExperienceLevel parse_experience_level(const std::string& s);

// Structured criteria extracted from a natural-language networking query.
struct ParsedQuery {
    std::vector<std::string> job_titles;
    std::vector<std::string> companies;
    std::vector<std::string> skills;
    std::vector<std::string> industries;
    ExperienceLevel experience_level = ExperienceLevel::Any;
    std::vector<std::string> education;   // universities or degree names
    std::string other_criteria;

    nlohmann::json to_json() const;
};

// Malformed upstream response.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// Accepts a list, a single string or null for every list field.
// Throws ParseError on invalid JSON, a non-object root or wrong field types.
ParsedQuery parse_query_json(const std::string& text);
ParsedQuery parse_query_json(const nlohmann::json& j);

class QueryParser {
public:
    virtual ~QueryParser() = default;

    // throws ParseError (or any std::exception on transport failure)
    virtual ParsedQuery parse(const std::string& query) = 0;
};

} // namespace llm
