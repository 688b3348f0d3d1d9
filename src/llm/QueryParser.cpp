#include "llm/QueryParser.hpp"

#include "util/TextUtil.hpp"

using json = nlohmann::json;

namespace llm {

const char* experience_level_str(ExperienceLevel lvl) {
    switch (lvl) {
        case ExperienceLevel::Junior: return "junior";
        case ExperienceLevel::Senior: return "senior";
        case ExperienceLevel::Executive: return "executive";
        case ExperienceLevel::Any: return "any";
        default: return "any";
    }
}

ExperienceLevel parse_experience_level(const std::string& s) {
    const std::string k = textutil::normalize_key(s);
    if (k == "junior") return ExperienceLevel::Junior;
    if (k == "senior") return ExperienceLevel::Senior;
    if (k == "executive") return ExperienceLevel::Executive;
    return ExperienceLevel::Any;
}

json ParsedQuery::to_json() const {
    return {
        {"job_titles", job_titles},
        {"companies", companies},
        {"skills", skills},
        {"industries", industries},
        {"experience_level", experience_level_str(experience_level)},
        {"education", education},
        {"other_criteria", other_criteria}
    };
}

static std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& v = j.at(key);
    if (v.is_null()) return out;

    if (v.is_string()) {
        const std::string s = textutil::trim(v.get<std::string>());
        if (!s.empty()) out.push_back(s);
        return out;
    }

    if (!v.is_array()) {
        throw ParseError(std::string("field '") + key + "' must be a list of strings");
    }

    for (const auto& item : v) {
        if (item.is_null()) continue;
        if (!item.is_string()) {
            throw ParseError(std::string("field '") + key + "' contains a non-string entry");
        }
        const std::string s = textutil::trim(item.get<std::string>());
        if (!s.empty()) out.push_back(s);
    }
    return out;
}

ParsedQuery parse_query_json(const json& j) {
    if (!j.is_object()) throw ParseError("parsed query must be a JSON object");

    ParsedQuery q;
    q.job_titles = string_list(j, "job_titles");
    q.companies  = string_list(j, "companies");
    q.skills     = string_list(j, "skills");
    q.industries = string_list(j, "industries");
    q.education  = string_list(j, "education");

    if (j.contains("experience_level")) {
        const json& lvl = j.at("experience_level");
        if (lvl.is_string()) q.experience_level = parse_experience_level(lvl.get<std::string>());
        else if (!lvl.is_null()) throw ParseError("field 'experience_level' must be a string");
    }

    if (j.contains("other_criteria")) {
        const json& oc = j.at("other_criteria");
        if (oc.is_string()) {
            q.other_criteria = oc.get<std::string>();
        } else if (oc.is_array()) {
            std::vector<std::string> parts;
            for (const auto& item : oc) {
                if (item.is_string()) parts.push_back(item.get<std::string>());
            }
            q.other_criteria = textutil::join(parts, "; ");
        } else if (!oc.is_null()) {
            throw ParseError("field 'other_criteria' must be a string");
        }
    }

    return q;
}

ParsedQuery parse_query_json(const std::string& text) {
    // models sometimes wrap the object in prose; keep the outermost braces
    std::string s = text;
    auto a = s.find('{');
    auto b = s.rfind('}');
    if (a == std::string::npos || b == std::string::npos || b < a) {
        throw ParseError("no JSON object in query parser response");
    }
    s = s.substr(a, b - a + 1);

    json j;
    try {
        j = json::parse(s);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("invalid JSON from query parser: ") + e.what());
    }
    return parse_query_json(j);
}

} // namespace llm
