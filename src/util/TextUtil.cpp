#include "util/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string normalize_key(const std::string& s) {
    return to_lower(trim(s));
}

bool iequals(const std::string& a, const std::string& b) {
    return normalize_key(a) == normalize_key(b);
}

bool icontains(const std::string& haystack, const std::string& needle) {
    const std::string n = normalize_key(needle);
    if (n.empty()) return false;
    return to_lower(haystack).find(n) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}
