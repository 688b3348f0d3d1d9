#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim(const std::string& s);

std::string to_lower(std::string s);

// trim + lowercase, the key used for every case-insensitive comparison
std::string normalize_key(const std::string& s);

bool iequals(const std::string& a, const std::string& b);

// case-insensitive substring test; an empty needle never matches
bool icontains(const std::string& haystack, const std::string& needle);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}
