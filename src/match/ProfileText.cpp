#include "match/ProfileText.hpp"

#include <unordered_set>
#include <vector>

#include "util/TextUtil.hpp"

namespace netmatch {

static std::string education_text(const Education& e) {
    const std::string degree = textutil::trim(e.degree.value_or(""));
    const std::string field = textutil::trim(e.field.value_or(""));
    const std::string uni = textutil::trim(e.university.value_or(""));

    std::string out = degree;
    if (!field.empty()) out += (out.empty() ? "" : " ") + std::string("in ") + field;
    if (!uni.empty()) out += (out.empty() ? "" : " ") + std::string("from ") + uni;
    return out;
}

std::string format_profile_text(const Profile& p) {
    std::vector<std::string> parts;

    if (!p.name.empty()) parts.push_back("Name: " + p.name);
    if (!p.job_title.empty()) parts.push_back("Role: " + p.job_title);
    if (!p.company.empty()) parts.push_back("Company: " + p.company);
    if (!p.bio.empty()) parts.push_back("Bio: " + p.bio);
    if (!p.skills.empty()) parts.push_back("Skills: " + textutil::join(p.skills, ", "));

    if (p.education) {
        const std::string edu = education_text(*p.education);
        if (!edu.empty()) parts.push_back("Education: " + edu);
    }

    std::vector<std::string> previous;
    std::unordered_set<std::string> seen;
    for (const auto& w : p.work_history) {
        if (w.company.empty()) continue;
        if (seen.insert(textutil::normalize_key(w.company)).second) previous.push_back(w.company);
    }
    if (!previous.empty()) parts.push_back("Previous companies: " + textutil::join(previous, ", "));

    if (!p.industry.empty()) parts.push_back("Industry: " + p.industry);

    return textutil::join(parts, " | ");
}

}  // namespace netmatch
