#pragma once
#include <string>

#include "graph/Profile.hpp"

namespace netmatch {

// Single descriptive block used for reranking and document embeddings:
// "Name: .. | Role: .. | Company: .. | Bio: .. | Skills: .. | Education: .. |
//  Previous companies: .. | Industry: ..", absent fields omitted.
std::string format_profile_text(const Profile& p);

}  // namespace netmatch
