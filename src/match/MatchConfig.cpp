#include "match/MatchConfig.hpp"

#include "util/Errors.hpp"

#include <string>

namespace netmatch {

void MatchConfig::validate() const {
    weights.validate();

    if (mutual_limit == 0 || mutual_limit > kMaxMutualConnections) {
        throw ValidationError("mutual_limit must be in 1.." + std::to_string(kMaxMutualConnections));
    }
    if (stats.top_companies == 0 || stats.top_industries == 0 || stats.top_job_titles == 0) {
        throw ValidationError("stats.top_* limits must be > 0");
    }
}

}  // namespace netmatch
