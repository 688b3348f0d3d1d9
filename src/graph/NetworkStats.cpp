#include "graph/NetworkStats.hpp"

#include <algorithm>
#include <unordered_map>

namespace netmatch {

namespace {

// Counts values keeping the order in which each value was first seen.
class FrequencyTable {
public:
    void add(const std::string& v) {
        if (v.empty()) return;
        auto it = m_pos.find(v);
        if (it == m_pos.end()) {
            m_pos.emplace(v, m_rows.size());
            m_rows.emplace_back(v, 1);
        } else {
            m_rows[it->second].second++;
        }
    }

    std::vector<CountedValue> top(size_t n) const {
        std::vector<CountedValue> rows = m_rows;
        std::stable_sort(rows.begin(), rows.end(),
                         [](const CountedValue& a, const CountedValue& b) {
                             return a.second > b.second;
                         });
        if (rows.size() > n) rows.resize(n);
        return rows;
    }

private:
    std::vector<CountedValue> m_rows;
    std::unordered_map<std::string, size_t> m_pos;
};

}  // namespace

NetworkStats compute_network_stats(const ProfileStore& store, const StatsOptions& opts) {
    NetworkStats st;
    st.total_profiles = store.size();
    st.total_connections = store.edge_count();

    FrequencyTable companies, industries, titles;

    bool first = true;
    for (const auto& p : store.profiles()) {
        const size_t deg = p.connections.size();
        st.degree_histogram[deg]++;
        if (first) {
            st.min_degree = st.max_degree = deg;
            first = false;
        } else {
            st.min_degree = std::min(st.min_degree, deg);
            st.max_degree = std::max(st.max_degree, deg);
        }

        companies.add(p.company);
        industries.add(p.industry);
        titles.add(p.job_title);
    }

    if (st.total_profiles > 0) {
        st.average_degree = static_cast<double>(st.total_connections * 2) /
                            static_cast<double>(st.total_profiles);
    }

    st.top_companies = companies.top(opts.top_companies);
    st.top_industries = industries.top(opts.top_industries);
    st.top_job_titles = titles.top(opts.top_job_titles);
    return st;
}

}  // namespace netmatch
