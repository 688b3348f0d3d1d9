#include "graph/SyntheticNetwork.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <random>
#include <string>
#include <unordered_set>

namespace netmatch {

namespace {

struct CompanyInfo {
    const char* name;
    const char* size;
    const char* industry;
};

const CompanyInfo kCompanies[] = {
    {"Google", "10000+", "Technology"},
    {"Microsoft", "10000+", "Technology"},
    {"OpenAI", "100-500", "AI Research"},
    {"DeepMind", "500-1000", "AI Research"},
    {"Meta", "10000+", "Technology"},
    {"Apple", "10000+", "Technology"},
    {"Tesla", "5000-10000", "Automotive/Energy"},
    {"Stripe", "1000-5000", "Fintech"},
    {"Airbnb", "5000-10000", "Travel"},
    {"Uber", "10000+", "Transportation"},
    {"Netflix", "5000-10000", "Entertainment"},
    {"Salesforce", "10000+", "Enterprise Software"},
    {"Palantir", "1000-5000", "Data Analytics"},
    {"Anthropic", "100-500", "AI Research"},
    {"Scale AI", "500-1000", "AI/ML"},
};

const std::vector<std::vector<std::string>> kTitlesByCategory = {
    // Engineering
    {"Software Engineer", "Senior Software Engineer", "Staff Software Engineer",
     "Principal Engineer", "Engineering Manager", "VP of Engineering",
     "AI Engineer", "ML Engineer", "Data Engineer", "DevOps Engineer",
     "Frontend Engineer", "Backend Engineer", "Full Stack Engineer"},
    // Product
    {"Product Manager", "Senior Product Manager", "Principal Product Manager",
     "VP of Product", "Product Director", "Product Owner", "Growth PM"},
    // Data
    {"Data Scientist", "Senior Data Scientist", "Principal Data Scientist",
     "Data Analyst", "Research Scientist", "ML Researcher", "AI Researcher"},
    // Business
    {"Business Development", "Sales Manager", "Account Executive",
     "Customer Success Manager", "Marketing Manager", "Operations Manager"},
    // Leadership
    {"CEO", "CTO", "CPO", "VP of Engineering", "VP of Product", "VP of Sales",
     "Head of AI", "Head of Data", "Director of Engineering"},
};

const std::vector<std::string> kProgramming = {"Python", "JavaScript", "Java", "C++", "Go", "Rust", "TypeScript", "Swift"};
const std::vector<std::string> kAiMl = {"TensorFlow", "PyTorch", "Scikit-learn", "Keras", "OpenCV", "NLP", "Computer Vision", "Deep Learning"};
const std::vector<std::string> kCloud = {"AWS", "GCP", "Azure", "Docker", "Kubernetes", "Terraform"};
const std::vector<std::string> kData = {"SQL", "MongoDB", "PostgreSQL", "Redis", "Spark", "Kafka", "Airflow"};
const std::vector<std::string> kFrontend = {"React", "Vue.js", "Angular", "HTML/CSS", "Node.js"};
const std::vector<std::string> kProduct = {"Product Strategy", "User Research", "A/B Testing", "Analytics", "Roadmapping"};
const std::vector<std::string> kLeadership = {"Team Management", "Strategic Planning", "Stakeholder Management", "Mentoring"};

const std::vector<std::string> kUniversities = {
    "Stanford University", "MIT", "UC Berkeley", "Carnegie Mellon", "Harvard",
    "Caltech", "University of Washington", "Georgia Tech", "Cornell", "Princeton"
};
const std::vector<std::string> kDegrees = {"BS", "MS", "PhD"};
const std::vector<std::string> kFields = {"Computer Science", "Engineering", "Mathematics", "Physics", "Business"};

const std::vector<std::string> kFirstNames = {
    "Alex", "Priya", "Jordan", "Mei", "Samuel", "Fatima", "Lucas", "Aisha", "Noah", "Elena",
    "Kenji", "Sofia", "Omar", "Grace", "Mateo", "Hannah", "Ravi", "Chloe", "Daniel", "Yara"
};
const std::vector<std::string> kLastNames = {
    "Chen", "Patel", "Garcia", "Kim", "Johnson", "Nguyen", "Rossi", "Okafor", "Schmidt", "Silva",
    "Tanaka", "Haddad", "Novak", "Brown", "Ivanova", "Lopez", "Singh", "Murphy", "Cohen", "Andersen"
};

const char* const kInteractionTypes[] = {"professional", "personal", "mixed"};

constexpr long kDay = 86400;

class Rng {
public:
    explicit Rng(uint32_t seed) : m_gen(seed) {}

    size_t index(size_t n) {
        std::uniform_int_distribution<size_t> d(0, n - 1);
        return d(m_gen);
    }

    int range(int lo, int hi) {
        std::uniform_int_distribution<int> d(lo, hi);
        return d(m_gen);
    }

    double unit() {
        std::uniform_real_distribution<double> d(0.0, 1.0);
        return d(m_gen);
    }

    template <typename T>
    const T& pick(const std::vector<T>& v) { return v[index(v.size())]; }

    // k distinct elements, in draw order
    template <typename T>
    std::vector<T> sample(std::vector<T> pool, size_t k) {
        k = std::min(k, pool.size());
        for (size_t i = 0; i < k; ++i) {
            std::swap(pool[i], pool[i + index(pool.size() - i)]);
        }
        pool.resize(k);
        return pool;
    }

private:
    std::mt19937 m_gen;
};

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

std::string iso_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return buf;
}

std::vector<std::string> skills_for_role(Rng& rng, const std::string& title) {
    std::vector<std::string> skills;
    auto add = [&](const std::vector<std::string>& pool, size_t k) {
        for (auto& s : rng.sample(pool, k)) skills.push_back(std::move(s));
    };

    if (contains(title, "Engineer") || contains(title, "Engineering")) {
        add(kProgramming, 3);
        add(kCloud, 2);
    }
    if (contains(title, "AI") || contains(title, "ML") || contains(title, "Data")) {
        add(kAiMl, 4);
        add(kData, 2);
    }
    if (contains(title, "Product")) add(kProduct, 3);
    if (contains(title, "Frontend")) add(kFrontend, 3);
    if (contains(title, "VP") || contains(title, "Director") || contains(title, "Head") || contains(title, "Manager")) {
        add(kLeadership, 2);
    }

    std::vector<std::string> rest;
    for (const auto* pool : {&kProgramming, &kAiMl, &kCloud, &kData, &kFrontend, &kProduct, &kLeadership}) {
        for (const auto& s : *pool) {
            if (std::find(skills.begin(), skills.end(), s) == skills.end()) rest.push_back(s);
        }
    }
    add(rest, 2);

    // drop repeats, keep at most 8
    std::vector<std::string> out;
    for (const auto& s : skills) {
        if (std::find(out.begin(), out.end(), s) == out.end()) out.push_back(s);
        if (out.size() == 8) break;
    }
    return out;
}

std::string bio_for(Rng& rng, const std::string& title, const std::string& company,
                    const std::vector<std::string>& skills) {
    const std::string s0 = skills.size() > 0 ? skills[0] : "software";
    const std::string s1 = skills.size() > 1 ? skills[1] : "systems";
    std::string lowered = title;
    for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    switch (rng.index(4)) {
        case 0:
            return "Experienced " + lowered + " at " + company + " passionate about " + s0 + ", " + s1 +
                   ". Love building scalable systems and mentoring junior developers.";
        case 1:
            return title + " with expertise in " + s0 + ", " + s1 + ". Currently working on cutting-edge projects at " +
                   company + ". Always excited to connect with fellow technologists.";
        case 2:
            return "Senior technologist specializing in " + s0 + " and " + s1 + ". Leading innovative initiatives at " +
                   company + ". Open to discussing industry trends and collaboration opportunities.";
        default:
            return "Passionate " + lowered + " focused on " + s0 + " and " + s1 + ". Building the future of technology at " +
                   company + ". Happy to share insights and learn from others.";
    }
}

std::vector<WorkEntry> work_history_for(Rng& rng, size_t current_company, std::time_t now) {
    const size_t n_companies = sizeof(kCompanies) / sizeof(kCompanies[0]);
    std::vector<WorkEntry> history;

    std::time_t start = now - static_cast<std::time_t>(rng.range(183, 3 * 365)) * kDay;

    WorkEntry cur;
    cur.company = kCompanies[current_company].name;
    cur.title = "Current Role";
    cur.start_date = iso_date(start);
    cur.is_current = true;
    history.push_back(cur);

    const int previous = rng.range(1, 3);
    for (int i = 0; i < previous; ++i) {
        size_t c = rng.index(n_companies - 1);
        if (c >= current_company) ++c;

        const std::time_t end = start - static_cast<std::time_t>(rng.range(30, 90)) * kDay;
        start = end - static_cast<std::time_t>(rng.range(365, 1095)) * kDay;

        WorkEntry prev;
        prev.company = kCompanies[c].name;
        prev.title = "Previous Role " + std::to_string(i + 1);
        prev.start_date = iso_date(start);
        prev.end_date = iso_date(end);
        history.push_back(prev);
    }
    return history;
}

}  // namespace

std::vector<Profile> generate_synthetic_network(const SyntheticOptions& opts) {
    Rng rng(opts.seed);
    const size_t n_companies = sizeof(kCompanies) / sizeof(kCompanies[0]);

    std::vector<Profile> profiles;
    profiles.reserve(opts.profiles);

    for (size_t i = 0; i < opts.profiles; ++i) {
        const size_t company = rng.index(n_companies);
        const auto& titles = rng.pick(kTitlesByCategory);
        const std::string title = rng.pick(titles);

        Profile p;
        char id[32];
        std::snprintf(id, sizeof(id), "p%04zu", i + 1);
        p.id = id;
        p.name = rng.pick(kFirstNames) + " " + rng.pick(kLastNames);
        p.job_title = title;
        p.company = kCompanies[company].name;
        p.company_size = kCompanies[company].size;
        p.industry = kCompanies[company].industry;
        p.skills = skills_for_role(rng, title);

        Education edu;
        edu.university = rng.pick(kUniversities);
        edu.degree = rng.pick(kDegrees);
        edu.field = rng.pick(kFields);
        p.education = edu;

        p.bio = bio_for(rng, title, p.company, p.skills);
        p.work_history = work_history_for(rng, company, opts.reference_time);
        profiles.push_back(std::move(p));
    }

    // connections: ~40% same company, ~30% same industry, rest random
    for (size_t i = 0; i < profiles.size(); ++i) {
        Profile& me = profiles[i];
        const int lo = static_cast<int>(opts.min_connections);
        const int hi = static_cast<int>(std::max(opts.min_connections, opts.max_connections));
        const size_t want = static_cast<size_t>(rng.range(lo, hi));

        std::vector<size_t> same_company, same_industry, others;
        for (size_t j = 0; j < profiles.size(); ++j) {
            if (j == i) continue;
            if (profiles[j].company == me.company) same_company.push_back(j);
            else if (profiles[j].industry == me.industry) same_industry.push_back(j);
            else others.push_back(j);
        }

        std::vector<size_t> chosen = rng.sample(same_company, static_cast<size_t>(want * 0.4));
        for (size_t j : rng.sample(same_industry, static_cast<size_t>(want * 0.3))) chosen.push_back(j);

        if (chosen.size() < want) {
            std::unordered_set<size_t> taken(chosen.begin(), chosen.end());
            std::vector<size_t> remaining;
            for (size_t j = 0; j < profiles.size(); ++j) {
                if (j != i && !taken.count(j)) remaining.push_back(j);
            }
            for (size_t j : rng.sample(remaining, want - chosen.size())) chosen.push_back(j);
        }

        for (size_t j : chosen) me.connections.push_back(profiles[j].id);
    }

    // interactions with a share of each profile's own connections
    for (auto& p : profiles) {
        for (const auto& target : p.connections) {
            if (rng.unit() >= opts.interaction_rate) continue;

            const int frequency = rng.range(1, 20);
            const int days_ago = rng.range(0, 30);
            const double recency = std::max(0.0, 1.0 - days_ago / 30.0);
            const double freq_score = std::min(1.0, frequency / 20.0);
            const double strength = std::round((recency * 0.6 + freq_score * 0.4) * 1000.0) / 1000.0;

            Interaction it;
            it.frequency = frequency;
            it.last_contact = iso_date(opts.reference_time - static_cast<std::time_t>(days_ago) * kDay);
            it.strength = strength;
            it.type = kInteractionTypes[rng.index(3)];
            p.interactions.emplace(target, it);
        }
    }

    return profiles;
}

}  // namespace netmatch
