#include "match/MatchEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "graph/SyntheticNetwork.hpp"
#include "match/ProfileText.hpp"
#include "util/Errors.hpp"
#include "util/TextUtil.hpp"

namespace netmatch {

static std::string utc_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

static std::string format_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

static std::string build_explanation(const RankedCandidate& rc, size_t mutual_count) {
    std::ostringstream ss;
    ss << (rc.rerank_score ? "Rerank score: " : "Match score: ")
       << format_score(rc.total_score)
       << " \xE2\x80\xA2 " << mutual_count << " mutual connections";
    if (rc.metrics) ss << " \xE2\x80\xA2 " << explain_metrics(*rc.metrics);
    return ss.str();
}

MatchEngine::MatchEngine(llm::QueryParser& parser,
                         const emb::Embedder* embedder,
                         std::unique_ptr<RankingStrategy> strategy,
                         MatchConfig config)
    : m_parser(parser),
      m_embedder(embedder),
      m_strategy(std::move(strategy)),
      m_config(std::move(config)) {
    if (!m_strategy) throw ValidationError("MatchEngine: ranking strategy is required");
    m_config.validate();
    if (m_strategy->mode() != m_config.strategy) {
        throw ValidationError(std::string("MatchEngine: config asks for '") + ranking_mode_str(m_config.strategy) +
                              "' but the ranking strategy is '" + ranking_mode_str(m_strategy->mode()) + "'");
    }
}

std::shared_ptr<const NetworkSnapshot> MatchEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_snapshot;
}

std::shared_ptr<const NetworkSnapshot> MatchEngine::require_snapshot() const {
    auto snap = snapshot();
    if (!snap || !snap->store || snap->store->empty()) {
        throw ValidationError("network not initialized");
    }
    return snap;
}

void MatchEngine::publish(std::shared_ptr<const NetworkSnapshot> snap) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_snapshot = std::move(snap);
}

bool MatchEngine::initialized() const {
    auto snap = snapshot();
    return snap && snap->store && !snap->store->empty();
}

LoadSummary MatchEngine::initialize(size_t candidate_count, uint32_t seed) {
    if (candidate_count == 0) throw ValidationError("candidate_count must be > 0");

    SyntheticOptions opts;
    opts.profiles = candidate_count;
    opts.seed = seed;
    // small populations cannot satisfy the default degree range
    opts.min_connections = std::min(opts.min_connections, candidate_count - 1);
    opts.max_connections = std::min(opts.max_connections, candidate_count - 1);

    std::cerr << "MatchEngine: generating synthetic network (n=" << candidate_count
              << ", seed=" << seed << ")\n";
    return load(generate_synthetic_network(opts));
}

emb::EmbeddingIndex MatchEngine::embed_profiles(const ProfileStore& store) const {
    std::vector<std::string> ids;
    std::vector<std::string> texts;
    ids.reserve(store.size());
    texts.reserve(store.size());
    for (const auto& p : store.profiles()) {
        ids.push_back(p.id);
        texts.push_back(format_profile_text(p));
    }

    std::vector<std::vector<float>> vecs;
    try {
        vecs = m_embedder->embed(texts, emb::EmbedPurpose::Document);
    } catch (const std::exception& e) {
        std::cerr << "MatchEngine: profile embedding failed: " << e.what() << "\n";
        throw CollaboratorError("profile embedding failed");
    }

    if (vecs.size() != ids.size()) {
        std::cerr << "MatchEngine: embedder returned " << vecs.size() << " vectors for "
                  << ids.size() << " profiles\n";
        throw CollaboratorError("profile embedding failed");
    }

    const size_t dim = vecs.empty() ? 0 : vecs.front().size();
    std::vector<float> flat;
    flat.reserve(dim * vecs.size());
    for (size_t i = 0; i < vecs.size(); ++i) {
        if (vecs[i].size() != dim || dim == 0) {
            std::cerr << "MatchEngine: inconsistent embedding for " << ids[i]
                      << " (dim " << vecs[i].size() << ", expected " << dim << ")\n";
            throw CollaboratorError("profile embedding failed");
        }
        flat.insert(flat.end(), vecs[i].begin(), vecs[i].end());
    }

    emb::EmbeddingIndex idx;
    idx.set(std::move(ids), std::move(flat), dim);
    return idx;
}

LoadSummary MatchEngine::load(std::vector<Profile> profiles, const std::vector<ConnectionEdge>& edges) {
    auto store = std::make_shared<ProfileStore>();
    store->load(std::move(profiles), edges);

    auto embeddings = std::make_shared<emb::EmbeddingIndex>();
    if (m_config.embed_profiles) {
        if (m_embedder) {
            *embeddings = embed_profiles(*store);
        } else {
            std::cerr << "MatchEngine: embed_profiles is set but no embedder is configured\n";
        }
    }

    auto snap = std::make_shared<NetworkSnapshot>();
    snap->store = store;
    snap->embeddings = embeddings;

    LoadSummary summary;
    summary.profile_count = store->size();
    summary.connection_count = store->edge_count();

    publish(std::move(snap));

    std::cerr << "MatchEngine: loaded " << summary.profile_count << " profiles, "
              << summary.connection_count << " connections\n";
    return summary;
}

void MatchEngine::set_profile_embeddings(emb::EmbeddingIndex index) {
    auto current = require_snapshot();

    auto snap = std::make_shared<NetworkSnapshot>();
    snap->store = current->store;
    snap->embeddings = std::make_shared<const emb::EmbeddingIndex>(std::move(index));
    publish(std::move(snap));
}

MatchResponse MatchEngine::find_connections(const std::string& requester_id,
                                            const std::string& query,
                                            int max_results,
                                            bool include_explanations) const {
    const auto t0 = std::chrono::steady_clock::now();

    if (max_results <= 0) throw ValidationError("max_results must be > 0");
    const auto snap = require_snapshot();
    const ProfileStore& store = *snap->store;
    const Profile& requester = store.get(requester_id);

    // collaborators run while the candidate set is assembled
    std::future<llm::ParsedQuery> parse_job = std::async(std::launch::async, [this, &query]() {
        return m_parser.parse(query);
    });

    std::future<std::vector<std::vector<float>>> embed_job;
    if (m_embedder) {
        embed_job = std::async(std::launch::async, [this, &query]() {
            return m_embedder->embed({query}, emb::EmbedPurpose::Query);
        });
    }

    RankingContext ctx;
    ctx.requester = &requester;
    ctx.candidates = store.all_except(requester_id);
    ctx.query = query;
    ctx.profile_embeddings = snap->embeddings.get();
    ctx.weights = m_config.weights;

    std::vector<float> query_embedding;
    if (embed_job.valid()) {
        try {
            auto vecs = embed_job.get();
            if (vecs.size() == 1 && !vecs.front().empty()) {
                query_embedding = std::move(vecs.front());
            } else {
                std::cerr << "MatchEngine: query embedding unavailable (empty response)\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "MatchEngine: query embedding failed, continuing without it: " << e.what() << "\n";
        }
    }

    llm::ParsedQuery parsed;
    try {
        parsed = parse_job.get();
    } catch (const std::exception& e) {
        std::cerr << "MatchEngine: query parsing failed: " << e.what() << "\n";
        throw CollaboratorError("query parsing failed");
    }

    ctx.parsed_query = &parsed;
    ctx.query_embedding = query_embedding.empty() ? nullptr : &query_embedding;

    std::vector<RankedCandidate> ranked;
    try {
        ranked = m_strategy->rank(ctx, static_cast<size_t>(max_results));
    } catch (const NotFoundError&) {
        throw;
    } catch (const ValidationError&) {
        throw;
    } catch (const DataIntegrityError&) {
        throw;
    } catch (const CollaboratorError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "MatchEngine: " << ranking_mode_str(m_strategy->mode())
                  << " ranking failed: " << e.what() << "\n";
        throw CollaboratorError("ranking failed");
    }

    MatchResponse resp;
    resp.query = query;
    resp.parsed_query = parsed;
    resp.requester = summarize(requester);
    resp.results.reserve(ranked.size());

    int rank = 0;
    for (const auto& rc : ranked) {
        MatchResult r;
        r.rank = ++rank;
        r.profile = *rc.profile;
        r.total_score = rc.total_score;
        r.metrics = rc.metrics;
        r.rerank_score = rc.rerank_score;
        r.mutual_connections = netmatch::mutual_connections(store, requester.id, rc.profile->id, m_config.mutual_limit);
        r.path = classify_path(store, requester.id, rc.profile->id);
        if (include_explanations) r.explanation = build_explanation(rc, r.mutual_connections.size());
        resp.results.push_back(std::move(r));
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    resp.metadata.total_candidates_evaluated = ctx.candidates.size();
    resp.metadata.processing_time_seconds = std::round(elapsed * 100.0) / 100.0;
    resp.metadata.timestamp = utc_timestamp();
    resp.metadata.ranking_strategy = m_strategy->mode();
    resp.metadata.query_embedding_available = !query_embedding.empty();
    return resp;
}

NetworkStats MatchEngine::network_stats() const {
    const auto snap = require_snapshot();
    return compute_network_stats(*snap->store, m_config.stats);
}

std::vector<ProfileSummary> MatchEngine::mutual_connections(const std::string& a, const std::string& b) const {
    const auto snap = require_snapshot();
    return netmatch::mutual_connections(*snap->store, a, b, m_config.mutual_limit);
}

PathClassification MatchEngine::connection_path(const std::string& a, const std::string& b) const {
    const auto snap = require_snapshot();
    return classify_path(*snap->store, a, b);
}

Profile MatchEngine::profile(const std::string& id) const {
    const auto snap = require_snapshot();
    return snap->store->get(id);
}

ProfilePage MatchEngine::list_profiles(const ProfileFilter& filter) const {
    const auto snap = require_snapshot();

    ProfilePage page;
    for (const auto& p : snap->store->profiles()) {
        if (!filter.company.empty() && !textutil::icontains(p.company, filter.company)) continue;
        if (!filter.job_title.empty() && !textutil::icontains(p.job_title, filter.job_title)) continue;

        if (page.total >= filter.offset && page.profiles.size() < filter.limit) {
            page.profiles.push_back(summarize(p));
        }
        ++page.total;
    }
    return page;
}

}  // namespace netmatch
