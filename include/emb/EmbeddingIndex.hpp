#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

struct EmbHit {
    std::string id;
    float score;
};

// Dense vectors keyed by profile id, packed row-major.
class EmbeddingIndex {
public:
    // vectors.size() must equal ids.size() * dim; throws std::invalid_argument otherwise
    void set(std::vector<std::string> ids, std::vector<float> vectors, size_t dim);

    // nullptr when the id has no vector; the pointer covers dim() floats
    const float* find(const std::string& id) const;
    std::vector<float> get(const std::string& id) const;

    // cosine scores, best first; ties by insertion order
    std::vector<EmbHit> topk(const std::vector<float>& query_vec, size_t k) const;

    // binary cache
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_ids.size(); }
    bool empty() const { return m_ids.empty(); }
    const std::vector<std::string>& ids() const { return m_ids; }

    // 0 for zero-norm inputs
    static float cosine(const float* a, const float* b, size_t dim);

private:
    size_t m_dim = 0;
    std::vector<std::string> m_ids;
    std::vector<float> m_vecs;
    std::unordered_map<std::string, size_t> m_row;

    void reindex();
};

} // namespace emb
