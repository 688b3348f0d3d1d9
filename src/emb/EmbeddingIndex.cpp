#include "emb/EmbeddingIndex.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace emb {

static const char kMagic[8] = {'N', 'M', 'E', 'M', 'B', '0', '0', '1'};

void EmbeddingIndex::set(std::vector<std::string> ids, std::vector<float> vectors, size_t dim) {
    if (vectors.size() != ids.size() * dim) {
        throw std::invalid_argument("EmbeddingIndex: vector count does not match ids * dim");
    }
    m_ids = std::move(ids);
    m_vecs = std::move(vectors);
    m_dim = m_ids.empty() ? 0 : dim;
    reindex();
}

void EmbeddingIndex::reindex() {
    m_row.clear();
    m_row.reserve(m_ids.size() * 2 + 8);
    for (size_t i = 0; i < m_ids.size(); ++i) m_row.emplace(m_ids[i], i);
}

const float* EmbeddingIndex::find(const std::string& id) const {
    auto it = m_row.find(id);
    if (it == m_row.end() || m_dim == 0) return nullptr;
    return &m_vecs[it->second * m_dim];
}

std::vector<float> EmbeddingIndex::get(const std::string& id) const {
    const float* v = find(id);
    if (!v) return {};
    return std::vector<float>(v, v + m_dim);
}

float EmbeddingIndex::cosine(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

std::vector<EmbHit> EmbeddingIndex::topk(const std::vector<float>& query_vec, size_t k) const {
    std::vector<EmbHit> hits;
    if (m_dim == 0 || query_vec.size() != m_dim) return hits;

    hits.reserve(m_ids.size());
    for (size_t i = 0; i < m_ids.size(); ++i) {
        hits.push_back({m_ids[i], cosine(query_vec.data(), &m_vecs[i * m_dim], m_dim)});
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const EmbHit& a, const EmbHit& b) { return a.score > b.score; });

    if (hits.size() > k) hits.resize(k);
    return hits;
}

bool EmbeddingIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    out.write(kMagic, sizeof(kMagic));

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_ids.size();
    out.write((const char*)&dim, sizeof(dim));
    out.write((const char*)&n, sizeof(n));

    for (const auto& id : m_ids) {
        uint32_t len = (uint32_t)id.size();
        out.write((const char*)&len, sizeof(len));
        out.write(id.data(), len);
    }

    out.write((const char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    return (bool)out;
}

bool EmbeddingIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    char magic[sizeof(kMagic)] = {};
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) return false;

    uint32_t dim = 0, n = 0;
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in) return false;
    if (n > 0 && dim == 0) return false;

    std::vector<std::string> ids;
    ids.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read((char*)&len, sizeof(len));
        if (!in) return false;
        std::string s(len, '\0');
        in.read(&s[0], len);
        if (!in) return false;
        ids.push_back(std::move(s));
    }

    std::vector<float> vecs((size_t)n * dim);
    in.read((char*)vecs.data(), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) return false;

    m_dim = n ? dim : 0;
    m_ids = std::move(ids);
    m_vecs = std::move(vecs);
    reindex();
    return true;
}

} // namespace emb
