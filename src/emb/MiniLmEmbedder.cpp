#include "emb/MiniLmEmbedder.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace emb {

MiniLmEmbedder::MiniLmEmbedder(const std::string& model_path,
                               const std::string& vocab_path,
                               size_t max_len,
                               size_t batch_size)
    : m_max_len(max_len), m_batch_size(batch_size == 0 ? 1 : batch_size) {
    m_tok.load_vocab(vocab_path);

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        const size_t n_inputs = m_session->GetInputCount();
        if (n_inputs < 2) {
            throw std::runtime_error("model has " + std::to_string(n_inputs) + " inputs, expected 2 or 3");
        }
        m_in_ids = m_session->GetInputNameAllocated(0, allocator).get();
        m_in_mask = m_session->GetInputNameAllocated(1, allocator).get();
        m_has_type_input = n_inputs >= 3;
        if (m_has_type_input) m_in_type = m_session->GetInputNameAllocated(2, allocator).get();
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: ORT exception: " << e.what() << " (model_path=" << model_path << ")\n";
        throw std::runtime_error(std::string("failed to load ONNX model ") + model_path + ": " + e.what());
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<std::vector<float>> MiniLmEmbedder::embed_batch(const std::vector<std::string>& texts) const {
    const std::vector<Encoding> enc = m_tok.encode_batch(texts, m_max_len);
    const size_t batch = enc.size();
    const size_t seq_len = enc.front().input_ids.size();

    std::vector<int64_t> ids, mask, type_ids;
    ids.reserve(batch * seq_len);
    mask.reserve(batch * seq_len);
    type_ids.reserve(batch * seq_len);
    for (const auto& e : enc) {
        ids.insert(ids.end(), e.input_ids.begin(), e.input_ids.end());
        mask.insert(mask.end(), e.attention_mask.begin(), e.attention_mask.end());
        type_ids.insert(type_ids.end(), e.token_type_ids.begin(), e.token_type_ids.end());
    }

    std::vector<int64_t> shape{(int64_t)batch, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> in_vals;
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    std::vector<const char*> in_names{m_in_ids.c_str(), m_in_mask.c_str()};
    if (m_has_type_input) {
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
        in_names.push_back(m_in_type.c_str());
    }

    const char* out_names[1] = { m_out_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("MiniLM inference failed: ") + e.what());
    }

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [batch, seq_len, hidden]
    if (shp.size() != 3 || (size_t)shp[0] != batch || (size_t)shp[1] != seq_len) {
        throw std::runtime_error("MiniLM output has unexpected shape");
    }

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<std::vector<float>> result;
    result.reserve(batch);

    for (size_t b = 0; b < batch; ++b) {
        std::vector<float> pooled(hidden, 0.0f);
        double denom = 0.0;

        const float* base = data + b * seq_len * hidden;
        for (size_t t = 0; t < seq_len; ++t) {
            if (enc[b].attention_mask[t] == 0) continue;
            denom += 1.0;
            const float* row = base + t * hidden;
            for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
        }

        if (denom > 0.0) {
            float inv = (float)(1.0 / denom);
            for (float& x : pooled) x *= inv;
        }

        l2_normalize(pooled);
        result.push_back(std::move(pooled));
    }
    return result;
}

std::vector<std::vector<float>> MiniLmEmbedder::embed(const std::vector<std::string>& texts,
                                                      EmbedPurpose) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());

    for (size_t begin = 0; begin < texts.size(); begin += m_batch_size) {
        const size_t end = std::min(texts.size(), begin + m_batch_size);
        std::vector<std::string> chunk(texts.begin() + (std::ptrdiff_t)begin, texts.begin() + (std::ptrdiff_t)end);
        for (auto& v : embed_batch(chunk)) out.push_back(std::move(v));
    }
    return out;
}

} // namespace emb
