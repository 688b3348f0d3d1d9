#pragma once
#include <string>
#include <vector>

namespace emb {

enum class EmbedPurpose {
    Document,
    Query
};

class Embedder {
public:
    virtual ~Embedder() = default;

    // One vector per input text, same order. Empty input -> empty output.
    // Throws std::runtime_error on failure.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                                  EmbedPurpose purpose) const = 0;
};

} // namespace emb
