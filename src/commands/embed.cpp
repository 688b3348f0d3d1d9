#include "commands/embed.hpp"
#include "commands/Common.hpp"
#include "emb/EmbeddingIndex.hpp"
#include "graph/ProfileStore.hpp"
#include "io/JsonIO.hpp"
#include "match/ProfileText.hpp"
#include "util/Errors.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace netmatch;

int cmd_embed(int argc, char** argv) {
    return cli::run_guarded("embed", [&]() {
        const std::string network = cli::require_arg(argc, argv, "--network");
        const std::string outp    = cli::get_arg(argc, argv, "--out", "data/embeddings/profiles.bin");

        NetworkData data = load_network(network);
        ProfileStore store;
        store.load(std::move(data.profiles), data.edges);

        auto embedder = cli::make_embedder(argc, argv, "onnx");
        if (!embedder) throw ValidationError("embed needs --embedder onnx|ollama");

        std::vector<std::string> ids;
        std::vector<std::string> texts;
        for (const auto& p : store.profiles()) {
            ids.push_back(p.id);
            texts.push_back(format_profile_text(p));
        }

        const auto vecs = embedder->embed(texts, emb::EmbedPurpose::Document);
        if (vecs.size() != ids.size()) {
            throw CollaboratorError("embedder returned " + std::to_string(vecs.size()) +
                                    " vectors for " + std::to_string(ids.size()) + " profiles");
        }

        size_t dim = 0;
        std::vector<std::string> kept;
        std::vector<float> flat;
        for (size_t i = 0; i < vecs.size(); ++i) {
            const auto& v = vecs[i];
            if (v.empty()) {
                std::cerr << "skipping " << ids[i] << ": empty embedding\n";
                continue;
            }
            if (dim == 0) dim = v.size();
            if (v.size() != dim) {
                std::cerr << "skipping " << ids[i] << ": dim " << v.size() << " != " << dim << "\n";
                continue;
            }
            kept.push_back(ids[i]);
            flat.insert(flat.end(), v.begin(), v.end());
        }

        emb::EmbeddingIndex idx;
        idx.set(std::move(kept), std::move(flat), dim);

        const std::filesystem::path out_path(outp);
        if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());
        if (!idx.save(outp)) {
            throw std::runtime_error("failed to save embeddings to " + outp);
        }

        std::cout << "saved: " << outp << " (n=" << idx.size() << ", dim=" << idx.dim() << ")\n";
        std::cout << "OUT_EMBEDDINGS: " << outp << "\n";
        return 0;
    });
}
