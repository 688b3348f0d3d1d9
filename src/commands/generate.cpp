#include "commands/generate.hpp"
#include "commands/Common.hpp"
#include "graph/ProfileStore.hpp"
#include "graph/SyntheticNetwork.hpp"
#include "io/JsonIO.hpp"
#include "util/Errors.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>

using namespace netmatch;

int cmd_generate(int argc, char** argv) {
    return cli::run_guarded("generate", [&]() {
        const long count = cli::get_int(argc, argv, "--count", 50);
        const long seed  = cli::get_int(argc, argv, "--seed", 42);
        const std::string outp = cli::get_arg(argc, argv, "--out", "data/network.json");

        if (count <= 0) throw ValidationError("--count must be > 0");

        SyntheticOptions opts;
        opts.profiles = (size_t)count;
        opts.seed = (uint32_t)seed;
        opts.min_connections = std::min(opts.min_connections, opts.profiles - 1);
        opts.max_connections = std::min(opts.max_connections, opts.profiles - 1);

        // round-trip through the store so the file carries symmetric connections
        ProfileStore store;
        store.load(generate_synthetic_network(opts));

        save_network(outp, store.profiles());

        std::cout << "generated " << store.size() << " profiles, " << store.edge_count() << " connections\n";
        std::cout << "OUT_NETWORK: " << outp << "\n";
        return 0;
    });
}
