#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "scenegen/hypercube.hpp"
#include "scenegen/logging.hpp"
#include "scenegen/plans.hpp"
#include "scenegen/scene_json.hpp"
#include "utils/cli_parse.hpp"

namespace {

constexpr int kMaxBuilds = 100;

struct Args {
    scenegen::HypercubeType type = scenegen::HypercubeType::kSingle;
    int count = 1;
    uint64_t seed = 1;
    bool seed_set = false;
    // Writes <prefix><name>.json per scene; stdout when empty.
    std::string prefix;
    int log_level = 1;
    int max_tries = scenegen::kMaxTries;
    bool stop_on_failure = false;
    bool context_objects = true;
};

void print_usage() {
    std::cout << "Usage: generate_hypercubes [--type single|container|container-eval|obstacle|occluder]\n"
              << "                           [--count N] [--seed S] [--prefix P] [--log-level L]\n"
              << "                           [--max-tries K] [--no-context] [--stop-on-failure]\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--type") {
            args.type = scenegen::parse_hypercube_type(require_arg(i, argc, argv, a));
        } else if (a == "--count") {
            args.count = parse_int_in(a, require_arg(i, argc, argv, a), 1, 100000);
        } else if (a == "--seed") {
            args.seed = parse_u64(require_arg(i, argc, argv, a));
            args.seed_set = true;
        } else if (a == "--prefix") {
            args.prefix = require_arg(i, argc, argv, a);
        } else if (a == "--log-level") {
            args.log_level = parse_int_in(a, require_arg(i, argc, argv, a), 0, 2);
        } else if (a == "--max-tries") {
            args.max_tries = parse_int_in(a, require_arg(i, argc, argv, a), 1, 100000);
        } else if (a == "--no-context") {
            args.context_objects = false;
        } else if (a == "--stop-on-failure") {
            args.stop_on_failure = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

void write_scenes(const Args& args, const std::vector<scenegen::Scene>& scenes, int hypercube_index) {
    for (size_t i = 0; i < scenes.size(); ++i) {
        std::ostringstream payload;
        scenegen::write_scene_json(payload, scenes[i]);
        if (args.prefix.empty()) {
            std::cout << payload.str();
            continue;
        }
        const std::string name = scenegen::scene_file_name(
            args.prefix + std::to_string(hypercube_index + 1) + "_", scenes[i], static_cast<int>(i)
        );
        std::ofstream out(name);
        if (!out) {
            throw std::runtime_error("failed to open output file: " + name);
        }
        out << payload.str();
        if (!out) {
            throw std::runtime_error("failed to write output file: " + name);
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const Args args = parse_args(argc, argv);
        scenegen::Rng rng(args.seed_set ? args.seed : std::random_device{}());

        scenegen::HypercubeOptions options;
        options.log_level = args.log_level;
        options.max_tries = args.max_tries;
        options.context_objects = args.context_objects;

        int written = 0;
        int failed = 0;
        for (int h = 0; h < args.count; ++h) {
            bool done = false;
            for (int build = 1; build <= kMaxBuilds && !done; ++build) {
                scenegen::InteractiveHypercube hypercube = scenegen::make_hypercube(args.type, options);
                auto result = hypercube.generate(rng);
                if (result.is_err()) {
                    if (args.log_level > 0) {
                        std::lock_guard<std::mutex> lk(scenegen::log_mutex());
                        std::cerr << "[generate] " << hypercube.name() << " build " << build << "/" << kMaxBuilds
                                  << " failed: " << result.error().message << "\n";
                    }
                    continue;
                }
                write_scenes(args, result.value(), h);
                written += static_cast<int>(result.value().size());
                done = true;
            }
            if (!done) {
                ++failed;
                if (args.stop_on_failure) {
                    std::cerr << "error: " << scenegen::hypercube_name(args.type) << " " << (h + 1)
                              << " never succeeded\n";
                    return 1;
                }
            }
        }

        if (args.log_level > 0) {
            std::lock_guard<std::mutex> lk(scenegen::log_mutex());
            std::cerr << "[generate] wrote " << written << " scenes, " << failed << " hypercube(s) skipped\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
