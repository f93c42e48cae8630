#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "output/json_writer.h"
#include "output/text_renderer.h"
#include "puzzle/puzzle.h"
#include "random/random_source.h"

namespace {

struct CliOptions {
    std::string technique = "linear_probing";
    std::string difficulty = "easy";
    bool has_seed = false;
    uint64_t seed = 0;
    std::string format = "json";
    bool reveal = false;
    bool pretty = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "Usage:\n";
    out << "  hashpuzzle [options]\n\n";
    out << "Options:\n";
    out << "  --technique <name>    linear_probing | quadratic_probing | double_hashing | chaining\n";
    out << "                        (unknown names use linear_probing)\n";
    out << "  --difficulty <tier>   easy | medium | hard (default easy)\n";
    out << "  --seed <u64>          Seed the key generator for a reproducible puzzle\n";
    out << "  --format <fmt>        json | text (default json)\n";
    out << "  --pretty              Indent JSON output\n";
    out << "  --reveal              Show placements in text output\n";
    out << "  --verbose             Trace every insertion on stderr\n";
    out << "  --help, -h            Show this help\n";
}

bool parse_u64(const char* s, uint64_t& out) {
    if (s == nullptr || *s == '\0') return false;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || (end != nullptr && *end != '\0')) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

// Returns false and reports on stderr when an argument cannot be used
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i] != nullptr ? argv[i] : "");
        auto next = [&](const char*& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return out != nullptr;
        };

        const char* v = nullptr;
        if (a == "--help" || a == "-h") { opts.help = true; continue; }
        if (a == "--pretty") { opts.pretty = true; continue; }
        if (a == "--reveal") { opts.reveal = true; continue; }
        if (a == "--verbose") { opts.verbose = true; continue; }
        if (a == "--technique" && next(v)) { opts.technique = v; continue; }
        if (a == "--difficulty" && next(v)) { opts.difficulty = v; continue; }
        if (a == "--format" && next(v)) {
            opts.format = v;
            if (opts.format != "json" && opts.format != "text") {
                std::cerr << "Error: unknown format '" << opts.format << "'\n";
                return false;
            }
            continue;
        }
        if (a == "--seed" && next(v)) {
            if (!parse_u64(v, opts.seed)) {
                std::cerr << "Error: --seed expects an unsigned integer, got '" << v << "'\n";
                return false;
            }
            opts.has_seed = true;
            continue;
        }

        std::cerr << "Error: unrecognized or incomplete argument '" << a << "'\n";
        return false;
    }
    return true;
}

void trace_steps(const PuzzleResult& puzzle) {
    std::cerr << "[hashpuzzle] " << puzzle.technique_id << ", m=" << puzzle.table_size
              << ", " << puzzle.keys.size() << " key(s)\n";
    for (const auto& step : puzzle.steps) {
        std::cerr << "[hashpuzzle]   key " << step.key << ": ";
        if (step.error) {
            std::cerr << *step.error << "\n";
            continue;
        }
        std::cerr << "h0=" << step.initial_hash << " -> slot " << step.final_index;
        if (step.collisions > 0) {
            std::cerr << " after " << step.collisions << " collision(s)";
        }
        std::cerr << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    try {
        std::unique_ptr<MersenneRandomSource> seeded;
        RandomSource* rng = &RandomSource::thread_instance();
        if (opts.has_seed) {
            seeded = std::make_unique<MersenneRandomSource>(opts.seed);
            rng = seeded.get();
        }

        PuzzleResult puzzle = generate_puzzle(opts.technique, opts.difficulty, *rng);

        if (opts.verbose) {
            trace_steps(puzzle);
        }

        if (opts.format == "text") {
            render_text(std::cout, puzzle, opts.reveal);
        } else {
            std::cout << to_json(puzzle, opts.pretty) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
