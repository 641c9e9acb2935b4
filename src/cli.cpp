/**
 * @file cli.cpp
 * @brief qrngkit command line interface.
 *
 * Drives the extraction pipeline against a simulated biased source and
 * prints bits, metrics, trial summaries or avalanche results. Set
 * SPDLOG_LEVEL (for example SPDLOG_LEVEL=debug) to see library logging.
 */

#include <qrngkit/aes_cbc.hpp>
#include <qrngkit/keygen.hpp>
#include <qrngkit/qrngkit.hpp>

#include <spdlog/cfg/env.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>

using namespace qrngkit;

static void print_version() {
    std::printf("qrngkit %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nRandomness extraction and validation (v%s)\n", version());
    std::printf("==========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s extract <bits> [bias] [seed]\n", prog_name);
    std::printf("  %s analyze <bits> [bias] [seed]\n", prog_name);
    std::printf("  %s trials [-r] <trials> <bits> [bias] [seed]\n", prog_name);
    std::printf("  %s avalanche [-c|-f] <message> [trials] [seed]\n", prog_name);
    std::printf("  %s number <int32|int64|float|double> [seed]\n\n", prog_name);
    std::printf("Commands:\n");
    std::printf("  extract          Print exactly <bits> debiased bits\n");
    std::printf("  analyze          Compare raw and debiased streams of <bits> raw bits\n");
    std::printf("  trials           Score <trials> independent draws and summarize\n");
    std::printf("  avalanche        AES-256-CBC key sensitivity with a generated key\n");
    std::printf("  number           Print one random number of the given type\n\n");
    std::printf("Options:\n");
    std::printf("  -r, --raw        trials: score undebiased source bits (classical baseline)\n");
    std::printf("  -c, --classical  avalanche: key from a seeded PRNG draw\n");
    std::printf("  -f, --fixed      avalanche: classical key with the fixed seed %llu\n",
                static_cast<unsigned long long>(CLASSICAL_FIXED_SEED));
    std::printf("  -h, --help       Show this help message\n");
    std::printf("  -v, --version    Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  bias             Probability that a raw bit reads 1 (default: 0.5)\n");
    std::printf("  seed             Simulator seed (default: 0; random for -c)\n\n");
    std::printf("Examples:\n");
    std::printf("  %s extract 256 0.7 42\n", prog_name);
    std::printf("  %s trials 10 1024 0.6\n", prog_name);
    std::printf("  %s trials -r 10 1024 0.6\n", prog_name);
    std::printf("  %s avalanche \"attack at dawn\" 5\n", prog_name);
    std::printf("  %s avalanche -f \"attack at dawn\" 5\n", prog_name);
}

static bool parse_size(const char* text, std::size_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

static bool parse_probability(const char* text, double& out) {
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (errno != 0 || *end != '\0' || !(value >= 0.0 && value <= 1.0)) {
        return false;
    }
    out = value;
    return true;
}

/// Optional [bias] [seed] tail shared by several commands
static bool parse_source_args(int argc, char** argv, int first, double& bias,
                              std::uint64_t& seed) {
    if (argc > first && !parse_probability(argv[first], bias)) {
        std::fprintf(stderr, "Error: bias must be a number in [0, 1]\n");
        return false;
    }
    std::size_t seed_value = 0;
    if (argc > first + 1) {
        if (!parse_size(argv[first + 1], seed_value)) {
            std::fprintf(stderr, "Error: seed must be a non-negative integer\n");
            return false;
        }
        seed = seed_value;
    }
    return true;
}

static void print_metrics(const char* label, const BitMetrics& m) {
    std::printf("%-10s len=%-8zu p1=%.4f bias=%.4f H=%.4f freq_p=%.4f runs_p=%.4f\n", label,
                m.length, m.p1, m.bias, m.entropy, m.frequency_p, m.runs_p);
}

static int do_extract(std::size_t n, double bias, std::uint64_t seed) {
    SimulatedSource source(bias, seed);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    ExtractionStats stats;
    Bitstring bits = extractor.extract_fixed_length(n, &stats);

    std::printf("%s\n", bits.to_string().c_str());
    std::fprintf(stderr, "Raw used:    %zu bits\n", stats.raw_bits_used);
    std::fprintf(stderr, "Efficiency:  %.4f\n", stats.efficiency);
    std::fprintf(stderr, "Iterations:  %zu\n", stats.iterations);
    return 0;
}

static int do_analyze(std::size_t n, double bias, std::uint64_t seed) {
    SimulatedSource source(bias, seed);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    VariableExtraction result = extractor.extract_variable_length(n);

    std::printf("Source bias: %.4f, seed %llu\n\n", bias, static_cast<unsigned long long>(seed));
    print_metrics("raw", report_metrics(result.raw));
    print_metrics("debiased", report_metrics(result.extracted));

    std::printf("\nRaw bias:    %.4f\n", compute_bias(result.raw));
    std::printf("Efficiency:  %.4f\n", result.efficiency);

    Scorecard card = score(result.extracted);
    std::printf("Suite:       %s\n", card.all_passed() ? "PASS" : "FAIL");
    return 0;
}

static int do_trials(std::size_t trials, std::size_t n, double bias, std::uint64_t seed,
                     ExtractionMode mode) {
    SimulatedSource source(bias, seed);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    TrialReport report = run_trials(
        [&extractor, mode](std::size_t len) { return extractor.extract(len, mode); }, trials, n);

    std::printf("Bits: %s, bias %.4f\n\n", mode_name(mode), bias);
    std::printf("%-24s %12s %12s %8s\n", "Metric", "Mean", "CI95", "Pass");
    std::printf("%-24s %12s %12s %8s\n", "------", "----", "----", "----");
    for (Metric metric : ALL_METRICS) {
        const TrialSummary& s = report.at(metric);
        if (s.mean && s.confidence_interval95) {
            std::printf("%-24s %12.6f %12.6f %4zu/%-3zu\n", metric_name(metric), *s.mean,
                        *s.confidence_interval95, s.pass_count, s.total_trials);
        } else {
            std::printf("%-24s %12s %12s %4zu/%-3zu\n", metric_name(metric), "n/a", "n/a",
                        s.pass_count, s.total_trials);
        }
    }
    return 0;
}

enum class KeySource { Extracted, Classical, ClassicalFixed };

static int do_avalanche(const char* message, std::size_t trials, std::uint64_t seed,
                        KeySource key_source) {
    std::mt19937_64 engine(seed);
    KeyMaterial material;
    if (key_source == KeySource::Extracted) {
        SimulatedSource source(0.5, seed);
        BitBuffer buffer(source);
        Extractor extractor(buffer);
        material = generate_key(extractor, 256);
    } else {
        material = generate_classical_key(engine, key_source == KeySource::ClassicalFixed, 256);
    }

    AesCbc cipher;
    AvalancheAnalyzer analyzer(cipher, engine);

    Bytes plaintext(message, message + std::strlen(message));
    AvalancheReport report = analyzer.analyze(material.key, plaintext, trials);

    Bytes decrypted = cipher.decrypt(material.key, Bytes(DEFAULT_IV_BYTES, 0),
                                     report.baseline_ciphertext);
    bool round_trip = decrypted == plaintext;

    const char* label = key_source == KeySource::Extracted   ? "extracted"
                        : key_source == KeySource::Classical ? "classical"
                                                             : "classical, fixed seed";
    std::printf("Key source:  %s\n", label);
    std::printf("Key entropy: %.4f\n", material.key_entropy);
    std::printf("Ciphertext:  %zu bytes\n", report.baseline_ciphertext.size());
    std::printf("Decrypted:   %.*s\n", static_cast<int>(decrypted.size()),
                reinterpret_cast<const char*>(decrypted.data()));
    std::printf("Round trip:  %s\n\n", round_trip ? "OK" : "FAILED");
    for (const AvalancheSample& sample : report.samples) {
        std::printf("  flip bit %3zu -> %6.2f%% changed\n", sample.bit_index_flipped,
                    sample.percent_changed);
    }
    std::printf("\nMean:        %.2f%%\n", report.summary.mean);
    std::printf("Std dev:     %.2f%%\n", report.summary.population_std_dev);
    return round_trip ? 0 : 1;
}

static int do_number(const char* type, std::uint64_t seed) {
    SimulatedSource source(0.5, seed);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    if (std::strcmp(type, "int32") == 0) {
        std::printf("%u\n", static_cast<unsigned>(extractor.random_uint32()));
    } else if (std::strcmp(type, "int64") == 0) {
        std::printf("%llu\n", static_cast<unsigned long long>(extractor.random_uint64()));
    } else if (std::strcmp(type, "float") == 0) {
        std::printf("%.9g\n", static_cast<double>(extractor.random_float()));
    } else if (std::strcmp(type, "double") == 0) {
        std::printf("%.17g\n", extractor.random_double());
    } else {
        std::fprintf(stderr, "Error: type must be int32, int64, float or double\n");
        return 1;
    }
    return 0;
}

static int dispatch(int argc, char** argv) {
    const char* command = argv[1];
    double bias = 0.5;
    std::uint64_t seed = 0;

    if (std::strcmp(command, "extract") == 0 || std::strcmp(command, "analyze") == 0) {
        std::size_t bits = 0;
        if (argc < 3 || argc > 5 || !parse_size(argv[2], bits)) {
            std::fprintf(stderr, "Usage: %s %s <bits> [bias] [seed]\n", argv[0], command);
            return 1;
        }
        if (!parse_source_args(argc, argv, 3, bias, seed)) {
            return 1;
        }
        if (command[0] == 'e') {
            return do_extract(bits, bias, seed);
        }
        if (bits == 0) {
            std::fprintf(stderr, "Error: bits must be positive\n");
            return 1;
        }
        return do_analyze(bits, bias, seed);
    }

    if (std::strcmp(command, "trials") == 0) {
        // Optional mode flag directly after the command
        ExtractionMode mode = ExtractionMode::Debiased;
        int first = 2;
        if (argc > 2 && (std::strcmp(argv[2], "-r") == 0 || std::strcmp(argv[2], "--raw") == 0)) {
            mode = ExtractionMode::Raw;
            first = 3;
        }

        std::size_t trials = 0;
        std::size_t bits = 0;
        if (argc < first + 2 || argc > first + 4 || !parse_size(argv[first], trials) ||
            !parse_size(argv[first + 1], bits)) {
            std::fprintf(stderr, "Usage: %s trials [-r] <trials> <bits> [bias] [seed]\n",
                         argv[0]);
            return 1;
        }
        if (bits == 0) {
            std::fprintf(stderr, "Error: bits must be positive\n");
            return 1;
        }
        if (!parse_source_args(argc, argv, first + 2, bias, seed)) {
            return 1;
        }
        return do_trials(trials, bits, bias, seed, mode);
    }

    if (std::strcmp(command, "avalanche") == 0) {
        KeySource key_source = KeySource::Extracted;
        int first = 2;
        if (argc > 2 && (std::strcmp(argv[2], "-c") == 0 ||
                         std::strcmp(argv[2], "--classical") == 0)) {
            key_source = KeySource::Classical;
            first = 3;
        } else if (argc > 2 &&
                   (std::strcmp(argv[2], "-f") == 0 || std::strcmp(argv[2], "--fixed") == 0)) {
            key_source = KeySource::ClassicalFixed;
            first = 3;
        }

        std::size_t trials = DEFAULT_AVALANCHE_TRIALS;
        std::size_t seed_value = 0;
        if (argc < first + 1 || argc > first + 3 ||
            (argc > first + 1 && !parse_size(argv[first + 1], trials)) ||
            (argc > first + 2 && !parse_size(argv[first + 2], seed_value))) {
            std::fprintf(stderr, "Usage: %s avalanche [-c|-f] <message> [trials] [seed]\n",
                         argv[0]);
            return 1;
        }
        if (trials == 0) {
            std::fprintf(stderr, "Error: trials must be positive\n");
            return 1;
        }
        if (key_source == KeySource::Classical && argc <= first + 2) {
            seed_value = std::random_device{}();
        }
        return do_avalanche(argv[first], trials, seed_value, key_source);
    }

    if (std::strcmp(command, "number") == 0) {
        std::size_t seed_value = 0;
        if (argc < 3 || argc > 4 || (argc > 3 && !parse_size(argv[3], seed_value))) {
            std::fprintf(stderr, "Usage: %s number <int32|int64|float|double> [seed]\n", argv[0]);
            return 1;
        }
        return do_number(argv[2], seed_value);
    }

    std::fprintf(stderr, "Error: unknown command '%s'\n", command);
    print_help(argv[0]);
    return 1;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    // Register the library logger before applying SPDLOG_LEVEL to it
    logger();
    spdlog::cfg::load_env_levels();

    try {
        return dispatch(argc, argv);
    } catch (const QrngException& e) {
        std::fprintf(stderr, "Error: %s (%s)\n", e.what(), error_string(e.code()));
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
