/**
 * @file bench.cpp
 * @brief Throughput benchmarks for extraction and scoring.
 *
 * Measures fixed-length extraction against simulated sources of several
 * biases, and the statistical battery on blocks of several sizes. Use for
 * relative comparisons between revisions.
 *
 * Usage:
 *   ./build/qrngkit_bench              # Run with default 100 iterations
 *   ./build/qrngkit_bench 1000         # Run with custom iteration count
 */

#include <qrngkit/qrngkit.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>

using namespace qrngkit;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t EXTRACT_BITS = 4096;

static void bench_extract(const char* name, double p_one, int iterations) {
    SimulatedSource source(p_one, 1);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    // Warmup run
    ExtractionStats stats;
    (void)extractor.extract_fixed_length(EXTRACT_BITS, &stats);

    std::size_t raw_total = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        (void)extractor.extract_fixed_length(EXTRACT_BITS, &stats);
        raw_total += stats.raw_bits_used;
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_kbps = (static_cast<double>(EXTRACT_BITS) * 1000.0) / per_iter_us;
    double efficiency = static_cast<double>(EXTRACT_BITS) * static_cast<double>(iterations) /
                        static_cast<double>(raw_total);

    std::printf("%-20s %10.2f µs/iter  %10.1f Kbps  eff=%.4f\n", name, per_iter_us,
                throughput_kbps, efficiency);
}

static void bench_score(const char* name, std::size_t bits, int iterations) {
    SimulatedSource source(0.5, 2);
    Bitstring block = source.produce_raw_bits(bits).slice(0, bits);

    // Warmup run
    Scorecard card = score(block);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        card = score(block);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_kbps = (static_cast<double>(bits) * 1000.0) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %10.1f Kbps  %s\n", name, per_iter_us, throughput_kbps,
                card.all_passed() ? "pass" : "fail");
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("qrngkit Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Extraction size: %zu bits\n\n", EXTRACT_BITS);

    std::printf("%-20s %18s  %15s  %s\n", "Test", "Time", "Throughput", "Notes");
    std::printf("%-20s %18s  %15s  %s\n", "----", "----", "----------", "-----");

    std::printf("\nExtraction:\n");
    bench_extract("fair (p=0.50)", 0.50, iterations);
    bench_extract("biased (p=0.70)", 0.70, iterations);
    bench_extract("skewed (p=0.90)", 0.90, iterations);

    std::printf("\nScoring:\n");
    bench_score("1 Kbit", 1024, iterations);
    bench_score("16 Kbit", 16384, iterations);
    bench_score("128 Kbit", 131072, iterations);

    return 0;
}
