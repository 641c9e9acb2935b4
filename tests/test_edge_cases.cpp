/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests across the extraction pipeline.
 *
 * Tests boundary conditions, corner cases, and stress scenarios.
 */

#include <catch2/catch_test_macros.hpp>
#include <qrngkit/qrngkit.hpp>

using namespace qrngkit;

// ============================================================================
// Source Delivery Edge Cases
// ============================================================================

TEST_CASE("Source delivery granularity", "[edge][bitbuffer]") {
    SECTION("one bit per call") {
        int calls = 0;
        CallbackSource source([&calls](std::size_t) {
            ++calls;
            return Bitstring::from_string(calls % 2 == 0 ? "1" : "0");
        });
        BitBuffer buffer(source);

        Bitstring bits = buffer.request(9);
        REQUIRE(bits.to_string() == "010101010");
        REQUIRE(calls == 9);
        REQUIRE(buffer.buffered() == 0);
    }

    SECTION("far more than requested") {
        CallbackSource source([](std::size_t) { return Bitstring(10000, 1); });
        BitBuffer buffer(source);

        for (int i = 0; i < 100; ++i) {
            REQUIRE(buffer.request(99).size() == 99);
        }
        REQUIRE(buffer.total_received() == 10000);
        REQUIRE(buffer.buffered() == 100);
    }
}

// ============================================================================
// Extraction Edge Cases
// ============================================================================

TEST_CASE("Extraction edge cases", "[edge][extractor]") {
    SECTION("heavily biased source still gives exact lengths") {
        SimulatedSource source(0.99, 17);
        BitBuffer buffer(source);
        Extractor extractor(buffer);

        ExtractionStats stats;
        REQUIRE(extractor.extract_fixed_length(64, &stats).size() == 64);
        REQUIRE(stats.efficiency < 0.05);
    }

    SECTION("single-bit shots") {
        SimulatedSource source(0.5, 17, 1);
        BitBuffer buffer(source);
        Extractor extractor(buffer);
        REQUIRE(extractor.extract_fixed_length(333).size() == 333);
    }

    SECTION("sequential extractions share the buffer without overlap") {
        SimulatedSource source(0.5, 23);
        BitBuffer buffer(source);
        Extractor extractor(buffer);

        ExtractionStats first;
        ExtractionStats second;
        (void)extractor.extract_fixed_length(100, &first);
        (void)extractor.extract_fixed_length(100, &second);
        REQUIRE(buffer.total_delivered() == first.raw_bits_used + second.raw_bits_used);
    }

    SECTION("buffer stays usable after a stall") {
        bool constant = true;
        SimulatedSource fair(0.5, 4);
        CallbackSource source([&](std::size_t count) {
            return constant ? Bitstring(count) : fair.produce_raw_bits(count);
        });
        BitBuffer buffer(source);

        ExtractorConfig config;
        config.max_iterations = 2;
        Extractor extractor(buffer, config);
        REQUIRE_THROWS_AS(extractor.extract_fixed_length(8), ExtractionStalledException);

        constant = false;
        Extractor patient(buffer);
        REQUIRE(patient.extract_fixed_length(8).size() == 8);
    }

    SECTION("efficiency floor keeps requests bounded") {
        ExtractorConfig config;
        ExtractionState state;
        state.current_yield_estimate = 0.0;
        REQUIRE(raw_bits_needed(1, state, config) == 100 + config.safety_margin);
    }
}

// ============================================================================
// Scoring Edge Cases
// ============================================================================

TEST_CASE("Scoring edge cases", "[edge][statistics]") {
    SECTION("single bit") {
        Scorecard card = score(Bitstring::from_string("1"));
        REQUIRE_FALSE(card.all_passed());
        REQUIRE(card.runs.statistic == 0.0);
        REQUIRE_FALSE(card.approximate_entropy.applicable);
    }

    SECTION("two balanced bits") {
        Scorecard card = score(Bitstring::from_string("01"));
        REQUIRE(card.entropy.statistic == 1.0);
        REQUIRE(card.chi_square.statistic == 0.0);
        REQUIRE(card.frequency.p_value == 1.0);
    }

    SECTION("maximum pattern length") {
        Bitstring bits(64, 1);
        TestResult r = approximate_entropy(bits, MAX_APEN_BLOCK_LENGTH);
        REQUIRE(r.statistic >= 0.0);
    }

    SECTION("block size equal to input length") {
        TestResult r = block_frequency(Bitstring::from_string("0101"), 4);
        REQUIRE(r.statistic == 0.0);
        REQUIRE(r.p_value == 1.0);
    }
}

// ============================================================================
// Trial Edge Cases
// ============================================================================

TEST_CASE("Trial edge cases", "[edge][trials]") {
    SECTION("one-bit trials") {
        TrialReport report = run_trials([](std::size_t n) { return Bitstring(n, 1); }, 3, 1);
        REQUIRE(report.at(Metric::Entropy).pass_count == 0);
        REQUIRE(*report.at(Metric::Entropy).mean == 0.0);
    }

    SECTION("source returning the wrong length is scored as given") {
        TrialReport report = run_trials([](std::size_t) { return Bitstring(); }, 2, 64);
        REQUIRE(report.at(Metric::Frequency).pass_count == 0);
        REQUIRE(report.at(Metric::Frequency).mean.has_value());
    }
}
