/**
 * @file test_trials.cpp
 * @brief Unit tests for trial aggregation.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/extractor.hpp>
#include <qrngkit/source.hpp>
#include <qrngkit/trials.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstring>
#include <set>
#include <string>

using namespace qrngkit;
using Catch::Approx;

TEST_CASE("Metric naming", "[trials]") {
    std::set<std::string> names;
    for (Metric metric : ALL_METRICS) {
        names.insert(metric_name(metric));
    }
    REQUIRE(names.size() == NUM_METRICS);
    REQUIRE(std::strcmp(metric_name(Metric::Entropy), "entropy") == 0);
    REQUIRE(std::strcmp(metric_name(Metric::Runs), "runs_p") == 0);
}

TEST_CASE("Metric values", "[trials]") {
    Scorecard card;
    card.entropy = {0.9, 0.8, true, true};
    card.chi_square = {2.5, 0.11, true, true};
    card.frequency = {1.2, 0.23, true, true};

    // Entropy and chi-square report their statistic, the rest their p-value
    REQUIRE(metric_value(card, Metric::Entropy) == 0.9);
    REQUIRE(metric_value(card, Metric::ChiSquare) == 2.5);
    REQUIRE(metric_value(card, Metric::Frequency) == 0.23);
    REQUIRE(&metric_result(card, Metric::Runs) == &card.runs);
}

TEST_CASE("Mean and confidence interval", "[trials]") {
    SECTION("no values") {
        MeanCi r = mean_ci95({});
        REQUIRE_FALSE(r.mean.has_value());
        REQUIRE_FALSE(r.ci95.has_value());
        REQUIRE(r.count == 0);
    }

    SECTION("single value has zero width") {
        MeanCi r = mean_ci95({0.42});
        REQUIRE(*r.mean == 0.42);
        REQUIRE(*r.ci95 == 0.0);
    }

    SECTION("sample standard deviation with n - 1") {
        // mean 5, squared deviations sum 32, s = sqrt(32 / 7)
        MeanCi r = mean_ci95({2, 4, 4, 4, 5, 5, 7, 9});
        REQUIRE(*r.mean == Approx(5.0));
        REQUIRE(*r.ci95 == Approx(1.96 * std::sqrt(32.0 / 7.0) / std::sqrt(8.0)));
        REQUIRE(r.count == 8);
    }

    SECTION("identical values have zero width") {
        MeanCi r = mean_ci95({3.0, 3.0, 3.0});
        REQUIRE(*r.ci95 == 0.0);
    }
}

TEST_CASE("Run trials", "[trials]") {
    SimulatedSource source(0.5, 31);
    BitBuffer buffer(source);
    Extractor extractor(buffer);
    BitSourceFn draw = [&extractor](std::size_t n) { return extractor.extract_fixed_length(n); };

    SECTION("one trial has zero-width intervals") {
        TrialReport report = run_trials(draw, 1, 1024);
        for (Metric metric : ALL_METRICS) {
            const TrialSummary& s = report.at(metric);
            REQUIRE(s.mean.has_value());
            REQUIRE(*s.confidence_interval95 == 0.0);
            REQUIRE(s.total_trials == 1);
            REQUIRE(s.pass_count <= 1);
        }
    }

    SECTION("several trials") {
        TrialReport report = run_trials(draw, 8, 2048);
        for (Metric metric : ALL_METRICS) {
            const TrialSummary& s = report.at(metric);
            REQUIRE(s.total_trials == 8);
            REQUIRE(s.pass_count <= 8);
            REQUIRE(*s.confidence_interval95 >= 0.0);
        }
        REQUIRE(*report.at(Metric::Entropy).mean > 0.99);
        REQUIRE(report.at(Metric::Entropy).pass_count >= 7);
    }

    SECTION("zero trials leaves means undefined") {
        TrialReport report = run_trials(draw, 0, 128);
        for (Metric metric : ALL_METRICS) {
            const TrialSummary& s = report.at(metric);
            REQUIRE_FALSE(s.mean.has_value());
            REQUIRE_FALSE(s.confidence_interval95.has_value());
            REQUIRE(s.pass_count == 0);
            REQUIRE(s.total_trials == 0);
        }
        REQUIRE(buffer.total_received() == 0);
    }

    SECTION("invalid arguments") {
        REQUIRE_THROWS_AS(run_trials(draw, 3, 0), InvalidParameterException);
        REQUIRE_THROWS_AS(run_trials(BitSourceFn{}, 3, 64), InvalidParameterException);
    }
}

TEST_CASE("Run trials on raw and debiased bits", "[trials]") {
    SimulatedSource source(0.8, 44);
    BitBuffer buffer(source);
    Extractor extractor(buffer);

    auto draw_in = [&extractor](ExtractionMode mode) -> BitSourceFn {
        return [&extractor, mode](std::size_t n) { return extractor.extract(n, mode); };
    };

    TrialReport raw = run_trials(draw_in(ExtractionMode::Raw), 6, 2048);
    TrialReport debiased = run_trials(draw_in(ExtractionMode::Debiased), 6, 2048);

    // Undebiased baseline fails the frequency tests outright
    REQUIRE(raw.at(Metric::Frequency).pass_count == 0);
    REQUIRE(raw.at(Metric::ChiSquare).pass_count == 0);
    REQUIRE(raw.at(Metric::Entropy).pass_count == 0);
    REQUIRE(*raw.at(Metric::Entropy).mean < 0.8);

    REQUIRE(*debiased.at(Metric::Entropy).mean > 0.99);
    REQUIRE(debiased.at(Metric::Entropy).pass_count >= 5);
    REQUIRE(*debiased.at(Metric::ChiSquare).mean < *raw.at(Metric::ChiSquare).mean);
}

TEST_CASE("Run trials with a fixed stream", "[trials]") {
    BitSourceFn constant = [](std::size_t n) { return Bitstring(n, 1); };

    TrialReport report = run_trials(constant, 4, 256);
    const TrialSummary& chi = report.at(Metric::ChiSquare);
    REQUIRE(*chi.mean == Approx(256.0));
    REQUIRE(*chi.confidence_interval95 == 0.0);
    REQUIRE(chi.pass_count == 0);
    REQUIRE(report.at(Metric::Entropy).pass_count == 0);
    REQUIRE(report.at(Metric::Runs).pass_count == 0);
}
