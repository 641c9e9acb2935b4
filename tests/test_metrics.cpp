/**
 * @file test_metrics.cpp
 * @brief Unit tests for bias and readout metrics.
 */

#include <qrngkit/metrics.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace qrngkit;
using Catch::Approx;

TEST_CASE("Bias", "[metrics]") {
    REQUIRE(compute_bias(Bitstring()) == 0.0);
    REQUIRE(compute_bias(Bitstring::from_string("0101")) == 0.0);
    REQUIRE(compute_bias(Bitstring::from_string("0111")) == Approx(0.25));
    REQUIRE(compute_bias(Bitstring::from_string("0001")) == Approx(0.25));
    REQUIRE(compute_bias(Bitstring(8, 1)) == Approx(0.5));
}

TEST_CASE("Metric report", "[metrics]") {
    SECTION("counts and proportions") {
        BitMetrics m = report_metrics(Bitstring::from_string("1011010101"));
        REQUIRE(m.length == 10);
        REQUIRE(m.ones == 6);
        REQUIRE(m.zeros == 4);
        REQUIRE(m.p1 == Approx(0.6));
        REQUIRE(m.p0 == Approx(0.4));
        REQUIRE(m.bias == Approx(0.1));
        REQUIRE(m.entropy == Approx(0.9709505945));
        REQUIRE(m.frequency_p == Approx(0.527089).epsilon(1e-5));
    }

    SECTION("empty input reports zeros") {
        BitMetrics m = report_metrics(Bitstring());
        REQUIRE(m.length == 0);
        REQUIRE(m.entropy == 0.0);
        REQUIRE(m.runs_p == 0.0);
    }
}

TEST_CASE("Bit flip probability", "[metrics]") {
    SECTION("identical streams have no flips") {
        Bitstring bits = Bitstring::from_string("01101001");
        FlipProbability flips = bit_flip_probability(bits, bits);
        REQUIRE(flips.p01 == 0.0);
        REQUIRE(flips.p10 == 0.0);
        REQUIRE(readout_error_estimate(flips) == 0.0);
    }

    SECTION("rates are conditioned on the reference bit") {
        // reference zeros: 4, one read as 1; reference ones: 4, two read as 0
        Bitstring reference = Bitstring::from_string("00001111");
        Bitstring measured = Bitstring::from_string("01001010");
        FlipProbability flips = bit_flip_probability(measured, reference);
        REQUIRE(flips.p01 == Approx(0.25));
        REQUIRE(flips.p10 == Approx(0.5));
        REQUIRE(readout_error_estimate(flips.p01, flips.p10) == Approx(0.375));
    }

    SECTION("absent reference class yields zero") {
        FlipProbability flips =
            bit_flip_probability(Bitstring::from_string("1010"), Bitstring(4, 1));
        REQUIRE(flips.p01 == 0.0);
        REQUIRE(flips.p10 == Approx(0.5));
    }

    SECTION("only the common prefix is used") {
        FlipProbability flips = bit_flip_probability(Bitstring::from_string("11"),
                                                     Bitstring::from_string("0000000"));
        REQUIRE(flips.p01 == Approx(1.0));
    }
}
