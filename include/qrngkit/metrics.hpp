/**
 * @file metrics.hpp
 * @brief Bias and noise summaries for raw versus debiased comparisons.
 */

#ifndef QRNGKIT_METRICS_HPP
#define QRNGKIT_METRICS_HPP

#include "bitstring.hpp"

namespace qrngkit {

/**
 * @brief Per-stream summary used for before/after mitigation reports.
 */
struct BitMetrics {
    std::size_t length = 0;
    std::size_t zeros = 0;
    std::size_t ones = 0;
    double p0 = 0.0;
    double p1 = 0.0;
    double bias = 0.0;        ///< |P(1) - 0.5|
    double entropy = 0.0;     ///< Shannon entropy per bit
    double frequency_p = 0.0; ///< Monobit p-value
    double runs_p = 0.0;      ///< Runs test p-value
};

/**
 * @brief Readout flip rates between a reference and a measured stream.
 */
struct FlipProbability {
    double p01 = 0.0; ///< P(measured 1 | reference 0)
    double p10 = 0.0; ///< P(measured 0 | reference 1)
};

/**
 * @brief |P(1) - 0.5|, or 0 for empty input.
 */
[[nodiscard]] double compute_bias(const Bitstring& bits) noexcept;

/**
 * @brief Summarize a stream. All fields are zero for empty input.
 */
[[nodiscard]] BitMetrics report_metrics(const Bitstring& bits) noexcept;

/**
 * @brief Estimate flip probabilities over the common prefix.
 *
 * A reference class that never occurs yields 0 for its rate.
 */
[[nodiscard]] FlipProbability bit_flip_probability(const Bitstring& measured,
                                                   const Bitstring& reference) noexcept;

/**
 * @brief Average readout error (p01 + p10) / 2.
 */
[[nodiscard]] inline double readout_error_estimate(double p01, double p10) noexcept {
    return (p01 + p10) / 2.0;
}

[[nodiscard]] inline double readout_error_estimate(const FlipProbability& flips) noexcept {
    return readout_error_estimate(flips.p01, flips.p10);
}

} // namespace qrngkit

#endif // QRNGKIT_METRICS_HPP
