/**
 * @file trials.hpp
 * @brief Repeated scoring of a bit source with confidence intervals.
 *
 * Each trial draws a fresh bitstring, scores it with the whole battery and
 * records one scalar per metric: the entropy value, the chi-square
 * statistic, or the p-value of the remaining four tests. The scalars are
 * reduced to mean +/- 1.96 * s / sqrt(n) with the n-1 sample deviation.
 */

#ifndef QRNGKIT_TRIALS_HPP
#define QRNGKIT_TRIALS_HPP

#include <array>
#include <functional>
#include <optional>
#include <vector>

#include "bitstring.hpp"
#include "config.hpp"
#include "statistics.hpp"

namespace qrngkit {

/**
 * @brief Metrics tracked per trial.
 */
enum class Metric {
    Entropy = 0,
    ChiSquare,
    Frequency,
    Runs,
    BlockFrequency,
    ApproximateEntropy
};

inline constexpr std::size_t NUM_METRICS = 6U;

inline constexpr std::array<Metric, NUM_METRICS> ALL_METRICS = {
    Metric::Entropy, Metric::ChiSquare,      Metric::Frequency,
    Metric::Runs,    Metric::BlockFrequency, Metric::ApproximateEntropy};

/**
 * @brief Short name of a metric, e.g. "runs_p".
 */
const char* metric_name(Metric metric) noexcept;

/**
 * @brief Select a metric's result from a scorecard.
 */
[[nodiscard]] const TestResult& metric_result(const Scorecard& card, Metric metric) noexcept;

/**
 * @brief Scalar recorded for a metric: statistic for entropy and
 *        chi-square, p-value otherwise.
 */
[[nodiscard]] double metric_value(const Scorecard& card, Metric metric) noexcept;

/**
 * @brief Mean and 95% half-width of a sample.
 *
 * Both are empty for no values; the half-width is 0 for one value.
 */
struct MeanCi {
    std::optional<double> mean;
    std::optional<double> ci95;
    std::size_t count = 0;
};

[[nodiscard]] MeanCi mean_ci95(const std::vector<double>& values);

/**
 * @brief Reduction of one metric over all trials.
 *
 * mean and confidence_interval95 are empty (undefined) when no trial ran.
 */
struct TrialSummary {
    std::optional<double> mean;
    std::optional<double> confidence_interval95;
    std::size_t pass_count = 0;
    std::size_t total_trials = 0;
};

/**
 * @brief Summaries for every metric.
 */
struct TrialReport {
    std::array<TrialSummary, NUM_METRICS> per_metric{};

    [[nodiscard]] const TrialSummary& at(Metric metric) const noexcept {
        return per_metric[static_cast<std::size_t>(metric)];
    }

    [[nodiscard]] TrialSummary& at(Metric metric) noexcept {
        return per_metric[static_cast<std::size_t>(metric)];
    }
};

/// Produces one bitstring of the requested length per call
using BitSourceFn = std::function<Bitstring(std::size_t)>;

/**
 * @brief Score @p trials independent draws of @p bit_length bits.
 *
 * @throws InvalidParameterException if bit_length is 0 or source is empty
 */
TrialReport run_trials(const BitSourceFn& source, std::size_t trials, std::size_t bit_length,
                       const SuiteConfig& config = {});

} // namespace qrngkit

#endif // QRNGKIT_TRIALS_HPP
