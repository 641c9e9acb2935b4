/**
 * @file trials.cpp
 * @brief Trial aggregation.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/logging.hpp>
#include <qrngkit/trials.hpp>

#include <cmath>

namespace qrngkit {

const char* metric_name(Metric metric) noexcept {
    switch (metric) {
    case Metric::Entropy:
        return "entropy";
    case Metric::ChiSquare:
        return "chi_square";
    case Metric::Frequency:
        return "frequency_p";
    case Metric::Runs:
        return "runs_p";
    case Metric::BlockFrequency:
        return "block_frequency_p";
    case Metric::ApproximateEntropy:
        return "approximate_entropy_p";
    default:
        return "unknown";
    }
}

const TestResult& metric_result(const Scorecard& card, Metric metric) noexcept {
    switch (metric) {
    case Metric::Entropy:
        return card.entropy;
    case Metric::ChiSquare:
        return card.chi_square;
    case Metric::Frequency:
        return card.frequency;
    case Metric::Runs:
        return card.runs;
    case Metric::BlockFrequency:
        return card.block_frequency;
    case Metric::ApproximateEntropy:
    default:
        return card.approximate_entropy;
    }
}

double metric_value(const Scorecard& card, Metric metric) noexcept {
    const TestResult& result = metric_result(card, metric);
    if (metric == Metric::Entropy || metric == Metric::ChiSquare) {
        return result.statistic;
    }
    return result.p_value;
}

MeanCi mean_ci95(const std::vector<double>& values) {
    MeanCi out;
    out.count = values.size();
    if (values.empty()) {
        return out;
    }

    double n = static_cast<double>(values.size());
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    double mean = sum / n;
    out.mean = mean;

    if (values.size() == 1) {
        out.ci95 = 0.0;
        return out;
    }

    double squares = 0.0;
    for (double v : values) {
        squares += (v - mean) * (v - mean);
    }
    double sample_std = std::sqrt(squares / (n - 1.0));
    out.ci95 = CONFIDENCE_Z * sample_std / std::sqrt(n);
    return out;
}

TrialReport run_trials(const BitSourceFn& source, std::size_t trials, std::size_t bit_length,
                       const SuiteConfig& config) {
    if (!source) {
        throw InvalidParameterException("trial source is empty");
    }
    if (bit_length == 0) {
        throw InvalidParameterException("bit length must be positive");
    }

    std::array<std::vector<double>, NUM_METRICS> samples;
    TrialReport report;
    for (auto& summary : report.per_metric) {
        summary.total_trials = trials;
    }

    for (std::size_t trial = 0; trial < trials; ++trial) {
        Bitstring bits = source(bit_length);
        Scorecard card = score(bits, config);

        for (Metric metric : ALL_METRICS) {
            auto idx = static_cast<std::size_t>(metric);
            samples[idx].push_back(metric_value(card, metric));
            if (metric_result(card, metric).passed) {
                ++report.per_metric[idx].pass_count;
            }
        }
        logger().debug("trial {}/{}: {} bits, all passed = {}", trial + 1, trials, bits.size(),
                       card.all_passed());
    }

    for (Metric metric : ALL_METRICS) {
        auto idx = static_cast<std::size_t>(metric);
        MeanCi reduced = mean_ci95(samples[idx]);
        report.per_metric[idx].mean = reduced.mean;
        report.per_metric[idx].confidence_interval95 = reduced.ci95;
    }

    logger().info("completed {} trials of {} bits", trials, bit_length);
    return report;
}

} // namespace qrngkit
