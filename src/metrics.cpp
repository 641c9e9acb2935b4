/**
 * @file metrics.cpp
 * @brief Bias, summary and flip-rate metrics.
 */

#include <qrngkit/metrics.hpp>
#include <qrngkit/statistics.hpp>

#include <cmath>

namespace qrngkit {

double compute_bias(const Bitstring& bits) noexcept {
    if (bits.empty()) {
        return 0.0;
    }
    double p1 = static_cast<double>(bits.count_ones()) / static_cast<double>(bits.size());
    return std::fabs(p1 - 0.5);
}

BitMetrics report_metrics(const Bitstring& bits) noexcept {
    BitMetrics m;
    if (bits.empty()) {
        return m;
    }

    double n = static_cast<double>(bits.size());
    m.length = bits.size();
    m.ones = bits.count_ones();
    m.zeros = m.length - m.ones;
    m.p0 = static_cast<double>(m.zeros) / n;
    m.p1 = static_cast<double>(m.ones) / n;
    m.bias = std::fabs(m.p1 - 0.5);
    m.entropy = shannon_entropy(bits);
    m.frequency_p = monobit_frequency(bits).p_value;
    m.runs_p = runs(bits).p_value;
    return m;
}

FlipProbability bit_flip_probability(const Bitstring& measured,
                                     const Bitstring& reference) noexcept {
    FlipProbability flips;
    std::size_t n = measured.size() < reference.size() ? measured.size() : reference.size();

    std::size_t zero_total = 0;
    std::size_t one_total = 0;
    std::size_t flip_01 = 0;
    std::size_t flip_10 = 0;

    for (std::size_t i = 0; i < n; ++i) {
        if (reference[i] == 0) {
            ++zero_total;
            flip_01 += static_cast<std::size_t>(measured[i] == 1);
        } else {
            ++one_total;
            flip_10 += static_cast<std::size_t>(measured[i] == 0);
        }
    }

    if (zero_total > 0) {
        flips.p01 = static_cast<double>(flip_01) / static_cast<double>(zero_total);
    }
    if (one_total > 0) {
        flips.p10 = static_cast<double>(flip_10) / static_cast<double>(one_total);
    }
    return flips;
}

} // namespace qrngkit
