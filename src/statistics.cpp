/**
 * @file statistics.cpp
 * @brief Statistical randomness tests.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/statistics.hpp>

#include <boost/math/special_functions/gamma.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace qrngkit {

namespace {

/**
 * @brief phi(m) = sum over observed m-bit patterns of C * ln(C).
 *
 * Patterns overlap and wrap around the end of the sequence, so there are
 * exactly n of them.
 */
double pattern_log_sum(const Bitstring& bits, std::size_t m) {
    if (m == 0) {
        return 0.0;
    }

    std::size_t n = bits.size();
    std::vector<std::size_t> counts(std::size_t{1} << m, 0);
    std::uint32_t mask = (std::uint32_t{1} << m) - 1U;

    // Prime with the first m-1 bits, then slide one bit per position
    std::uint32_t pattern = 0;
    for (std::size_t j = 0; j + 1 < m; ++j) {
        pattern = (pattern << 1) | static_cast<std::uint32_t>(bits[j % n]);
    }
    for (std::size_t i = 0; i < n; ++i) {
        pattern = ((pattern << 1) | static_cast<std::uint32_t>(bits[(i + m - 1) % n])) & mask;
        ++counts[pattern];
    }

    double sum = 0.0;
    for (std::size_t count : counts) {
        if (count > 0) {
            double c = static_cast<double>(count) / static_cast<double>(n);
            sum += c * std::log(c);
        }
    }
    return sum;
}

} // namespace

double shannon_entropy(const Bitstring& bits) noexcept {
    if (bits.empty()) {
        return 0.0;
    }

    double n = static_cast<double>(bits.size());
    double p1 = static_cast<double>(bits.count_ones()) / n;
    double p0 = 1.0 - p1;

    double h = 0.0;
    if (p0 > 0.0) {
        h -= p0 * std::log2(p0);
    }
    if (p1 > 0.0) {
        h -= p1 * std::log2(p1);
    }
    return h;
}

TestResult entropy_test(const Bitstring& bits, double threshold) noexcept {
    TestResult result;
    if (bits.empty()) {
        result.status = Error::DegenerateInput;
        return result;
    }
    double h = shannon_entropy(bits);
    result.statistic = h;
    result.p_value = h;
    result.passed = h >= threshold;
    return result;
}

TestResult chi_square_uniformity(const Bitstring& bits) noexcept {
    TestResult result;
    if (bits.empty()) {
        result.status = Error::DegenerateInput;
        return result;
    }

    double expected = static_cast<double>(bits.size()) / 2.0;
    double ones = static_cast<double>(bits.count_ones());
    double zeros = static_cast<double>(bits.size()) - ones;

    double chi2 = ((zeros - expected) * (zeros - expected)) / expected +
                  ((ones - expected) * (ones - expected)) / expected;

    result.statistic = chi2;
    result.p_value = std::erfc(std::sqrt(chi2 / 2.0));
    result.passed = chi2 < CHI_SQUARE_CRITICAL;
    return result;
}

TestResult monobit_frequency(const Bitstring& bits) noexcept {
    TestResult result;
    if (bits.empty()) {
        result.status = Error::DegenerateInput;
        return result;
    }

    double n = static_cast<double>(bits.size());
    double sum = 2.0 * static_cast<double>(bits.count_ones()) - n;
    double s_obs = std::fabs(sum) / std::sqrt(n);

    result.statistic = s_obs;
    result.p_value = std::erfc(s_obs / std::sqrt(2.0));
    result.passed = result.p_value >= SIGNIFICANCE_LEVEL;
    return result;
}

TestResult runs(const Bitstring& bits) noexcept {
    TestResult result;
    std::size_t n = bits.size();
    if (n < 2) {
        if (n == 0) {
            result.status = Error::DegenerateInput;
        }
        return result;
    }

    std::size_t observed_runs = 1;
    for (std::size_t i = 1; i < n; ++i) {
        if (bits[i] != bits[i - 1]) {
            ++observed_runs;
        }
    }
    result.statistic = static_cast<double>(observed_runs);

    double dn = static_cast<double>(n);
    double pi = static_cast<double>(bits.count_ones()) / dn;

    // Frequency prerequisite; failing it makes the test inapplicable
    if (std::fabs(pi - 0.5) >= 2.0 / std::sqrt(dn)) {
        result.applicable = false;
        return result;
    }

    double spread = pi * (1.0 - pi);
    double numerator = std::fabs(static_cast<double>(observed_runs) - 2.0 * dn * spread);
    double denominator = 2.0 * std::sqrt(2.0 * dn) * spread;

    result.p_value = denominator > 0.0 ? std::erfc(numerator / denominator) : 0.0;
    result.passed = result.p_value >= SIGNIFICANCE_LEVEL;
    return result;
}

TestResult block_frequency(const Bitstring& bits, std::size_t block_size) {
    if (block_size == 0) {
        throw InvalidParameterException("block size must be positive");
    }

    TestResult result;
    std::size_t n = bits.size();
    if (n == 0) {
        result.status = Error::DegenerateInput;
        return result;
    }
    if (block_size > n) {
        throw InvalidParameterException("block size " + std::to_string(block_size) +
                                        " exceeds input length " + std::to_string(n));
    }

    std::size_t num_blocks = n / block_size;
    double m = static_cast<double>(block_size);

    double sum = 0.0;
    for (std::size_t block = 0; block < num_blocks; ++block) {
        std::size_t ones = 0;
        std::size_t start = block * block_size;
        for (std::size_t j = 0; j < block_size; ++j) {
            ones += static_cast<std::size_t>(bits[start + j]);
        }
        double deviation = static_cast<double>(ones) / m - 0.5;
        sum += deviation * deviation;
    }

    double chi2 = 4.0 * m * sum;
    result.statistic = chi2;
    result.p_value = boost::math::gamma_q(static_cast<double>(num_blocks) / 2.0, chi2 / 2.0);
    result.passed = result.p_value >= SIGNIFICANCE_LEVEL;
    return result;
}

TestResult approximate_entropy(const Bitstring& bits, std::size_t block_length) {
    if (block_length > MAX_APEN_BLOCK_LENGTH) {
        throw InvalidParameterException("approximate entropy block length " +
                                        std::to_string(block_length) + " exceeds " +
                                        std::to_string(MAX_APEN_BLOCK_LENGTH));
    }

    TestResult result;
    std::size_t n = bits.size();
    if (n == 0) {
        result.status = Error::DegenerateInput;
        return result;
    }
    if (block_length + 1 > n) {
        throw InvalidParameterException("approximate entropy block length " +
                                        std::to_string(block_length) +
                                        " too large for input length " + std::to_string(n));
    }

    double apen = pattern_log_sum(bits, block_length) - pattern_log_sum(bits, block_length + 1);
    double chi2 = 2.0 * static_cast<double>(n) * (std::log(2.0) - apen);
    if (chi2 < 0.0) {
        chi2 = 0.0;
    }

    result.statistic = chi2;
    result.p_value =
        boost::math::gamma_q(std::ldexp(1.0, static_cast<int>(block_length) - 1), chi2 / 2.0);
    result.passed = result.p_value >= SIGNIFICANCE_LEVEL;
    return result;
}

Scorecard score(const Bitstring& bits, const SuiteConfig& config) {
    Scorecard card;
    card.entropy = entropy_test(bits, config.entropy_threshold);
    card.chi_square = chi_square_uniformity(bits);
    card.frequency = monobit_frequency(bits);
    card.runs = runs(bits);

    std::size_t block_size = config.block_size;
    if (!bits.empty() && block_size > bits.size()) {
        block_size = bits.size();
    }
    card.block_frequency = block_frequency(bits, block_size);

    // Too short for the configured pattern length: report as not applicable
    if (!bits.empty() && config.apen_block_length + 1 > bits.size()) {
        card.approximate_entropy.applicable = false;
    } else {
        card.approximate_entropy = approximate_entropy(bits, config.apen_block_length);
    }
    return card;
}

} // namespace qrngkit
