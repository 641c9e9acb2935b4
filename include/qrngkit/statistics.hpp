/**
 * @file statistics.hpp
 * @brief Statistical randomness test battery.
 *
 * Every test is a pure function of its input. Empty input is never an
 * error: the result is zeroed, fails and carries Error::DegenerateInput.
 * Parameter problems (zero or oversize block lengths) are rejected with
 * InvalidParameterException before any counting starts.
 *
 * The four hypothesis tests follow NIST SP 800-22 rev1a sections 2.1
 * (frequency), 2.2 (block frequency), 2.3 (runs) and 2.12 (approximate
 * entropy) and pass when p >= SIGNIFICANCE_LEVEL.
 */

#ifndef QRNGKIT_STATISTICS_HPP
#define QRNGKIT_STATISTICS_HPP

#include "bitstring.hpp"
#include "config.hpp"
#include "error.hpp"

namespace qrngkit {

/**
 * @brief Outcome of a single test.
 *
 * For the entropy test p_value holds the entropy score itself. A test whose
 * precondition does not hold reports applicable = false together with
 * p_value = 0 and passed = false. Empty input is flagged with
 * status = Error::DegenerateInput.
 */
struct TestResult {
    double statistic = 0.0;
    double p_value = 0.0;
    bool passed = false;
    bool applicable = true;
    Error status = Error::Ok;
};

/**
 * @brief Shannon entropy in bits per bit (0 for empty input).
 */
[[nodiscard]] double shannon_entropy(const Bitstring& bits) noexcept;

/**
 * @brief Entropy check against a threshold.
 *
 * statistic = p_value = H, passed = H >= threshold.
 */
[[nodiscard]] TestResult entropy_test(const Bitstring& bits,
                                      double threshold = ENTROPY_PASS_THRESHOLD) noexcept;

/**
 * @brief Chi-square goodness of fit of zeros/ones against n/2 each.
 *
 * Passes when the statistic is below CHI_SQUARE_CRITICAL (df = 1,
 * alpha = 0.05). p_value is the df = 1 upper tail, erfc(sqrt(chi2 / 2)).
 */
[[nodiscard]] TestResult chi_square_uniformity(const Bitstring& bits) noexcept;

/**
 * @brief Frequency (monobit) test.
 *
 * statistic = |S| / sqrt(n) where S sums the bits mapped to +1/-1,
 * p = erfc(statistic / sqrt(2)).
 */
[[nodiscard]] TestResult monobit_frequency(const Bitstring& bits) noexcept;

/**
 * @brief Runs test.
 *
 * statistic is the observed number of runs. Not applicable (p = 0, fail)
 * when the proportion of ones pi satisfies |pi - 0.5| >= 2 / sqrt(n).
 */
[[nodiscard]] TestResult runs(const Bitstring& bits) noexcept;

/**
 * @brief Frequency test within blocks.
 *
 * Splits the input into floor(n / M) blocks of M bits (the remainder is
 * ignored), statistic = 4M * sum((pi_i - 1/2)^2), p = igamc(N / 2, chi2 / 2).
 *
 * @throws InvalidParameterException if block_size is 0 or exceeds a
 *         non-empty input
 */
[[nodiscard]] TestResult block_frequency(const Bitstring& bits,
                                         std::size_t block_size = DEFAULT_BLOCK_SIZE);

/**
 * @brief Approximate entropy test.
 *
 * Compares the frequencies of all overlapping (wrapping) m-bit and
 * (m+1)-bit patterns: ApEn = phi(m) - phi(m+1), statistic =
 * 2n(ln 2 - ApEn), p = igamc(2^(m-1), statistic / 2).
 *
 * @throws InvalidParameterException if m > MAX_APEN_BLOCK_LENGTH or m + 1
 *         exceeds a non-empty input
 */
[[nodiscard]] TestResult approximate_entropy(const Bitstring& bits,
                                             std::size_t block_length = DEFAULT_APEN_BLOCK_LENGTH);

/**
 * @brief All six results for one bitstring.
 */
struct Scorecard {
    TestResult entropy;
    TestResult chi_square;
    TestResult frequency;
    TestResult runs;
    TestResult block_frequency;
    TestResult approximate_entropy;

    [[nodiscard]] bool all_passed() const noexcept {
        return entropy.passed && chi_square.passed && frequency.passed && runs.passed &&
               block_frequency.passed && approximate_entropy.passed;
    }
};

/**
 * @brief Run the whole battery.
 *
 * The block frequency block size is clamped to the input length so that
 * short inputs still score (as a single block).
 */
[[nodiscard]] Scorecard score(const Bitstring& bits, const SuiteConfig& config = {});

} // namespace qrngkit

#endif // QRNGKIT_STATISTICS_HPP
