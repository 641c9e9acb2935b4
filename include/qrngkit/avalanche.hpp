/**
 * @file avalanche.hpp
 * @brief Key sensitivity (avalanche) measurement.
 *
 * Each trial flips one uniformly chosen key bit, re-encrypts the same
 * plaintext under the same IV and counts how many ciphertext bits changed.
 * An ideal cipher changes about half of them.
 *
 * Key bits are numbered MSB first: bit 0 is the top bit of key[0].
 */

#ifndef QRNGKIT_AVALANCHE_HPP
#define QRNGKIT_AVALANCHE_HPP

#include <random>
#include <vector>

#include "cipher.hpp"
#include "config.hpp"

namespace qrngkit {

/**
 * @brief One trial: which bit was flipped and how much changed.
 */
struct AvalancheSample {
    std::size_t bit_index_flipped = 0;
    double percent_changed = 0.0;
};

/**
 * @brief Mean and population standard deviation (divisor n).
 */
struct AvalancheSummary {
    double mean = 0.0;
    double population_std_dev = 0.0;
};

struct AvalancheReport {
    std::vector<AvalancheSample> samples;
    AvalancheSummary summary;
    Bytes baseline_ciphertext;
};

/**
 * @brief Copy of @p key with exactly one bit inverted.
 *
 * @throws InvalidParameterException if bit_index >= key.size() * 8
 */
[[nodiscard]] Bytes flip_key_bit(const Bytes& key, std::size_t bit_index);

/**
 * @brief Percentage of differing bits over the shorter ciphertext.
 *
 * Returns 0 when either input is empty.
 */
[[nodiscard]] double avalanche_percent(const Bytes& c1, const Bytes& c2) noexcept;

/**
 * @brief Reduce trial values to mean and population deviation.
 *
 * An empty input gives zeros.
 */
[[nodiscard]] AvalancheSummary summarize_avalanche(const std::vector<double>& percents) noexcept;

/**
 * @brief Runs avalanche trials against a cipher.
 */
class AvalancheAnalyzer {
public:
    /**
     * @param cipher Cipher under test (must outlive the analyzer)
     * @param engine Source of flip positions (must outlive the analyzer)
     */
    AvalancheAnalyzer(const BlockCipher& cipher, std::mt19937_64& engine) noexcept
        : cipher_(cipher), engine_(engine) {}

    /**
     * @brief Run @p trials flips with an all-zero IV of DEFAULT_IV_BYTES.
     */
    AvalancheReport analyze(const Bytes& key, const Bytes& plaintext,
                            std::size_t trials = DEFAULT_AVALANCHE_TRIALS);

    /**
     * @brief Run @p trials flips with an explicit IV.
     *
     * @throws InvalidParameterException for an empty key or zero trials
     */
    AvalancheReport analyze(const Bytes& key, const Bytes& iv, const Bytes& plaintext,
                            std::size_t trials);

private:
    const BlockCipher& cipher_;
    std::mt19937_64& engine_;
};

} // namespace qrngkit

#endif // QRNGKIT_AVALANCHE_HPP
