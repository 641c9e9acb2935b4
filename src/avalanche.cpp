/**
 * @file avalanche.cpp
 * @brief Avalanche trials and their reduction.
 */

#include <qrngkit/avalanche.hpp>
#include <qrngkit/error.hpp>
#include <qrngkit/logging.hpp>

#include <cmath>
#include <string>

namespace qrngkit {

Bytes flip_key_bit(const Bytes& key, std::size_t bit_index) {
    std::size_t total_bits = key.size() * 8U;
    if (bit_index >= total_bits) {
        throw InvalidParameterException("bit index " + std::to_string(bit_index) +
                                        " outside key of " + std::to_string(total_bits) +
                                        " bits");
    }

    Bytes flipped = key;
    flipped[bit_index / 8U] ^= static_cast<std::uint8_t>(0x80U >> (bit_index % 8U));
    return flipped;
}

double avalanche_percent(const Bytes& c1, const Bytes& c2) noexcept {
    std::size_t min_bytes = c1.size() < c2.size() ? c1.size() : c2.size();
    if (min_bytes == 0) {
        return 0.0;
    }

    std::size_t changed = 0;
    for (std::size_t i = 0; i < min_bytes; ++i) {
        changed += static_cast<std::size_t>(__builtin_popcount(static_cast<unsigned>(c1[i] ^ c2[i])));
    }
    return 100.0 * static_cast<double>(changed) / static_cast<double>(min_bytes * 8U);
}

AvalancheSummary summarize_avalanche(const std::vector<double>& percents) noexcept {
    AvalancheSummary summary;
    if (percents.empty()) {
        return summary;
    }

    double n = static_cast<double>(percents.size());
    double sum = 0.0;
    for (double p : percents) {
        sum += p;
    }
    summary.mean = sum / n;

    double squares = 0.0;
    for (double p : percents) {
        squares += (p - summary.mean) * (p - summary.mean);
    }
    summary.population_std_dev = std::sqrt(squares / n);
    return summary;
}

AvalancheReport AvalancheAnalyzer::analyze(const Bytes& key, const Bytes& plaintext,
                                           std::size_t trials) {
    return analyze(key, Bytes(DEFAULT_IV_BYTES, 0), plaintext, trials);
}

AvalancheReport AvalancheAnalyzer::analyze(const Bytes& key, const Bytes& iv,
                                           const Bytes& plaintext, std::size_t trials) {
    if (key.empty()) {
        throw InvalidParameterException("avalanche needs a non-empty key");
    }
    if (trials == 0) {
        throw InvalidParameterException("avalanche needs at least one trial");
    }

    AvalancheReport report;
    report.baseline_ciphertext = cipher_.encrypt(key, iv, plaintext);
    report.samples.reserve(trials);

    std::uniform_int_distribution<std::size_t> pick(0, key.size() * 8U - 1U);
    std::vector<double> percents;
    percents.reserve(trials);

    for (std::size_t t = 0; t < trials; ++t) {
        AvalancheSample sample;
        sample.bit_index_flipped = pick(engine_);

        Bytes flipped = flip_key_bit(key, sample.bit_index_flipped);
        Bytes ciphertext = cipher_.encrypt(flipped, iv, plaintext);
        sample.percent_changed = avalanche_percent(report.baseline_ciphertext, ciphertext);

        logger().debug("avalanche trial {}: bit {} -> {:.2f}%", t + 1, sample.bit_index_flipped,
                       sample.percent_changed);
        percents.push_back(sample.percent_changed);
        report.samples.push_back(sample);
    }

    report.summary = summarize_avalanche(percents);
    return report;
}

} // namespace qrngkit
