/**
 * @file extractor.cpp
 * @brief Debiasing transform and adaptive fixed-length extraction.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/extractor.hpp>
#include <qrngkit/logging.hpp>
#include <qrngkit/numbers.hpp>

#include <cmath>
#include <limits>
#include <string>

namespace qrngkit {

namespace {

std::size_t raw_budget(std::size_t n, const ExtractorConfig& config) noexcept {
    constexpr std::size_t max_size = std::numeric_limits<std::size_t>::max();
    if (n > (max_size - config.safety_margin) / config.max_raw_factor) {
        return max_size;
    }
    return n * config.max_raw_factor + config.safety_margin;
}

} // namespace

const char* mode_name(ExtractionMode mode) noexcept {
    switch (mode) {
    case ExtractionMode::Debiased:
        return "debiased";
    case ExtractionMode::Raw:
        return "raw";
    default:
        return "unknown";
    }
}

Bitstring von_neumann(const Bitstring& raw) {
    Bitstring out;
    out.reserve(raw.size() / 4);

    std::size_t pairs = raw.size() / 2;
    for (std::size_t i = 0; i < pairs; ++i) {
        int first = raw[2 * i];
        int second = raw[2 * i + 1];
        // 01 -> 0, 10 -> 1, 00/11 discarded
        if (first != second) {
            out.append(first);
        }
    }
    return out;
}

void update_yield_estimate(ExtractionState& state, double observed,
                           const ExtractorConfig& config) noexcept {
    if (observed < config.efficiency_floor) {
        observed = config.efficiency_floor;
    }
    double blended =
        config.prior_weight * state.current_yield_estimate + (1.0 - config.prior_weight) * observed;
    state.current_yield_estimate =
        blended < config.efficiency_floor ? config.efficiency_floor : blended;
}

std::size_t raw_bits_needed(std::size_t remaining, const ExtractionState& state,
                            const ExtractorConfig& config) noexcept {
    double estimate = state.current_yield_estimate;
    if (estimate < config.efficiency_floor) {
        estimate = config.efficiency_floor;
    }
    constexpr std::size_t max_size = std::numeric_limits<std::size_t>::max();
    double scaled = std::ceil(static_cast<double>(remaining) / estimate);
    if (scaled >= static_cast<double>(max_size)) {
        return max_size;
    }
    auto needed = static_cast<std::size_t>(scaled);
    if (needed > max_size - config.safety_margin) {
        return max_size;
    }
    needed += config.safety_margin;
    return needed == 0 ? 1 : needed;
}

Extractor::Extractor(BitBuffer& buffer, ExtractorConfig config)
    : buffer_(buffer), config_(config) {
    if (!(config_.initial_efficiency > 0.0 && config_.initial_efficiency <= 1.0)) {
        throw InvalidParameterException("initial efficiency must lie in (0, 1]");
    }
    if (!(config_.efficiency_floor > 0.0 && config_.efficiency_floor <= 1.0)) {
        throw InvalidParameterException("efficiency floor must lie in (0, 1]");
    }
    if (!(config_.prior_weight >= 0.0 && config_.prior_weight <= 1.0)) {
        throw InvalidParameterException("prior weight must lie in [0, 1]");
    }
    if (config_.max_iterations == 0) {
        throw InvalidParameterException("max iterations must be positive");
    }
    if (config_.max_raw_factor == 0) {
        throw InvalidParameterException("max raw factor must be positive");
    }
}

Bitstring Extractor::extract_fixed_length(std::size_t n, ExtractionStats* stats) {
    if (n == 0) {
        if (stats != nullptr) {
            *stats = ExtractionStats{};
        }
        return {};
    }
    if (static_cast<double>(n) / config_.efficiency_floor >=
        static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        throw InvalidParameterException("output length " + std::to_string(n) +
                                        " too large for the efficiency floor");
    }

    ExtractionState state;
    std::size_t budget = raw_budget(n, config_);
    state.current_yield_estimate = config_.initial_efficiency;

    Bitstring extracted;
    extracted.reserve(n);

    while (extracted.size() < n) {
        if (state.iterations >= config_.max_iterations) {
            logger().error("extraction stalled: {} of {} bits after {} rounds ({} raw bits)",
                           extracted.size(), n, state.iterations, state.raw_bits_consumed);
            throw ExtractionStalledException(
                "extraction stalled after " + std::to_string(state.iterations) + " rounds with " +
                std::to_string(extracted.size()) + " of " + std::to_string(n) + " bits");
        }

        std::size_t need = raw_bits_needed(n - extracted.size(), state, config_);
        if (need > budget - state.raw_bits_consumed) {
            logger().error("extraction stalled: {} of {} bits, raw budget {} exhausted ({} used)",
                           extracted.size(), n, budget, state.raw_bits_consumed);
            throw ExtractionStalledException(
                "extraction stalled after " + std::to_string(state.raw_bits_consumed) +
                " raw bits with " + std::to_string(extracted.size()) + " of " +
                std::to_string(n) + " bits");
        }
        ++state.iterations;

        Bitstring raw = buffer_.request(need);
        state.raw_bits_consumed += raw.size();

        Bitstring out = von_neumann(raw);
        extracted.append(out);

        double observed = static_cast<double>(out.size()) / static_cast<double>(raw.size());
        update_yield_estimate(state, observed, config_);

        logger().debug("round {}: raw {} -> {} bits (observed {:.4f}, estimate {:.4f})",
                       state.iterations, raw.size(), out.size(), observed,
                       state.current_yield_estimate);
    }

    if (stats != nullptr) {
        stats->raw_bits_used = state.raw_bits_consumed;
        stats->final_bits = n;
        stats->efficiency =
            static_cast<double>(n) / static_cast<double>(state.raw_bits_consumed);
        stats->iterations = state.iterations;
    }

    return extracted.slice(0, n);
}

VariableExtraction Extractor::extract_variable_length(std::size_t raw_count) {
    if (raw_count == 0) {
        throw InvalidParameterException("raw bit count must be positive");
    }

    VariableExtraction result;
    result.raw = buffer_.request(raw_count);
    result.extracted = von_neumann(result.raw);
    result.efficiency =
        static_cast<double>(result.extracted.size()) / static_cast<double>(result.raw.size());
    return result;
}

Bitstring Extractor::extract_raw(std::size_t n, ExtractionStats* stats) {
    Bitstring raw = buffer_.request(n);
    if (stats != nullptr) {
        stats->raw_bits_used = n;
        stats->final_bits = n;
        stats->efficiency = n > 0 ? 1.0 : 0.0;
        stats->iterations = n > 0 ? 1 : 0;
    }
    return raw;
}

Bitstring Extractor::extract(std::size_t n, ExtractionMode mode, ExtractionStats* stats) {
    if (mode == ExtractionMode::Raw) {
        return extract_raw(n, stats);
    }
    return extract_fixed_length(n, stats);
}

std::uint32_t Extractor::random_uint32() {
    return to_uint32(extract_fixed_length(32));
}

std::uint64_t Extractor::random_uint64() {
    return to_uint64(extract_fixed_length(64));
}

float Extractor::random_float(float min_val, float max_val) {
    return to_float(extract_fixed_length(32), min_val, max_val);
}

double Extractor::random_double(double min_val, double max_val) {
    return to_double(extract_fixed_length(64), min_val, max_val);
}

} // namespace qrngkit
