/**
 * @file extractor.hpp
 * @brief Pairwise (von Neumann) debiasing extractor.
 *
 * The raw stream is cut into non-overlapping pairs: 01 emits 0, 10 emits 1,
 * 00 and 11 emit nothing. This removes first-order bias but the yield
 * depends on the data, so fixed-length output needs a feedback loop.
 *
 * @par Fixed-length loop
 * Each round requests ceil(remaining / estimate) + safety_margin raw bits,
 * debiases them and blends the observed yield into the estimate:
 *
 *     estimate = prior_weight * estimate + (1 - prior_weight) * observed
 *
 * Both the estimate and each observation are clamped to efficiency_floor.
 * The loop gives up with ExtractionStalledException after max_iterations
 * rounds, or when the next request would take the raw bits consumed past
 * max_raw_factor * n + safety_margin.
 */

#ifndef QRNGKIT_EXTRACTOR_HPP
#define QRNGKIT_EXTRACTOR_HPP

#include <cstdint>

#include "bitbuffer.hpp"
#include "bitstring.hpp"
#include "config.hpp"

namespace qrngkit {

/**
 * @brief What an Extractor hands out for a length request.
 */
enum class ExtractionMode {
    Debiased, ///< Fixed-length pairwise debiasing
    Raw       ///< Source bits passed through untouched (classical baseline)
};

[[nodiscard]] const char* mode_name(ExtractionMode mode) noexcept;

/**
 * @brief Apply the pairwise debiasing transform.
 *
 * A trailing unpaired bit is ignored. Output length is at most half the
 * input length.
 */
[[nodiscard]] Bitstring von_neumann(const Bitstring& raw);

/**
 * @brief Per-call state of the adaptive fixed-length loop.
 */
struct ExtractionState {
    std::size_t raw_bits_consumed = 0;
    double current_yield_estimate = DEFAULT_INITIAL_EFFICIENCY;
    std::size_t iterations = 0;
};

/**
 * @brief Diagnostics reported by fixed-length extraction.
 */
struct ExtractionStats {
    std::size_t raw_bits_used = 0; ///< Raw bits pulled from the buffer
    std::size_t final_bits = 0;    ///< Bits returned (the requested length)
    double efficiency = 0.0;       ///< final_bits / raw_bits_used, 0 if none used
    std::size_t iterations = 0;    ///< Rounds of the feedback loop
};

/**
 * @brief Result of variable-length extraction.
 */
struct VariableExtraction {
    Bitstring raw;
    Bitstring extracted;
    double efficiency = 0.0; ///< extracted.size() / raw.size()
};

/**
 * @brief Blend an observed yield into the running estimate.
 *
 * @param state Loop state to update
 * @param observed Yield of the latest round
 * @param config Smoothing weight and floor
 */
void update_yield_estimate(ExtractionState& state, double observed,
                           const ExtractorConfig& config) noexcept;

/**
 * @brief Raw bits to request for the next round.
 *
 * Saturates at SIZE_MAX instead of overflowing.
 */
[[nodiscard]] std::size_t raw_bits_needed(std::size_t remaining, const ExtractionState& state,
                                          const ExtractorConfig& config) noexcept;

/**
 * @brief Debiasing front end over a BitBuffer.
 *
 * Holds no state between calls apart from what remains queued in the
 * buffer, so independent extractions may share one buffer sequentially.
 */
class Extractor {
public:
    /**
     * @brief Construct an extractor.
     *
     * @param buffer Raw bit queue (must outlive the extractor)
     * @param config Loop tuning
     * @throws InvalidParameterException on an unusable configuration
     */
    explicit Extractor(BitBuffer& buffer, ExtractorConfig config = {});

    /**
     * @brief Produce exactly @p n debiased bits.
     *
     * @param n Output length; 0 returns immediately without using the source
     * @param stats Optional diagnostics output
     * @throws InvalidParameterException if n / efficiency_floor does not fit
     *         in a size_t
     * @throws SourceUnavailableException if the source fails
     * @throws ExtractionStalledException if the round or raw-bit budget is
     *         exhausted
     */
    Bitstring extract_fixed_length(std::size_t n, ExtractionStats* stats = nullptr);

    /**
     * @brief Debias exactly @p raw_count raw bits, whatever the yield.
     *
     * @throws InvalidParameterException if raw_count is 0
     */
    VariableExtraction extract_variable_length(std::size_t raw_count);

    /**
     * @brief Pass @p n raw bits through without debiasing.
     */
    Bitstring extract_raw(std::size_t n, ExtractionStats* stats = nullptr);

    /**
     * @brief Exactly @p n bits in the given mode.
     *
     * Dispatches to extract_fixed_length() or extract_raw(), so debiased and
     * undebiased streams can be scored by the same code.
     */
    Bitstring extract(std::size_t n, ExtractionMode mode, ExtractionStats* stats = nullptr);

    /**
     * @defgroup numbers Random numbers from debiased bits
     * @{
     */
    std::uint32_t random_uint32();
    std::uint64_t random_uint64();
    float random_float(float min_val = 0.0F, float max_val = 1.0F);
    double random_double(double min_val = 0.0, double max_val = 1.0);
    /** @} */

    [[nodiscard]] const ExtractorConfig& config() const noexcept {
        return config_;
    }

private:
    BitBuffer& buffer_;
    ExtractorConfig config_;
};

} // namespace qrngkit

#endif // QRNGKIT_EXTRACTOR_HPP
