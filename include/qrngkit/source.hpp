/**
 * @file source.hpp
 * @brief Raw measurement bit sources.
 *
 * A RawBitSource is the boundary to whatever produces raw, possibly biased
 * bits: measurement hardware, a simulator or a classical PRNG. The core only
 * ever calls produce_raw_bits(); how the source was configured is decided
 * by whoever constructs it.
 */

#ifndef QRNGKIT_SOURCE_HPP
#define QRNGKIT_SOURCE_HPP

#include <cstdint>
#include <functional>
#include <random>

#include "bitstring.hpp"
#include "config.hpp"

namespace qrngkit {

/**
 * @brief Producer of raw measurement bits.
 *
 * Implementations may block and may deliver more bits than requested (for
 * example whole measurement shots). They report failure by throwing
 * SourceUnavailableException; no retry happens inside the library.
 */
class RawBitSource {
public:
    virtual ~RawBitSource() = default;

    /**
     * @brief Produce raw bits.
     *
     * @param count Number of bits wanted (always > 0)
     * @return Bits in the order they were measured
     */
    virtual Bitstring produce_raw_bits(std::size_t count) = 0;
};

/**
 * @brief Simulated register readout with a configurable bias.
 *
 * Each shot measures SHOT_WIDTH independent bits that read 1 with
 * probability @p p_one. A request is rounded up to whole shots. With
 * p_one = 0.5 this is the classical PRNG baseline.
 */
class SimulatedSource : public RawBitSource {
public:
    /**
     * @brief Construct a simulated source.
     *
     * @param p_one Probability that a bit reads 1, in [0, 1]
     * @param seed Engine seed
     * @param shot_width Bits per shot (must be > 0)
     * @throws InvalidParameterException on out-of-range arguments
     */
    explicit SimulatedSource(double p_one = 0.5, std::uint64_t seed = 0,
                             std::size_t shot_width = SHOT_WIDTH);

    Bitstring produce_raw_bits(std::size_t count) override;

    [[nodiscard]] double p_one() const noexcept {
        return p_one_;
    }

    [[nodiscard]] std::size_t shots_taken() const noexcept {
        return shots_taken_;
    }

private:
    std::mt19937_64 engine_;
    std::bernoulli_distribution coin_;
    double p_one_;
    std::size_t shot_width_;
    std::size_t shots_taken_;
};

/**
 * @brief Source backed by a caller-supplied function.
 */
class CallbackSource : public RawBitSource {
public:
    using Producer = std::function<Bitstring(std::size_t)>;

    explicit CallbackSource(Producer producer);

    Bitstring produce_raw_bits(std::size_t count) override;

private:
    Producer producer_;
};

} // namespace qrngkit

#endif // QRNGKIT_SOURCE_HPP
