/**
 * @file source.cpp
 * @brief Simulated and callback raw bit sources.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/logging.hpp>
#include <qrngkit/source.hpp>

#include <utility>

namespace qrngkit {

SimulatedSource::SimulatedSource(double p_one, std::uint64_t seed, std::size_t shot_width)
    : engine_(seed), coin_(p_one >= 0.0 && p_one <= 1.0 ? p_one : 0.5), p_one_(p_one),
      shot_width_(shot_width), shots_taken_(0) {
    if (!(p_one >= 0.0 && p_one <= 1.0)) {
        throw InvalidParameterException("p_one must lie in [0, 1]");
    }
    if (shot_width == 0) {
        throw InvalidParameterException("shot width must be positive");
    }
}

Bitstring SimulatedSource::produce_raw_bits(std::size_t count) {
    std::size_t shots = (count + shot_width_ - 1) / shot_width_;
    if (shots == 0) {
        shots = 1;
    }

    Bitstring bits;
    bits.reserve(shots * shot_width_);
    for (std::size_t shot = 0; shot < shots; ++shot) {
        for (std::size_t i = 0; i < shot_width_; ++i) {
            bits.append(coin_(engine_) ? 1 : 0);
        }
    }
    shots_taken_ += shots;

    logger().trace("simulated source: {} shots, {} bits", shots, bits.size());
    return bits;
}

CallbackSource::CallbackSource(Producer producer) : producer_(std::move(producer)) {
    if (!producer_) {
        throw InvalidParameterException("callback source needs a producer");
    }
}

Bitstring CallbackSource::produce_raw_bits(std::size_t count) {
    return producer_(count);
}

} // namespace qrngkit
