/**
 * @file bitbuffer.hpp
 * @brief FIFO accumulator in front of a raw bit source.
 *
 * The buffer hands out exactly the number of bits asked for. When it runs
 * short it pulls from its RawBitSource, which may deliver in whatever chunk
 * size suits it; anything not handed out stays queued for the next request.
 *
 * @par Invariant
 * Every bit received from the source is delivered exactly once and in the
 * order it was received: total_received() == total_delivered() + buffered().
 *
 * A BitBuffer is single-reader. Concurrent consumers each need their own
 * buffer (and source).
 */

#ifndef QRNGKIT_BITBUFFER_HPP
#define QRNGKIT_BITBUFFER_HPP

#include "bitstring.hpp"
#include "config.hpp"
#include "source.hpp"

namespace qrngkit {

/**
 * @brief Raw bit queue backed by a RawBitSource.
 */
class BitBuffer {
public:
    /**
     * @brief Construct a buffer drawing from @p source.
     *
     * The source must outlive the buffer.
     */
    explicit BitBuffer(RawBitSource& source) noexcept
        : source_(source), head_(0), total_received_(0), total_delivered_(0) {}

    BitBuffer(const BitBuffer&) = delete;
    BitBuffer& operator=(const BitBuffer&) = delete;

    /**
     * @brief Take exactly @p n bits from the front of the queue.
     *
     * Pulls from the source until at least @p n bits are queued. A request
     * for zero bits returns an empty bitstring without touching the source.
     *
     * @throws SourceUnavailableException if the source fails or returns no bits
     */
    Bitstring request(std::size_t n);

    /**
     * @brief Bits received but not yet delivered.
     */
    [[nodiscard]] std::size_t buffered() const noexcept {
        return pending_.size() - head_;
    }

    [[nodiscard]] std::size_t total_received() const noexcept {
        return total_received_;
    }

    [[nodiscard]] std::size_t total_delivered() const noexcept {
        return total_delivered_;
    }

private:
    RawBitSource& source_;
    Bitstring pending_;
    std::size_t head_;
    std::size_t total_received_;
    std::size_t total_delivered_;

    void pull(std::size_t missing);
    void compact();
};

} // namespace qrngkit

#endif // QRNGKIT_BITBUFFER_HPP
