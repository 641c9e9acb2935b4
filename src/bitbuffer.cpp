/**
 * @file bitbuffer.cpp
 * @brief BitBuffer queue management.
 */

#include <qrngkit/bitbuffer.hpp>
#include <qrngkit/error.hpp>
#include <qrngkit/logging.hpp>

#include <exception>

namespace qrngkit {

Bitstring BitBuffer::request(std::size_t n) {
    if (n == 0) {
        return {};
    }

    while (buffered() < n) {
        pull(n - buffered());
    }

    Bitstring out = pending_.slice(head_, n);
    head_ += n;
    total_delivered_ += n;
    compact();
    return out;
}

void BitBuffer::pull(std::size_t missing) {
    Bitstring chunk;
    try {
        chunk = source_.produce_raw_bits(missing);
    } catch (const QrngException& e) {
        logger().error("raw source failed: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        logger().error("raw source failed: {}", e.what());
        throw SourceUnavailableException(std::string("raw source failed: ") + e.what());
    }

    if (chunk.empty()) {
        logger().error("raw source returned no bits for a request of {}", missing);
        throw SourceUnavailableException("raw source returned no bits");
    }

    logger().trace("pulled {} raw bits (wanted {})", chunk.size(), missing);
    pending_.append(chunk);
    total_received_ += chunk.size();
}

void BitBuffer::compact() {
    // Drop the consumed prefix once it dominates the queue
    if (head_ == 0 || head_ < pending_.size() / 2) {
        return;
    }
    pending_ = pending_.slice(head_, pending_.size() - head_);
    head_ = 0;
}

} // namespace qrngkit
