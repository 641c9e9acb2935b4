/**
 * @file qrngkit.hpp
 * @brief Umbrella header for the qrngkit core library.
 *
 * Pulls in the extraction pipeline (source, buffer, extractor), the
 * statistical battery, trial aggregation and avalanche analysis. The
 * OpenSSL-backed pieces (aes_cbc.hpp, keygen.hpp) live in the separate
 * qrngkit_crypto library and are included on their own.
 */

#ifndef QRNGKIT_HPP
#define QRNGKIT_HPP

#include "avalanche.hpp"
#include "bitbuffer.hpp"
#include "bitstring.hpp"
#include "cipher.hpp"
#include "config.hpp"
#include "error.hpp"
#include "extractor.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "numbers.hpp"
#include "source.hpp"
#include "statistics.hpp"
#include "trials.hpp"

namespace qrngkit {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace qrngkit

#endif // QRNGKIT_HPP
