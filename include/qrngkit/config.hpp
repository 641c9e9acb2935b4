/**
 * @file config.hpp
 * @brief qrngkit compile-time configuration.
 *
 * Every default below can be overridden on the compiler command line with
 * the matching QRNGKIT_* macro. Runtime parameters live in the plain structs
 * at the bottom of this file and are passed into the objects that use them.
 */

#ifndef QRNGKIT_CONFIG_HPP
#define QRNGKIT_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace qrngkit {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Raw bits delivered per measurement shot (one shot = one register readout)
#ifndef QRNGKIT_SHOT_WIDTH
#define QRNGKIT_SHOT_WIDTH 8U
#endif

/// Starting yield estimate of the fixed-length extractor
#ifndef QRNGKIT_INITIAL_EFFICIENCY
#define QRNGKIT_INITIAL_EFFICIENCY 0.30
#endif

/// Upper bound on adaptive extraction rounds before giving up
#ifndef QRNGKIT_MAX_ITERATIONS
#define QRNGKIT_MAX_ITERATIONS 10000U
#endif

/// Raw bits one fixed-length call may consume, per requested output bit
#ifndef QRNGKIT_MAX_RAW_FACTOR
#define QRNGKIT_MAX_RAW_FACTOR 10000U
#endif

inline constexpr std::size_t SHOT_WIDTH = QRNGKIT_SHOT_WIDTH;

inline constexpr double DEFAULT_INITIAL_EFFICIENCY = QRNGKIT_INITIAL_EFFICIENCY;
inline constexpr double DEFAULT_PRIOR_WEIGHT = 0.7;
inline constexpr double DEFAULT_EFFICIENCY_FLOOR = 0.01;
inline constexpr std::size_t DEFAULT_SAFETY_MARGIN = SHOT_WIDTH * 4U;
inline constexpr std::size_t DEFAULT_MAX_ITERATIONS = QRNGKIT_MAX_ITERATIONS;
inline constexpr std::size_t DEFAULT_MAX_RAW_FACTOR = QRNGKIT_MAX_RAW_FACTOR;

/// NIST SP 800-22 significance level
inline constexpr double SIGNIFICANCE_LEVEL = 0.01;

/// Chi-square critical value, df = 1, alpha = 0.05
inline constexpr double CHI_SQUARE_CRITICAL = 3.841;

inline constexpr double ENTROPY_PASS_THRESHOLD = 0.99;
inline constexpr std::size_t DEFAULT_BLOCK_SIZE = 128U;
inline constexpr std::size_t DEFAULT_APEN_BLOCK_LENGTH = 2U;

/// Largest pattern length the approximate entropy test will tabulate
inline constexpr std::size_t MAX_APEN_BLOCK_LENGTH = 20U;

inline constexpr std::size_t DEFAULT_AVALANCHE_TRIALS = 5U;

/// Seed of the deterministic classical key baseline
inline constexpr std::uint64_t CLASSICAL_FIXED_SEED = 42U;
inline constexpr std::size_t DEFAULT_IV_BYTES = 16U;

/// Two-sided 95% normal quantile
inline constexpr double CONFIDENCE_Z = 1.96;

/// 32-bit word type for bitstring storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;

/** @} */

/**
 * @brief Tuning of the adaptive fixed-length extractor.
 */
struct ExtractorConfig {
    double initial_efficiency = DEFAULT_INITIAL_EFFICIENCY; ///< Yield guess before any data
    double prior_weight = DEFAULT_PRIOR_WEIGHT;             ///< Weight of the old estimate
    double efficiency_floor = DEFAULT_EFFICIENCY_FLOOR;     ///< Estimate never drops below this
    std::size_t safety_margin = DEFAULT_SAFETY_MARGIN;      ///< Extra raw bits per request
    std::size_t max_iterations = DEFAULT_MAX_ITERATIONS;    ///< Rounds before ExtractionStalled
    std::size_t max_raw_factor = DEFAULT_MAX_RAW_FACTOR;    ///< Raw budget is factor * n + margin
};

/**
 * @brief Parameters of the statistical test battery.
 */
struct SuiteConfig {
    std::size_t block_size = DEFAULT_BLOCK_SIZE;
    std::size_t apen_block_length = DEFAULT_APEN_BLOCK_LENGTH;
    double entropy_threshold = ENTROPY_PASS_THRESHOLD;
};

} // namespace qrngkit

#endif // QRNGKIT_CONFIG_HPP
