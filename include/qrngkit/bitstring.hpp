/**
 * @file bitstring.hpp
 * @brief Variable-length bit sequence with word-packed storage.
 *
 * Bitstring is the value type passed between every stage of the pipeline:
 * raw source output, debiased output and test input. Storage uses 32-bit
 * words with big-endian packing so that byte conversion is a straight copy.
 *
 * @par Bit Numbering
 * - Bit 0 = MSB of word 0 (first bit produced)
 * - Bit size()-1 = last bit produced
 *
 * Bits beyond size() in the last word are always kept at zero.
 */

#ifndef QRNGKIT_BITSTRING_HPP
#define QRNGKIT_BITSTRING_HPP

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace qrngkit {

/**
 * @brief Ordered sequence of binary symbols.
 */
class Bitstring {
public:
    /**
     * @brief Construct an empty bitstring.
     */
    Bitstring() noexcept : num_bits_(0) {}

    /**
     * @brief Construct a bitstring of @p num_bits copies of @p value.
     */
    explicit Bitstring(std::size_t num_bits, int value = 0);

    /**
     * @brief Parse a text of '0' and '1' characters.
     *
     * @throws InvalidParameterException on any other character
     */
    static Bitstring from_string(std::string_view text);

    /**
     * @brief Load bits from bytes, MSB first.
     *
     * @param bytes Source bytes
     * @param num_bits Number of bits to take (defaults to all of them)
     */
    static Bitstring from_bytes(const std::vector<std::uint8_t>& bytes);
    static Bitstring from_bytes(const std::uint8_t* bytes, std::size_t num_bits);

    /**
     * @brief Get the number of bits.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return num_bits_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return num_bits_ == 0;
    }

    /**
     * @brief Get bit value at position.
     *
     * @param pos Bit position (0 = first)
     * @return Bit value (0 or 1)
     * @throws InvalidParameterException if pos >= size()
     */
    [[nodiscard]] int get_bit(std::size_t pos) const;

    /**
     * @brief Get bit value at position without bounds checking.
     *
     * @warning Caller must ensure pos < size().
     */
    [[nodiscard]] inline int get_bit_unchecked(std::size_t pos) const noexcept {
        std::size_t word_idx = pos >> 5;
        std::size_t bit_in_word = 31U - (pos & 31U);
        return static_cast<int>((words_[word_idx] >> bit_in_word) & 1U);
    }

    [[nodiscard]] int operator[](std::size_t pos) const noexcept {
        return get_bit_unchecked(pos);
    }

    /**
     * @brief Append a single bit.
     * @param bit Bit value (non-zero counts as 1)
     */
    void append(int bit);

    /**
     * @brief Append all bits of another bitstring.
     */
    void append(const Bitstring& other);

    /**
     * @brief Reserve storage for @p num_bits bits.
     */
    void reserve(std::size_t num_bits);

    /**
     * @brief Copy out a contiguous range.
     *
     * @param pos First bit
     * @param len Number of bits
     * @throws InvalidParameterException if the range exceeds size()
     */
    [[nodiscard]] Bitstring slice(std::size_t pos, std::size_t len) const;

    /**
     * @brief Count number of set bits (Hamming weight).
     */
    [[nodiscard]] std::size_t count_ones() const noexcept;

    [[nodiscard]] std::size_t count_zeros() const noexcept {
        return num_bits_ - count_ones();
    }

    /**
     * @brief Render as a text of '0' and '1'.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Store to bytes (big-endian), zero-padding the final byte.
     */
    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    [[nodiscard]] bool operator==(const Bitstring& other) const noexcept {
        return num_bits_ == other.num_bits_ && words_ == other.words_;
    }

    [[nodiscard]] bool operator!=(const Bitstring& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Get raw word storage (for word-at-a-time consumers).
     */
    [[nodiscard]] const word_t* data() const noexcept {
        return words_.data();
    }

    [[nodiscard]] std::size_t num_words() const noexcept {
        return words_.size();
    }

private:
    std::vector<word_t> words_;
    std::size_t num_bits_;
};

/**
 * @brief Count positions where two bitstrings differ.
 *
 * Only the common prefix (min of both sizes) is compared.
 */
[[nodiscard]] std::size_t hamming_distance(const Bitstring& a, const Bitstring& b) noexcept;

} // namespace qrngkit

#endif // QRNGKIT_BITSTRING_HPP
