/**
 * @file bitstring.cpp
 * @brief Bitstring storage and conversion routines.
 */

#include <qrngkit/bitstring.hpp>
#include <qrngkit/error.hpp>

namespace qrngkit {

namespace {

constexpr std::size_t words_for(std::size_t num_bits) noexcept {
    return (num_bits + 31U) / 32U;
}

} // namespace

Bitstring::Bitstring(std::size_t num_bits, int value)
    : words_(words_for(num_bits), value ? ~word_t{0} : word_t{0}), num_bits_(num_bits) {
    // Keep bits past the end at zero
    std::size_t extra_bits = words_.size() * 32U - num_bits_;
    if (value && extra_bits > 0) {
        words_.back() &= ~((1U << extra_bits) - 1U);
    }
}

Bitstring Bitstring::from_string(std::string_view text) {
    Bitstring bits;
    bits.reserve(text.size());
    for (char c : text) {
        if (c == '0') {
            bits.append(0);
        } else if (c == '1') {
            bits.append(1);
        } else {
            throw InvalidParameterException(std::string("not a binary digit: '") + c + "'");
        }
    }
    return bits;
}

Bitstring Bitstring::from_bytes(const std::vector<std::uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size() * 8U);
}

Bitstring Bitstring::from_bytes(const std::uint8_t* bytes, std::size_t num_bits) {
    Bitstring bits;
    bits.words_.assign(words_for(num_bits), 0);
    bits.num_bits_ = num_bits;

    std::size_t num_bytes = (num_bits + 7U) / 8U;
    for (std::size_t i = 0; i < num_bytes; ++i) {
        std::size_t word_idx = i >> 2;
        std::size_t byte_in_word = 3U - (i & 3U);
        bits.words_[word_idx] |= static_cast<word_t>(bytes[i]) << (byte_in_word * 8U);
    }

    // Drop trailing bits of a partial final byte
    std::size_t extra_bits = bits.words_.size() * 32U - num_bits;
    if (extra_bits > 0) {
        bits.words_.back() &= ~((1U << extra_bits) - 1U);
    }
    return bits;
}

int Bitstring::get_bit(std::size_t pos) const {
    if (pos >= num_bits_) [[unlikely]] {
        throw InvalidParameterException("bit index " + std::to_string(pos) +
                                        " out of range for length " +
                                        std::to_string(num_bits_));
    }
    return get_bit_unchecked(pos);
}

void Bitstring::append(int bit) {
    std::size_t bit_in_word = num_bits_ & 31U;
    if (bit_in_word == 0) {
        words_.push_back(0);
    }
    if (bit) {
        words_.back() |= 1U << (31U - bit_in_word);
    }
    ++num_bits_;
}

void Bitstring::append(const Bitstring& other) {
    if (other.num_bits_ == 0) {
        return;
    }
    if (&other == this) {
        // The loops below read other.words_ while growing words_
        Bitstring copy = other;
        append(copy);
        return;
    }

    std::size_t shift = num_bits_ & 31U;
    if (shift == 0) {
        // Word-aligned: straight copy
        words_.insert(words_.end(), other.words_.begin(), other.words_.end());
        num_bits_ += other.num_bits_;
        return;
    }

    // Unaligned: split every source word across two destination words
    for (word_t word : other.words_) {
        words_.back() |= word >> shift;
        words_.push_back(word << (32U - shift));
    }
    num_bits_ += other.num_bits_;
    words_.resize(words_for(num_bits_));
}

void Bitstring::reserve(std::size_t num_bits) {
    words_.reserve(words_for(num_bits));
}

Bitstring Bitstring::slice(std::size_t pos, std::size_t len) const {
    if (pos > num_bits_ || len > num_bits_ - pos) {
        throw InvalidParameterException("slice [" + std::to_string(pos) + ", +" +
                                        std::to_string(len) + ") exceeds length " +
                                        std::to_string(num_bits_));
    }

    Bitstring out;
    out.words_.assign(words_for(len), 0);
    out.num_bits_ = len;
    if (len == 0) {
        return out;
    }

    std::size_t first_word = pos >> 5;
    std::size_t shift = pos & 31U;
    for (std::size_t i = 0; i < out.words_.size(); ++i) {
        word_t hi = words_[first_word + i] << shift;
        word_t lo = 0;
        if (shift != 0 && first_word + i + 1 < words_.size()) {
            lo = words_[first_word + i + 1] >> (32U - shift);
        }
        out.words_[i] = hi | lo;
    }

    std::size_t extra_bits = out.words_.size() * 32U - len;
    if (extra_bits > 0) {
        out.words_.back() &= ~((1U << extra_bits) - 1U);
    }
    return out;
}

std::size_t Bitstring::count_ones() const noexcept {
    // Unused tail bits are zero, so whole-word popcount is exact
    std::size_t count = 0;
    for (word_t word : words_) {
        count += static_cast<std::size_t>(__builtin_popcount(word));
    }
    return count;
}

std::string Bitstring::to_string() const {
    std::string text;
    text.reserve(num_bits_);
    for (std::size_t i = 0; i < num_bits_; ++i) {
        text.push_back(get_bit_unchecked(i) ? '1' : '0');
    }
    return text;
}

std::vector<std::uint8_t> Bitstring::to_bytes() const {
    std::size_t num_bytes = (num_bits_ + 7U) / 8U;
    std::vector<std::uint8_t> bytes(num_bytes);

    for (std::size_t i = 0; i < num_bytes; ++i) {
        word_t word = words_[i >> 2];
        std::size_t byte_in_word = 3U - (i & 3U);
        bytes[i] = static_cast<std::uint8_t>((word >> (byte_in_word * 8U)) & 0xFFU);
    }
    return bytes;
}

std::size_t hamming_distance(const Bitstring& a, const Bitstring& b) noexcept {
    std::size_t common = a.size() < b.size() ? a.size() : b.size();
    std::size_t full_words = common >> 5;
    std::size_t count = 0;

    for (std::size_t i = 0; i < full_words; ++i) {
        count += static_cast<std::size_t>(__builtin_popcount(a.data()[i] ^ b.data()[i]));
    }

    std::size_t tail = common & 31U;
    if (tail > 0) {
        word_t mask = ~((1U << (32U - tail)) - 1U);
        word_t diff = (a.data()[full_words] ^ b.data()[full_words]) & mask;
        count += static_cast<std::size_t>(__builtin_popcount(diff));
    }
    return count;
}

} // namespace qrngkit
