/**
 * @file test_bitstring.cpp
 * @brief Unit tests for Bitstring class.
 */

#include <qrngkit/bitstring.hpp>
#include <qrngkit/error.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace qrngkit;

TEST_CASE("Bitstring construction", "[bitstring]") {
    SECTION("default construction is empty") {
        Bitstring bits;
        REQUIRE(bits.size() == 0);
        REQUIRE(bits.empty());
        REQUIRE(bits.num_words() == 0);
    }

    SECTION("sized construction is zero-filled") {
        Bitstring bits(64);
        REQUIRE(bits.size() == 64);
        REQUIRE(bits.num_words() == 2);
        for (std::size_t i = 0; i < 64; ++i) {
            REQUIRE(bits.get_bit(i) == 0);
        }
    }

    SECTION("sized construction with ones keeps tail clear") {
        Bitstring bits(40, 1);
        REQUIRE(bits.size() == 40);
        REQUIRE(bits.num_words() == 2); // ceil(40/32) = 2
        REQUIRE(bits.count_ones() == 40);
        REQUIRE(bits.count_zeros() == 0);
    }
}

TEST_CASE("Bitstring from_string", "[bitstring]") {
    SECTION("bit order is first character first") {
        Bitstring bits = Bitstring::from_string("1011");
        REQUIRE(bits.size() == 4);
        REQUIRE(bits[0] == 1);
        REQUIRE(bits[1] == 0);
        REQUIRE(bits[2] == 1);
        REQUIRE(bits[3] == 1);
        REQUIRE(bits.to_string() == "1011");
    }

    SECTION("empty string") {
        REQUIRE(Bitstring::from_string("").empty());
    }

    SECTION("rejects non-binary characters") {
        REQUIRE_THROWS_AS(Bitstring::from_string("01x1"), InvalidParameterException);
        REQUIRE_THROWS_AS(Bitstring::from_string("0 1"), InvalidParameterException);
    }
}

TEST_CASE("Bitstring bit access", "[bitstring]") {
    Bitstring bits = Bitstring::from_string("10000000000000000000000000000001" "1");

    SECTION("multi-word bit access") {
        REQUIRE(bits.get_bit(0) == 1);
        REQUIRE(bits.get_bit(1) == 0);
        REQUIRE(bits.get_bit(31) == 1);
        REQUIRE(bits.get_bit(32) == 1);
    }

    SECTION("checked access past the end throws") {
        REQUIRE_THROWS_AS(bits.get_bit(33), InvalidParameterException);
    }
}

TEST_CASE("Bitstring append", "[bitstring]") {
    SECTION("append single bits across a word boundary") {
        Bitstring bits;
        for (int i = 0; i < 40; ++i) {
            bits.append(i % 3 == 0 ? 1 : 0);
        }
        REQUIRE(bits.size() == 40);
        for (std::size_t i = 0; i < 40; ++i) {
            REQUIRE(bits[i] == (i % 3 == 0 ? 1 : 0));
        }
    }

    SECTION("non-zero values count as one") {
        Bitstring bits;
        bits.append(7);
        REQUIRE(bits.to_string() == "1");
    }

    SECTION("append word-aligned bitstring") {
        Bitstring a(32, 1);
        Bitstring b = Bitstring::from_string("0101");
        a.append(b);
        REQUIRE(a.size() == 36);
        REQUIRE(a.slice(32, 4).to_string() == "0101");
        REQUIRE(a.count_ones() == 34);
    }

    SECTION("append unaligned bitstring") {
        Bitstring a = Bitstring::from_string("101");
        Bitstring b = Bitstring::from_string("1100110011001100110011001100110011");
        a.append(b);
        REQUIRE(a.to_string() == "101" "1100110011001100110011001100110011");
        REQUIRE(a.num_words() == 2);
    }

    SECTION("append empty bitstring is a no-op") {
        Bitstring a = Bitstring::from_string("11");
        a.append(Bitstring());
        REQUIRE(a.to_string() == "11");
    }

    SECTION("append to itself, unaligned") {
        Bitstring a = Bitstring::from_string("0");
        a.append(Bitstring(1000, 1));
        a.append(a);
        REQUIRE(a.size() == 2002);
        REQUIRE(a.count_ones() == 2000);
        REQUIRE(a[0] == 0);
        REQUIRE(a[1001] == 0);
        REQUIRE(a.slice(1001, 1001) == a.slice(0, 1001));
    }

    SECTION("append to itself, word-aligned") {
        Bitstring a = Bitstring::from_string("10110011100011110000111110000011");
        Bitstring expected = a;
        expected.append(Bitstring(a));
        a.append(a);
        REQUIRE(a == expected);
        REQUIRE(a.size() == 64);
    }
}

TEST_CASE("Bitstring slice", "[bitstring]") {
    Bitstring bits = Bitstring::from_string("0011010111100010101100001111000011");

    SECTION("unaligned slice") {
        REQUIRE(bits.slice(3, 7).to_string() == "1010111");
    }

    SECTION("slice crossing a word boundary") {
        REQUIRE(bits.slice(28, 6).to_string() == "000011");
    }

    SECTION("zero-length slice at the end") {
        REQUIRE(bits.slice(bits.size(), 0).empty());
    }

    SECTION("slice out of range throws") {
        REQUIRE_THROWS_AS(bits.slice(30, 10), InvalidParameterException);
        REQUIRE_THROWS_AS(bits.slice(40, 0), InvalidParameterException);
    }

    SECTION("slice keeps tail bits clear") {
        Bitstring tail = bits.slice(0, 5);
        REQUIRE(tail.count_ones() == 2);
        REQUIRE(tail == Bitstring::from_string("00110"));
    }
}

TEST_CASE("Bitstring byte conversion", "[bitstring]") {
    SECTION("bytes are big-endian, MSB first") {
        Bitstring bits = Bitstring::from_bytes(std::vector<std::uint8_t>{0xA5, 0x0F});
        REQUIRE(bits.size() == 16);
        REQUIRE(bits.to_string() == "1010010100001111");
    }

    SECTION("partial final byte") {
        std::uint8_t data[] = {0xFF, 0xFF};
        Bitstring bits = Bitstring::from_bytes(data, 12);
        REQUIRE(bits.size() == 12);
        REQUIRE(bits.count_ones() == 12);

        auto bytes = bits.to_bytes();
        REQUIRE(bytes.size() == 2);
        REQUIRE(bytes[0] == 0xFF);
        REQUIRE(bytes[1] == 0xF0); // padded with zeros
    }

    SECTION("five bytes span two words") {
        std::vector<std::uint8_t> data = {0x12, 0x34, 0x56, 0x78, 0x9A};
        REQUIRE(Bitstring::from_bytes(data).to_bytes() == data);
    }
}

TEST_CASE("Bitstring equality", "[bitstring]") {
    REQUIRE(Bitstring::from_string("0110") == Bitstring::from_string("0110"));
    REQUIRE(Bitstring::from_string("0110") != Bitstring::from_string("0111"));
    REQUIRE(Bitstring::from_string("0110") != Bitstring::from_string("01100"));
}

TEST_CASE("Hamming distance", "[bitstring]") {
    SECTION("identical strings") {
        Bitstring a = Bitstring::from_string("110010");
        REQUIRE(hamming_distance(a, a) == 0);
    }

    SECTION("counts differing positions") {
        Bitstring a = Bitstring::from_string("110010");
        Bitstring b = Bitstring::from_string("011011");
        REQUIRE(hamming_distance(a, b) == 3);
    }

    SECTION("only the common prefix is compared") {
        Bitstring a(40, 1);
        Bitstring b(35);
        REQUIRE(hamming_distance(a, b) == 35);
        REQUIRE(hamming_distance(b, a) == 35);
    }
}
