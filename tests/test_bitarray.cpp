/**
 * @file test_bitarray.cpp
 * @brief Unit tests for BitArray storage and point access.
 */

#include <flower/bitarray.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <vector>

using namespace flower;

static BitArray::Handle make_array(std::size_t length) {
    BitArray::Handle array;
    REQUIRE(BitArray::create(length, array) == Error::Ok);
    REQUIRE(array != nullptr);
    return array;
}

TEST_CASE("BitArray construction", "[bitarray]") {
    SECTION("length rounds up to whole words") {
        const std::vector<std::size_t> lengths = {0, 1, 63, 64, 65, 100, 127, 128, 129, 1000, 65536};
        for (std::size_t n : lengths) {
            auto array = make_array(n);
            REQUIRE(array->bit_length() == 64 * ((n + 63) / 64));
            REQUIRE(array->num_words() == (n + 63) / 64);
            REQUIRE(array->byte_length() == array->num_words() * 8);
        }
    }

    SECTION("100 bits gives two words") {
        auto array = make_array(100);
        REQUIRE(array->num_words() == 2);
        REQUIRE(array->bit_length() == 128);
    }

    SECTION("oversized length reports allocation failure") {
        BitArray::Handle array;
        REQUIRE(BitArray::create(std::numeric_limits<std::size_t>::max(), array) ==
                Error::AllocationError);
        REQUIRE(array == nullptr);
    }

    SECTION("zero length is empty") {
        auto array = make_array(0);
        REQUIRE(array->bit_length() == 0);
        REQUIRE(array->count_ones() == 0);
    }

    SECTION("initial state is zero") {
        auto array = make_array(200);
        for (std::size_t i = 0; i < array->bit_length(); ++i) {
            bool value = true;
            REQUIRE(array->get(i, value) == Error::Ok);
            REQUIRE_FALSE(value);
        }
        REQUIRE(array->count_ones() == 0);
    }
}

TEST_CASE("BitArray bit access", "[bitarray]") {
    auto array = make_array(256);

    SECTION("set and get individual bits") {
        for (std::size_t i : {0U, 1U, 63U, 64U, 127U, 200U, 255U}) {
            REQUIRE(array->put(i, true) == Error::Ok);
            bool value = false;
            REQUIRE(array->get(i, value) == Error::Ok);
            REQUIRE(value);
        }
    }

    SECTION("clear bits") {
        REQUIRE(array->put(70, true) == Error::Ok);
        REQUIRE(array->put(70, false) == Error::Ok);
        bool value = true;
        REQUIRE(array->get(70, value) == Error::Ok);
        REQUIRE_FALSE(value);
    }

    SECTION("single put leaves other bits alone") {
        REQUIRE(array->put(130, true) == Error::Ok);
        for (std::size_t i = 0; i < array->bit_length(); ++i) {
            REQUIRE(array->get_unchecked(i) == (i == 130));
        }

        REQUIRE(array->put(130, false) == Error::Ok);
        for (std::size_t i = 0; i < array->bit_length(); ++i) {
            REQUIRE_FALSE(array->get_unchecked(i));
        }
    }

    SECTION("LSB-first within a word") {
        REQUIRE(array->put(64, true) == Error::Ok);
        REQUIRE(array->put(66, true) == Error::Ok);
        auto words = static_cast<const BitArray&>(*array).lock();
        REQUIRE(words[0] == 0U);
        REQUIRE(words[1] == 0x5U);
    }

    SECTION("most significant bit of a word") {
        REQUIRE(array->put(63, true) == Error::Ok);
        auto words = array->lock();
        REQUIRE(words[0] == (word_t{1} << 63));
    }

    SECTION("unchecked access matches checked access") {
        array->put_unchecked(17, true);
        bool value = false;
        REQUIRE(array->get(17, value) == Error::Ok);
        REQUIRE(value);
        array->put_unchecked(17, false);
        REQUIRE_FALSE(array->get_unchecked(17));
    }
}

TEST_CASE("BitArray padding bits", "[bitarray]") {
    // 100 requested bits, 28 padding bits in the second word
    auto array = make_array(100);

    SECTION("padding bits are writable") {
        REQUIRE(array->put(127, true) == Error::Ok);
        bool value = false;
        REQUIRE(array->get(127, value) == Error::Ok);
        REQUIRE(value);
    }

    SECTION("padding bits are counted") {
        REQUIRE(array->put(99, true) == Error::Ok);
        REQUIRE(array->put(100, true) == Error::Ok);
        REQUIRE(array->put(127, true) == Error::Ok);
        REQUIRE(array->count_ones() == 3);
    }
}

TEST_CASE("BitArray bounds checking", "[bitarray]") {
    auto array = make_array(100);

    SECTION("get past the end") {
        bool value = true;
        REQUIRE(array->get(128, value) == Error::IndexOutOfRange);
        REQUIRE(value); // untouched
        REQUIRE(array->get(static_cast<std::size_t>(-1), value) == Error::IndexOutOfRange);
    }

    SECTION("put past the end leaves the array unchanged") {
        REQUIRE(array->put(128, true) == Error::IndexOutOfRange);
        REQUIRE(array->put(1U << 20, true) == Error::IndexOutOfRange);
        REQUIRE(array->count_ones() == 0);
    }

    SECTION("empty array rejects every index") {
        auto empty = make_array(0);
        bool value = false;
        REQUIRE(empty->get(0, value) == Error::IndexOutOfRange);
        REQUIRE(empty->put(0, true) == Error::IndexOutOfRange);
    }
}

TEST_CASE("BitArray count_ones", "[bitarray]") {
    auto array = make_array(1000);

    SECTION("counts distinct set bits") {
        const std::vector<std::size_t> indices = {0, 5, 63, 64, 500, 999, 1023};
        for (std::size_t i : indices) {
            REQUIRE(array->put(i, true) == Error::Ok);
        }
        REQUIRE(array->count_ones() == indices.size());
    }

    SECTION("setting a bit twice counts once") {
        REQUIRE(array->put(42, true) == Error::Ok);
        REQUIRE(array->put(42, true) == Error::Ok);
        REQUIRE(array->count_ones() == 1);
    }

    SECTION("all bits set") {
        for (std::size_t i = 0; i < array->bit_length(); ++i) {
            array->put_unchecked(i, true);
        }
        REQUIRE(array->count_ones() == array->bit_length());
    }
}

TEST_CASE("BitArray 100-bit scenario", "[bitarray]") {
    auto array = make_array(100);
    REQUIRE(array->put(99, true) == Error::Ok);

    bool value = false;
    REQUIRE(array->get(99, value) == Error::Ok);
    REQUIRE(value);
    REQUIRE(array->count_ones() == 1);
    REQUIRE(array->bit_length() == 128);
}

TEST_CASE("BitArray shared ownership", "[bitarray]") {
    auto array = make_array(64);
    BitArray::Handle other = array;
    REQUIRE(array.use_count() == 2);

    REQUIRE(other->put(3, true) == Error::Ok);
    REQUIRE(array->get_unchecked(3));

    other.reset();
    REQUIRE(array.use_count() == 1);
    REQUIRE(array->count_ones() == 1);
}
