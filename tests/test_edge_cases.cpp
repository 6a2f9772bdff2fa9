/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests across flower modules.
 *
 * Tests word and chunk boundaries, error reporting and corner cases.
 */

#include <catch2/catch_test_macros.hpp>
#include <flower/flower.hpp>

#include <cstring>
#include <string>
#include <vector>

using namespace flower;

// ============================================================================
// Word Boundary Edge Cases
// ============================================================================

TEST_CASE("Word boundary edge cases", "[edge][bitarray]") {
    BitArray::Handle array;
    REQUIRE(BitArray::create(129, array) == Error::Ok);

    SECTION("minimum size (1 bit)") {
        BitArray::Handle tiny;
        REQUIRE(BitArray::create(1, tiny) == Error::Ok);
        REQUIRE(tiny->bit_length() == 64);
        REQUIRE(tiny->put(0, true) == Error::Ok);
        REQUIRE(tiny->count_ones() == 1);
    }

    SECTION("bits around word edges") {
        for (std::size_t i : {63U, 64U, 127U, 128U}) {
            REQUIRE(array->put(i, true) == Error::Ok);
        }
        REQUIRE(array->count_ones() == 4);

        auto words = array->lock();
        REQUIRE(words[0] == (word_t{1} << 63));
        REQUIRE(words[1] == ((word_t{1} << 63) | 1U));
        REQUIRE(words[2] == 1U);
    }

    SECTION("merge straddling a word edge") {
        const std::vector<std::uint8_t> bytes = {0xF0, 0x0F};
        std::size_t next = 0;
        REQUIRE(merge_chunk(*array, bytes.data(), bytes.size(), 7, next) == Error::Ok);
        REQUIRE(array->get_unchecked(60));
        REQUIRE(array->get_unchecked(63));
        REQUIRE_FALSE(array->get_unchecked(59));
        REQUIRE(array->get_unchecked(64));
        REQUIRE(array->get_unchecked(67));
        REQUIRE_FALSE(array->get_unchecked(68));
    }
}

// ============================================================================
// Chunk Boundary Edge Cases
// ============================================================================

TEST_CASE("Chunk boundary edge cases", "[edge][chunked]") {
    SECTION("one word short of a chunk") {
        BitArray::Handle array;
        REQUIRE(BitArray::create((CHUNK_WORDS - 1) * 64, array) == Error::Ok);
        Cursor next;
        std::vector<std::uint8_t> bytes;
        REQUIRE(serialize_chunk(*array, 0, next, bytes) == Error::Ok);
        REQUIRE(next.is_eof());
        REQUIRE(bytes.size() == (CHUNK_WORDS - 1) * 8);
    }

    SECTION("exactly two chunks") {
        BitArray::Handle array;
        REQUIRE(BitArray::create(CHUNK_WORDS * 64 * 2, array) == Error::Ok);
        Cursor next;
        std::vector<std::uint8_t> bytes;
        REQUIRE(serialize_chunk(*array, 0, next, bytes) == Error::Ok);
        REQUIRE(next == Cursor::next(1));
        REQUIRE(serialize_chunk(*array, 1, next, bytes) == Error::Ok);
        REQUIRE(next.is_eof());
        REQUIRE(bytes.size() == CHUNK_BYTES);
    }

    SECTION("merge spanning two chunks") {
        BitArray::Handle array;
        REQUIRE(BitArray::create(CHUNK_WORDS * 64 * 2, array) == Error::Ok);
        const std::vector<std::uint8_t> bytes(16, 0xFF);
        std::size_t next = 0;
        REQUIRE(merge_chunk(*array, bytes.data(), bytes.size(), CHUNK_BYTES - 8, next) ==
                Error::Ok);

        std::size_t first = 0;
        std::size_t second = 0;
        Cursor cursor;
        REQUIRE(count_ones_chunk(*array, 0, cursor, first) == Error::Ok);
        REQUIRE(count_ones_chunk(*array, 1, cursor, second) == Error::Ok);
        REQUIRE(first == 64);
        REQUIRE(second == 64);
    }

    SECTION("restarting a scan is allowed") {
        BitArray::Handle array;
        REQUIRE(BitArray::create(CHUNK_WORDS * 64 * 3, array) == Error::Ok);
        std::size_t partial = 0;
        Cursor next;
        REQUIRE(count_ones_chunk(*array, 2, next, partial) == Error::Ok);
        REQUIRE(next.is_eof());
        REQUIRE(count_ones_chunk(*array, 0, next, partial) == Error::Ok);
        REQUIRE(next == Cursor::next(1));
    }
}

// ============================================================================
// Error Reporting
// ============================================================================

TEST_CASE("Error strings", "[edge][error]") {
    REQUIRE(std::strcmp(error_string(Error::Ok), "Success") == 0);
    REQUIRE(std::strcmp(error_string(Error::AllocationError), "Allocation failed") == 0);
    REQUIRE(std::strcmp(error_string(Error::IndexOutOfRange), "Index out of range") == 0);
    REQUIRE(std::strcmp(error_string(Error::InvalidData), "Invalid or corrupted data") == 0);
    REQUIRE(std::strcmp(error_string(Error::InvalidArg), "Invalid argument") == 0);
}

#if !FLOWER_NO_EXCEPTIONS
TEST_CASE("throw_if_error", "[edge][error]") {
    SECTION("Ok does not throw") {
        REQUIRE_NOTHROW(throw_if_error(Error::Ok, "ctx"));
    }

    SECTION("codes map to exception types") {
        REQUIRE_THROWS_AS(throw_if_error(Error::IndexOutOfRange, "ctx"), IndexOutOfRangeException);
        REQUIRE_THROWS_AS(throw_if_error(Error::AllocationError, "ctx"), AllocationException);
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidData, "ctx"), InvalidDataException);
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidArg, "ctx"), InvalidArgumentException);
    }

    SECTION("exception carries code and context") {
        try {
            throw_if_error(Error::IndexOutOfRange, "put");
            FAIL("expected an exception");
        } catch (const FlowerException& e) {
            REQUIRE(e.code() == Error::IndexOutOfRange);
            REQUIRE(std::string(e.what()) == "put: Index out of range");
        }
    }
}
#endif

TEST_CASE("Library version", "[edge]") {
    REQUIRE(std::strcmp(version(), "1.0.0") == 0);
    REQUIRE(VERSION_MAJOR == 1);
}
