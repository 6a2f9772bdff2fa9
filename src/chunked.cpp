/**
 * @file chunked.cpp
 * @brief Chunk serialization, OR-merge and chunked population count.
 */

#include <flower/chunked.hpp>

#include <new>
#include <stdexcept>
#include <utility>

namespace flower {

ChunkRange chunk_range(std::size_t num_words, std::size_t chunk_num) noexcept {
    ChunkRange range;

    // chunk_num * CHUNK_WORDS cannot overflow once it is known to be <= num_words
    if (chunk_num > num_words / CHUNK_WORDS) {
        range.offset = num_words;
        range.size = 0;
        range.is_last = true;
        return range;
    }

    range.offset = chunk_num * CHUNK_WORDS;
    const std::size_t remaining = num_words - range.offset;
    range.size = (remaining < CHUNK_WORDS) ? remaining : CHUNK_WORDS;
    range.is_last = remaining <= CHUNK_WORDS;
    return range;
}

Error serialize_chunk(const BitArray& array, std::size_t chunk_num, Cursor& next,
                      std::vector<std::uint8_t>& bytes) noexcept {
    const ChunkRange range = chunk_range(array.num_words(), chunk_num);

    // Allocate before taking the lock; nothing is written on failure
    std::vector<std::uint8_t> out;
    try {
        out.resize(range.size * BYTES_PER_WORD);
    } catch (const std::bad_alloc&) {
        return Error::AllocationError;
    } catch (const std::length_error&) {
        return Error::AllocationError;
    }

    {
        const ConstWordView words = array.lock();
        std::uint8_t* dst = out.data();
        for (std::size_t x = 0; x < range.size; ++x) {
            const word_t word = words[range.offset + x];
            for (std::size_t y = 0; y < BYTES_PER_WORD; ++y) {
                *dst++ = static_cast<std::uint8_t>(word >> (y * 8U));
            }
        }
    }

    bytes = std::move(out);
    next = cursor_after(range, chunk_num);
    return Error::Ok;
}

Error merge_chunk(BitArray& array, const std::uint8_t* bytes, std::size_t size,
                  std::size_t byte_offset, std::size_t& next_offset) noexcept {
    const std::size_t capacity = array.byte_length();
    if (byte_offset > capacity || size > capacity - byte_offset) {
        return Error::IndexOutOfRange;
    }

    {
        const WordView words = array.lock();
        for (std::size_t x = 0; x < size; ++x) {
            const std::size_t pos = byte_offset + x;
            const std::size_t lane = pos % BYTES_PER_WORD;
            words[pos / BYTES_PER_WORD] |= static_cast<word_t>(bytes[x]) << (lane * 8U);
        }
    }

    next_offset = byte_offset + size;
    return Error::Ok;
}

Error count_ones_chunk(const BitArray& array, std::size_t chunk_num, Cursor& next,
                       std::size_t& partial) noexcept {
    const ChunkRange range = chunk_range(array.num_words(), chunk_num);

    std::size_t count = 0;
    {
        const ConstWordView words = array.lock();
        for (std::size_t x = 0; x < range.size; ++x) {
            count += static_cast<std::size_t>(__builtin_popcountll(words[range.offset + x]));
        }
    }

    partial = count;
    next = cursor_after(range, chunk_num);
    return Error::Ok;
}

} // namespace flower
