/**
 * @file chunked.hpp
 * @brief Chunked transfer of bit array contents.
 *
 * Moves a BitArray to and from bytes in pieces of at most CHUNK_WORDS words,
 * so neither side needs a buffer the size of the whole array and no call
 * holds the lock for more than one chunk.
 *
 * @par Chunk Byte Layout
 * Words in index order, each word as 8 bytes little-endian (least
 * significant byte first). No framing or length prefix.
 *
 * @par Cursors
 * The caller keeps the cursor between calls. A cursor is either the next
 * chunk number or EOF. Passing a chunk number past the end is not an error:
 * it yields EOF and an empty result.
 *
 * @par Consistency
 * Each call is atomic. A sequence of calls is not: a writer running between
 * two calls is seen by later chunks and not by earlier ones. Callers needing
 * a snapshot must stop writers for the whole transfer.
 */

#ifndef FLOWER_CHUNKED_HPP
#define FLOWER_CHUNKED_HPP

#include <cstdint>
#include <vector>

#include "bitarray.hpp"
#include "config.hpp"
#include "error.hpp"

namespace flower {

/**
 * @brief Position in a chunked scan: next chunk number or EOF.
 */
class Cursor {
public:
    /// End of stream
    static constexpr Cursor eof() noexcept {
        return Cursor(true, 0U);
    }

    /// Next chunk to request
    static constexpr Cursor next(std::size_t chunk_num) noexcept {
        return Cursor(false, chunk_num);
    }

    /// Start of a scan (chunk 0)
    constexpr Cursor() noexcept : eof_(false), chunk_(0U) {}

    [[nodiscard]] constexpr bool is_eof() const noexcept {
        return eof_;
    }

    /// Chunk number to pass to the next call (0 when EOF)
    [[nodiscard]] constexpr std::size_t chunk() const noexcept {
        return chunk_;
    }

    [[nodiscard]] constexpr bool operator==(const Cursor& other) const noexcept {
        return eof_ == other.eof_ && chunk_ == other.chunk_;
    }

    [[nodiscard]] constexpr bool operator!=(const Cursor& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr Cursor(bool eof, std::size_t chunk) noexcept : eof_(eof), chunk_(chunk) {}

    bool eof_;
    std::size_t chunk_;
};

/**
 * @brief Word range covered by one chunk.
 */
struct ChunkRange {
    std::size_t offset = 0; ///< First word index
    std::size_t size = 0;   ///< Number of words (0..CHUNK_WORDS)
    bool is_last = true;    ///< No chunk follows this one
};

/**
 * @brief Compute the word range of a chunk.
 *
 * offset = chunk_num * CHUNK_WORDS, remaining = max(0, num_words - offset),
 * size = min(CHUNK_WORDS, remaining), is_last = remaining <= CHUNK_WORDS.
 * Safe for any chunk_num (no overflow).
 *
 * @param num_words Array size in words
 * @param chunk_num Chunk number
 * @return Chunk range
 */
[[nodiscard]] ChunkRange chunk_range(std::size_t num_words, std::size_t chunk_num) noexcept;

/**
 * @brief Cursor to return after a chunk.
 */
[[nodiscard]] constexpr Cursor cursor_after(const ChunkRange& range,
                                            std::size_t chunk_num) noexcept {
    return range.is_last ? Cursor::eof() : Cursor::next(chunk_num + 1U);
}

/**
 * @brief Serialize one chunk of words to little-endian bytes.
 *
 * @param array Source array
 * @param chunk_num Chunk number (0-based)
 * @param[out] next Cursor for the following call
 * @param[out] bytes Chunk bytes (size * 8), replaced on success
 * @return Error::Ok, or Error::AllocationError if the buffer could not be
 *         allocated (bytes and next are left untouched)
 */
[[nodiscard]] Error serialize_chunk(const BitArray& array, std::size_t chunk_num, Cursor& next,
                                    std::vector<std::uint8_t>& bytes) noexcept;

/**
 * @brief OR-merge a byte stream into the array at a byte offset.
 *
 * Byte x lands in word (byte_offset + x) / 8, byte lane
 * (byte_offset + x) % 8. Bits already set stay set.
 *
 * @param array Target array
 * @param bytes Source bytes
 * @param size Number of source bytes
 * @param byte_offset Absolute byte position of bytes[0]
 * @param[out] next_offset byte_offset + size, the offset for the next call
 * @return Error::Ok, or Error::IndexOutOfRange if the bytes do not fit
 *         inside byte_length() (the array is left unchanged)
 */
[[nodiscard]] Error merge_chunk(BitArray& array, const std::uint8_t* bytes, std::size_t size,
                                std::size_t byte_offset, std::size_t& next_offset) noexcept;

/**
 * @brief Count set bits in one chunk of words.
 *
 * @param array Source array
 * @param chunk_num Chunk number (0-based)
 * @param[out] next Cursor for the following call
 * @param[out] partial Set bits in this chunk
 * @return Error::Ok
 */
[[nodiscard]] Error count_ones_chunk(const BitArray& array, std::size_t chunk_num, Cursor& next,
                                     std::size_t& partial) noexcept;

} // namespace flower

#endif // FLOWER_CHUNKED_HPP
