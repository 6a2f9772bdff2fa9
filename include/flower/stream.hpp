/**
 * @file stream.hpp
 * @brief Whole-array transfer built on the chunk protocol.
 *
 * ChunkReader and ChunkWriter keep the cursor on the caller side so a
 * BitArray can be streamed to a file or socket and back without a buffer
 * the size of the whole array.
 */

#ifndef FLOWER_STREAM_HPP
#define FLOWER_STREAM_HPP

#include <cstdint>
#include <vector>

#include "bitarray.hpp"
#include "chunked.hpp"
#include "config.hpp"
#include "error.hpp"

namespace flower {

/**
 * @brief Reads an array chunk by chunk until EOF.
 *
 * Not a snapshot: writes made between read_next() calls show up in chunks
 * not yet read.
 */
class ChunkReader {
public:
    explicit ChunkReader(const BitArray& array) noexcept : array_(array) {}

    /// True once the EOF chunk has been read
    [[nodiscard]] bool done() const noexcept {
        return cursor_.is_eof();
    }

    /// Number of chunks returned so far
    [[nodiscard]] std::size_t chunks_read() const noexcept {
        return chunks_read_;
    }

    /**
     * @brief Read the next chunk.
     *
     * @param[out] bytes Chunk bytes (empty once done())
     * @return Error::Ok on success
     */
    Error read_next(std::vector<std::uint8_t>& bytes) noexcept;

private:
    const BitArray& array_;
    Cursor cursor_;
    std::size_t chunks_read_ = 0;
};

/**
 * @brief OR-merges a byte stream into an array at a running offset.
 *
 * Pieces may have any size; they do not need to line up with words or
 * chunks.
 */
class ChunkWriter {
public:
    explicit ChunkWriter(BitArray& array, std::size_t byte_offset = 0) noexcept
        : array_(array), offset_(byte_offset) {}

    /// Byte offset the next write() starts at
    [[nodiscard]] std::size_t offset() const noexcept {
        return offset_;
    }

    /**
     * @brief Merge the next piece of the stream.
     *
     * @param bytes Source bytes
     * @param size Number of bytes
     * @return Error::Ok, or Error::IndexOutOfRange if the piece runs past
     *         the array (offset is not advanced)
     */
    Error write(const std::uint8_t* bytes, std::size_t size) noexcept;

private:
    BitArray& array_;
    std::size_t offset_;
};

/**
 * @brief Serialize the whole array (word-major, little-endian).
 *
 * @param array Source array
 * @param[out] bytes byte_length() bytes
 * @return Error::Ok on success
 */
Error to_bytes(const BitArray& array, std::vector<std::uint8_t>& bytes) noexcept;

/**
 * @brief Create an array holding size * 8 bits and merge bytes into it.
 *
 * @param bytes Source bytes
 * @param size Number of bytes
 * @param[out] out New array
 * @return Error::Ok on success
 */
Error from_bytes(const std::uint8_t* bytes, std::size_t size, BitArray::Handle& out) noexcept;

/**
 * @brief Sum count_ones_chunk() over all chunks.
 *
 * Only equals count_ones() if no writer runs during the scan.
 *
 * @param array Source array
 * @param[out] total Set bits
 * @return Error::Ok on success
 */
Error count_ones_chunked(const BitArray& array, std::size_t& total) noexcept;

} // namespace flower

#endif // FLOWER_STREAM_HPP
