/**
 * @file stream.cpp
 * @brief ChunkReader, ChunkWriter and whole-array helpers.
 */

#include <flower/stream.hpp>

#include <new>
#include <stdexcept>
#include <utility>

namespace flower {

Error ChunkReader::read_next(std::vector<std::uint8_t>& bytes) noexcept {
    if (cursor_.is_eof()) {
        bytes.clear();
        return Error::Ok;
    }

    Cursor next;
    auto result = serialize_chunk(array_, cursor_.chunk(), next, bytes);
    if (result != Error::Ok) {
        return result;
    }

    cursor_ = next;
    ++chunks_read_;
    return Error::Ok;
}

Error ChunkWriter::write(const std::uint8_t* bytes, std::size_t size) noexcept {
    std::size_t next_offset = offset_;
    auto result = merge_chunk(array_, bytes, size, offset_, next_offset);
    if (result != Error::Ok) {
        return result;
    }
    offset_ = next_offset;
    return Error::Ok;
}

Error to_bytes(const BitArray& array, std::vector<std::uint8_t>& bytes) noexcept {
    std::vector<std::uint8_t> out;
    try {
        out.reserve(array.byte_length());
    } catch (const std::bad_alloc&) {
        return Error::AllocationError;
    } catch (const std::length_error&) {
        return Error::AllocationError;
    }

    ChunkReader reader(array);
    std::vector<std::uint8_t> chunk;
    while (!reader.done()) {
        auto result = reader.read_next(chunk);
        if (result != Error::Ok) {
            return result;
        }
        // Capacity was reserved up front, so this cannot reallocate
        out.insert(out.end(), chunk.begin(), chunk.end());
    }

    bytes = std::move(out);
    return Error::Ok;
}

Error from_bytes(const std::uint8_t* bytes, std::size_t size, BitArray::Handle& out) noexcept {
    if (size > static_cast<std::size_t>(-1) / 8U) {
        return Error::AllocationError;
    }

    BitArray::Handle array;
    auto result = BitArray::create(size * 8U, array);
    if (result != Error::Ok) {
        return result;
    }

    ChunkWriter writer(*array);
    std::size_t pos = 0;
    while (pos < size) {
        const std::size_t piece = (size - pos < CHUNK_BYTES) ? (size - pos) : CHUNK_BYTES;
        result = writer.write(bytes + pos, piece);
        if (result != Error::Ok) {
            return result;
        }
        pos += piece;
    }

    out = std::move(array);
    return Error::Ok;
}

Error count_ones_chunked(const BitArray& array, std::size_t& total) noexcept {
    std::size_t sum = 0;
    Cursor cursor;
    do {
        std::size_t partial = 0;
        Cursor next;
        auto result = count_ones_chunk(array, cursor.chunk(), next, partial);
        if (result != Error::Ok) {
            return result;
        }
        sum += partial;
        cursor = next;
    } while (!cursor.is_eof());

    total = sum;
    return Error::Ok;
}

} // namespace flower
