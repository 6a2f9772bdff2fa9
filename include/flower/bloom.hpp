/**
 * @file bloom.hpp
 * @brief Bloom filter backed by a shared BitArray.
 *
 * A filter of 2^bit_addr_len bits (bit_addr_len 6..32). Element positions
 * are the first k big-endian 32-bit words of the SHA-256 digest (k <= 8) or
 * the SHA-512 digest (k > 8), masked to the address width.
 *
 * @par Serialized Form
 * | Byte | Content                   |
 * |------|---------------------------|
 * | 0    | version (1)               |
 * | 1    | magic (42)                |
 * | 2    | bit_addr_len              |
 * | 3    | number of hashes          |
 * | 4..  | array chunks (see chunked.hpp) |
 */

#ifndef FLOWER_BLOOM_HPP
#define FLOWER_BLOOM_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "bitarray.hpp"
#include "config.hpp"
#include "error.hpp"

namespace flower {

class BloomFilter {
public:
    /// Serialization header bytes
    using Header = std::array<std::uint8_t, SERIALIZATION_HEADER_BYTES>;

    /// Empty filter with no storage; use create() or from_header()
    BloomFilter() noexcept = default;

    /**
     * @brief Create a filter of 2^bit_addr_len bits.
     *
     * The number of hashes (1..16) minimizes the false positive rate for
     * expected_elements.
     *
     * @param bit_addr_len Address width (6..32)
     * @param expected_elements Expected number of inserted elements (> 0)
     * @param[out] out New filter
     * @return Error::Ok, Error::InvalidArg, or Error::AllocationError
     */
    [[nodiscard]] static Error create(unsigned bit_addr_len, std::uint64_t expected_elements,
                                      BloomFilter& out) noexcept;

    /**
     * @brief Create the largest filter fitting in the given byte budget.
     *
     * bit_addr_len = floor(log2(bytes * 8)).
     */
    [[nodiscard]] static Error create_by_byte_size(std::uint64_t bytes,
                                                   std::uint64_t expected_elements,
                                                   BloomFilter& out) noexcept;

    /**
     * @brief Optimal number of hashes for m bits and n elements.
     */
    [[nodiscard]] static unsigned optimal_hashes(std::uint64_t bits,
                                                 std::uint64_t expected_elements) noexcept;

    /**
     * @brief Add an element.
     * @return Error::Ok, or Error::InvalidArg if the filter has no storage
     */
    Error insert(const std::uint8_t* data, std::size_t size) noexcept;

    Error insert(std::string_view element) noexcept {
        return insert(reinterpret_cast<const std::uint8_t*>(element.data()), element.size());
    }

    /**
     * @brief Test whether an element may have been inserted.
     *
     * @param[out] result false if the element was definitely never inserted
     * @return Error::Ok, or Error::InvalidArg if the filter has no storage
     */
    [[nodiscard]] Error has(const std::uint8_t* data, std::size_t size,
                            bool& result) const noexcept;

    /**
     * @brief Test whether an element may have been inserted.
     *
     * A filter with no storage reports every element as absent; use the
     * Error-returning overload to tell the two cases apart.
     */
    [[nodiscard]] bool has(std::string_view element) const noexcept;

    [[nodiscard]] bool has_not(std::string_view element) const noexcept {
        return !has(element);
    }

    /**
     * @brief Probability that has() is true for an element never inserted.
     *
     * (ones / bits)^k. Scans the whole array.
     */
    [[nodiscard]] double false_positive_probability() const noexcept;

    /**
     * @brief Estimate the number of distinct elements inserted.
     *
     * round(-ln(1 - ones / bits) * bits / k). Returns UINT64_MAX when every
     * bit is set. Scans the whole array.
     */
    [[nodiscard]] std::uint64_t estimate_count() const noexcept;

    /**
     * @brief OR another filter with the same parameters into this one.
     *
     * Streams the other filter chunk by chunk.
     *
     * @return Error::Ok, or Error::InvalidArg if the parameters differ
     */
    Error merge(const BloomFilter& other) noexcept;

    /// Serialization header for this filter
    [[nodiscard]] Header header() const noexcept;

    /**
     * @brief Create an empty filter from a serialization header.
     *
     * The caller then feeds the array bytes through a ChunkWriter on
     * bits().
     *
     * @param bytes At least SERIALIZATION_HEADER_BYTES bytes
     * @param size Number of bytes available
     * @param[out] out New filter
     * @return Error::Ok, Error::InvalidData, or Error::AllocationError
     */
    [[nodiscard]] static Error from_header(const std::uint8_t* bytes, std::size_t size,
                                           BloomFilter& out) noexcept;

    /**
     * @brief Serialize header and array into one buffer.
     */
    [[nodiscard]] Error serialize(std::vector<std::uint8_t>& bytes) const noexcept;

    /**
     * @brief Rebuild a filter from serialize() output.
     *
     * @return Error::InvalidData if the header is bad or the payload does
     *         not match the array size
     */
    [[nodiscard]] static Error deserialize(const std::uint8_t* bytes, std::size_t size,
                                           BloomFilter& out) noexcept;

    /// True when the filter only uses one hash (too small for its load)
    [[nodiscard]] bool undersized() const noexcept {
        return num_hashes_ == 1U;
    }

    [[nodiscard]] bool valid() const noexcept {
        return static_cast<bool>(bits_);
    }

    [[nodiscard]] unsigned bit_addr_len() const noexcept {
        return bit_addr_len_;
    }

    [[nodiscard]] unsigned num_hashes() const noexcept {
        return num_hashes_;
    }

    [[nodiscard]] std::uint64_t address_mask() const noexcept {
        return address_mask_;
    }

    /// Underlying array (shared with copies of this filter)
    [[nodiscard]] const BitArray::Handle& bits() const noexcept {
        return bits_;
    }

private:
    BloomFilter(BitArray::Handle bits, unsigned bit_addr_len, unsigned num_hashes) noexcept;

    void positions(const std::uint8_t* data, std::size_t size,
                   std::array<std::uint64_t, MAX_HASHES>& out) const noexcept;

    BitArray::Handle bits_;
    unsigned bit_addr_len_ = 0;
    unsigned num_hashes_ = 0;
    std::uint64_t address_mask_ = 0;
};

} // namespace flower

#endif // FLOWER_BLOOM_HPP
