/**
 * @file bitarray.hpp
 * @brief Fixed-length, word-packed bit array with a shared lock.
 *
 * The array owns ceil(length / 64) words, allocated once and never resized.
 * Every operation holds the array's mutex for its full duration, so single
 * calls are atomic with respect to each other.
 *
 * @par Bit Numbering
 * - Bit i lives in word i / 64
 * - Within a word, bit i is at position i % 64 (LSB first)
 *
 * @par Padding
 * bit_length() is always a multiple of 64. Bits past the requested length
 * start at zero and are read, written and counted like any other bit.
 */

#ifndef FLOWER_BITARRAY_HPP
#define FLOWER_BITARRAY_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace flower {

namespace detail {

/**
 * @brief Number of words needed to hold a bit length.
 *
 * Written to avoid overflow for lengths close to SIZE_MAX.
 */
constexpr std::size_t words_for_bits(std::size_t length) noexcept {
    return (length / BITS_PER_WORD) + ((length % BITS_PER_WORD) != 0U ? 1U : 0U);
}

/**
 * @brief Mask selecting bit position pos within a word.
 */
constexpr word_t bit_mask(std::size_t pos) noexcept {
    return static_cast<word_t>(1U) << (pos % BITS_PER_WORD);
}

} // namespace detail

/**
 * @brief Word storage viewed while the owning array's lock is held.
 *
 * The view holds the lock until it is destroyed. Do not call other
 * BitArray operations on the same array while a view is alive.
 *
 * @tparam Word word_t or const word_t
 */
template <typename Word> class LockedWords {
public:
    LockedWords(std::mutex& mutex, Word* data, std::size_t size)
        : lock_(mutex), data_(data), size_(size) {}

    [[nodiscard]] Word* data() const noexcept {
        return data_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    Word& operator[](std::size_t i) const noexcept {
        return data_[i];
    }

private:
    std::unique_lock<std::mutex> lock_;
    Word* data_;
    std::size_t size_;
};

using WordView = LockedWords<word_t>;
using ConstWordView = LockedWords<const word_t>;

/**
 * @brief Fixed-length bit array with thread-safe access.
 *
 * Instances are shared through Handle. The array is destroyed when the
 * last handle goes away.
 */
class BitArray {
public:
    /// Shared ownership handle held by callers
    using Handle = std::shared_ptr<BitArray>;

    /**
     * @brief Create a zero-initialized array.
     *
     * @param length Requested length in bits (rounded up to a multiple of 64)
     * @param[out] out Handle to the new array
     * @return Error::Ok on success, Error::AllocationError if storage
     *         could not be allocated
     */
    [[nodiscard]] static Error create(std::size_t length, Handle& out) noexcept;

    BitArray(const BitArray&) = delete;
    BitArray& operator=(const BitArray&) = delete;

    /**
     * @brief Read a bit.
     *
     * @param index Bit index
     * @param[out] value Bit value
     * @return Error::Ok, or Error::IndexOutOfRange if index >= bit_length()
     */
    [[nodiscard]] Error get(std::size_t index, bool& value) const noexcept;

    /**
     * @brief Set or clear a bit.
     *
     * @param index Bit index
     * @param value New bit value
     * @return Error::Ok, or Error::IndexOutOfRange if index >= bit_length()
     */
    [[nodiscard]] Error put(std::size_t index, bool value) noexcept;

    /**
     * @brief Read a bit without bounds checking.
     *
     * @warning Caller must ensure index < bit_length().
     */
    [[nodiscard]] bool get_unchecked(std::size_t index) const noexcept;

    /**
     * @brief Set or clear a bit without bounds checking.
     *
     * @warning Caller must ensure index < bit_length().
     */
    void put_unchecked(std::size_t index, bool value) noexcept;

    /**
     * @brief Count set bits over the whole array, padding included.
     *
     * Holds the lock for the full scan. See count_ones_chunk() for a
     * bounded-latency alternative.
     */
    [[nodiscard]] std::size_t count_ones() const noexcept;

    /// Number of addressable bits (num_words() * 64)
    [[nodiscard]] std::size_t bit_length() const noexcept {
        return num_words_ * BITS_PER_WORD;
    }

    /// Number of 64-bit words
    [[nodiscard]] std::size_t num_words() const noexcept {
        return num_words_;
    }

    /// Number of bytes in the serialized form (num_words() * 8)
    [[nodiscard]] std::size_t byte_length() const noexcept {
        return num_words_ * BYTES_PER_WORD;
    }

    /**
     * @brief Lock the array and expose its words.
     * @return View holding the lock until destroyed
     */
    [[nodiscard]] WordView lock() {
        return WordView(mutex_, words_.data(), num_words_);
    }

    /**
     * @brief Lock the array and expose its words read-only.
     * @return View holding the lock until destroyed
     */
    [[nodiscard]] ConstWordView lock() const {
        return ConstWordView(mutex_, words_.data(), num_words_);
    }

private:
    explicit BitArray(std::size_t num_words);

    mutable std::mutex mutex_;
    std::vector<word_t> words_;
    const std::size_t num_words_;
};

} // namespace flower

#endif // FLOWER_BITARRAY_HPP
