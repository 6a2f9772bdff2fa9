/**
 * @file bitarray.cpp
 * @brief BitArray storage and point access.
 */

#include <flower/bitarray.hpp>

#include <new>
#include <stdexcept>

namespace flower {

BitArray::BitArray(std::size_t num_words) : words_(num_words, 0U), num_words_(num_words) {}

Error BitArray::create(std::size_t length, Handle& out) noexcept {
    try {
        out = Handle(new BitArray(detail::words_for_bits(length)));
    } catch (const std::bad_alloc&) {
        return Error::AllocationError;
    } catch (const std::length_error&) {
        return Error::AllocationError;
    }
    return Error::Ok;
}

Error BitArray::get(std::size_t index, bool& value) const noexcept {
    if (index >= bit_length()) [[unlikely]] {
        return Error::IndexOutOfRange;
    }
    value = get_unchecked(index);
    return Error::Ok;
}

Error BitArray::put(std::size_t index, bool value) noexcept {
    if (index >= bit_length()) [[unlikely]] {
        return Error::IndexOutOfRange;
    }
    put_unchecked(index, value);
    return Error::Ok;
}

bool BitArray::get_unchecked(std::size_t index) const noexcept {
    std::lock_guard<std::mutex> guard(mutex_);
    return (words_[index / BITS_PER_WORD] & detail::bit_mask(index)) != 0U;
}

void BitArray::put_unchecked(std::size_t index, bool value) noexcept {
    std::lock_guard<std::mutex> guard(mutex_);
    word_t& word = words_[index / BITS_PER_WORD];
    if (value) {
        word |= detail::bit_mask(index);
    } else {
        word &= ~detail::bit_mask(index);
    }
}

std::size_t BitArray::count_ones() const noexcept {
    std::lock_guard<std::mutex> guard(mutex_);
    std::size_t count = 0;
    for (word_t word : words_) {
        count += static_cast<std::size_t>(__builtin_popcountll(word));
    }
    return count;
}

} // namespace flower
