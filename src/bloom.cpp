/**
 * @file bloom.cpp
 * @brief BloomFilter on top of BitArray and the chunk protocol.
 */

#include <flower/bloom.hpp>
#include <flower/chunked.hpp>
#include <flower/stream.hpp>

#include <openssl/sha.h>

#include <cmath>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

namespace flower {

namespace {

/// Read a big-endian 32-bit word
inline std::uint32_t load_be32(const unsigned char* p) noexcept {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

/// (1 - e^(-k*n/m))^k
double false_positive_rate(std::uint64_t elements, std::uint64_t bits, unsigned hashes) noexcept {
    const double fraction_of_0 =
        std::exp(-static_cast<double>(hashes) * static_cast<double>(elements) /
                 static_cast<double>(bits));
    return std::pow(1.0 - fraction_of_0, static_cast<double>(hashes));
}

} // namespace

BloomFilter::BloomFilter(BitArray::Handle bits, unsigned bit_addr_len, unsigned num_hashes) noexcept
    : bits_(std::move(bits)), bit_addr_len_(bit_addr_len), num_hashes_(num_hashes),
      address_mask_((static_cast<std::uint64_t>(1U) << bit_addr_len) - 1U) {}

unsigned BloomFilter::optimal_hashes(std::uint64_t bits,
                                     std::uint64_t expected_elements) noexcept {
    unsigned best = 1;
    double best_rate = false_positive_rate(expected_elements, bits, 1U);
    for (unsigned k = 2; k <= MAX_HASHES; ++k) {
        const double rate = false_positive_rate(expected_elements, bits, k);
        if (rate < best_rate) {
            best = k;
            best_rate = rate;
        }
    }
    return best;
}

Error BloomFilter::create(unsigned bit_addr_len, std::uint64_t expected_elements,
                          BloomFilter& out) noexcept {
    if (bit_addr_len < MIN_BIT_ADDR_LEN || bit_addr_len > MAX_BIT_ADDR_LEN) {
        return Error::InvalidArg;
    }
    if (expected_elements == 0) {
        return Error::InvalidArg;
    }

    const std::uint64_t bits = static_cast<std::uint64_t>(1U) << bit_addr_len;

    BitArray::Handle array;
    auto result = BitArray::create(static_cast<std::size_t>(bits), array);
    if (result != Error::Ok) {
        return result;
    }

    out = BloomFilter(std::move(array), bit_addr_len, optimal_hashes(bits, expected_elements));
    return Error::Ok;
}

Error BloomFilter::create_by_byte_size(std::uint64_t bytes, std::uint64_t expected_elements,
                                       BloomFilter& out) noexcept {
    if (bytes == 0) {
        return Error::InvalidArg;
    }
    // floor(log2(bytes * 8)) without the multiplication
    const auto bit_addr_len = static_cast<unsigned>(63 - __builtin_clzll(bytes)) + 3U;
    return create(bit_addr_len, expected_elements, out);
}

void BloomFilter::positions(const std::uint8_t* data, std::size_t size,
                            std::array<std::uint64_t, MAX_HASHES>& out) const noexcept {
    unsigned char digest[SHA512_DIGEST_LENGTH];
    if (num_hashes_ <= SHA256_DIGEST_LENGTH / 4U) {
        SHA256(data, size, digest);
    } else {
        SHA512(data, size, digest);
    }

    for (unsigned i = 0; i < num_hashes_; ++i) {
        out[i] = static_cast<std::uint64_t>(load_be32(&digest[i * 4U])) & address_mask_;
    }
}

Error BloomFilter::insert(const std::uint8_t* data, std::size_t size) noexcept {
    if (!bits_) {
        return Error::InvalidArg;
    }

    std::array<std::uint64_t, MAX_HASHES> pos{};
    positions(data, size, pos);

    for (unsigned i = 0; i < num_hashes_; ++i) {
        auto result = bits_->put(static_cast<std::size_t>(pos[i]), true);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

Error BloomFilter::has(const std::uint8_t* data, std::size_t size, bool& result) const noexcept {
    if (!bits_) {
        return Error::InvalidArg;
    }

    std::array<std::uint64_t, MAX_HASHES> pos{};
    positions(data, size, pos);

    for (unsigned i = 0; i < num_hashes_; ++i) {
        bool bit = false;
        auto get_result = bits_->get(static_cast<std::size_t>(pos[i]), bit);
        if (get_result != Error::Ok) {
            return get_result;
        }
        if (!bit) {
            result = false;
            return Error::Ok;
        }
    }
    result = true;
    return Error::Ok;
}

bool BloomFilter::has(std::string_view element) const noexcept {
    bool result = false;
    if (has(reinterpret_cast<const std::uint8_t*>(element.data()), element.size(), result) !=
        Error::Ok) {
        return false;
    }
    return result;
}

double BloomFilter::false_positive_probability() const noexcept {
    if (!bits_) {
        return 0.0;
    }
    const double fraction_of_1 =
        static_cast<double>(bits_->count_ones()) / static_cast<double>(bits_->bit_length());
    return std::pow(fraction_of_1, static_cast<double>(num_hashes_));
}

std::uint64_t BloomFilter::estimate_count() const noexcept {
    if (!bits_) {
        return 0;
    }
    const std::size_t bits = bits_->bit_length();
    const std::size_t ones = bits_->count_ones();
    if (ones >= bits) {
        return std::numeric_limits<std::uint64_t>::max();
    }

    const double fraction_of_0 = 1.0 - static_cast<double>(ones) / static_cast<double>(bits);
    const double elements =
        -std::log(fraction_of_0) * static_cast<double>(bits) / static_cast<double>(num_hashes_);
    return static_cast<std::uint64_t>(std::llround(elements));
}

Error BloomFilter::merge(const BloomFilter& other) noexcept {
    if (!bits_ || !other.bits_) {
        return Error::InvalidArg;
    }
    if (bit_addr_len_ != other.bit_addr_len_ || num_hashes_ != other.num_hashes_) {
        return Error::InvalidArg;
    }
    if (bits_ == other.bits_) {
        return Error::Ok;
    }

    ChunkReader reader(*other.bits_);
    ChunkWriter writer(*bits_);
    std::vector<std::uint8_t> chunk;
    while (!reader.done()) {
        auto result = reader.read_next(chunk);
        if (result != Error::Ok) {
            return result;
        }
        result = writer.write(chunk.data(), chunk.size());
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

BloomFilter::Header BloomFilter::header() const noexcept {
    return Header{SERIALIZATION_VERSION, SERIALIZATION_MAGIC,
                  static_cast<std::uint8_t>(bit_addr_len_),
                  static_cast<std::uint8_t>(num_hashes_)};
}

Error BloomFilter::from_header(const std::uint8_t* bytes, std::size_t size,
                               BloomFilter& out) noexcept {
    if (size < SERIALIZATION_HEADER_BYTES) {
        return Error::InvalidData;
    }
    if (bytes[0] != SERIALIZATION_VERSION || bytes[1] != SERIALIZATION_MAGIC) {
        return Error::InvalidData;
    }

    const unsigned bit_addr_len = bytes[2];
    const unsigned num_hashes = bytes[3];
    if (bit_addr_len < MIN_BIT_ADDR_LEN || bit_addr_len > MAX_BIT_ADDR_LEN) {
        return Error::InvalidData;
    }
    if (num_hashes < 1U || num_hashes > MAX_HASHES) {
        return Error::InvalidData;
    }

    BitArray::Handle array;
    auto result =
        BitArray::create(static_cast<std::size_t>(1U) << bit_addr_len, array);
    if (result != Error::Ok) {
        return result;
    }

    out = BloomFilter(std::move(array), bit_addr_len, num_hashes);
    return Error::Ok;
}

Error BloomFilter::serialize(std::vector<std::uint8_t>& bytes) const noexcept {
    if (!bits_) {
        return Error::InvalidArg;
    }

    std::vector<std::uint8_t> payload;
    auto result = to_bytes(*bits_, payload);
    if (result != Error::Ok) {
        return result;
    }

    std::vector<std::uint8_t> out;
    try {
        out.reserve(SERIALIZATION_HEADER_BYTES + payload.size());
    } catch (const std::bad_alloc&) {
        return Error::AllocationError;
    } catch (const std::length_error&) {
        return Error::AllocationError;
    }

    const Header h = header();
    out.insert(out.end(), h.begin(), h.end());
    out.insert(out.end(), payload.begin(), payload.end());
    bytes = std::move(out);
    return Error::Ok;
}

Error BloomFilter::deserialize(const std::uint8_t* bytes, std::size_t size,
                               BloomFilter& out) noexcept {
    BloomFilter filter;
    auto result = from_header(bytes, size, filter);
    if (result != Error::Ok) {
        return result;
    }

    const std::size_t payload_size = size - SERIALIZATION_HEADER_BYTES;
    if (payload_size != filter.bits_->byte_length()) {
        return Error::InvalidData;
    }

    ChunkWriter writer(*filter.bits_);
    result = writer.write(bytes + SERIALIZATION_HEADER_BYTES, payload_size);
    if (result != Error::Ok) {
        return result;
    }

    out = std::move(filter);
    return Error::Ok;
}

} // namespace flower
