/**
 * @file config.hpp
 * @brief flower compile-time configuration.
 *
 * Word-packed bit arrays with chunked bulk transfer.
 */

#ifndef FLOWER_CONFIG_HPP
#define FLOWER_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace flower {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Words per transfer chunk
#ifndef FLOWER_CHUNK_WORDS
#define FLOWER_CHUNK_WORDS 1024U
#endif

/// 64-bit word type for bit array storage
using word_t = std::uint64_t;
inline constexpr std::size_t BITS_PER_WORD = 64U;
inline constexpr std::size_t BYTES_PER_WORD = 8U;

inline constexpr std::size_t CHUNK_WORDS = FLOWER_CHUNK_WORDS;
inline constexpr std::size_t CHUNK_BYTES = CHUNK_WORDS * BYTES_PER_WORD;

static_assert(CHUNK_WORDS > 0, "FLOWER_CHUNK_WORDS must be positive");

/// Bloom filter address width limits (2^6 .. 2^32 bits)
inline constexpr unsigned MIN_BIT_ADDR_LEN = 6U;
inline constexpr unsigned MAX_BIT_ADDR_LEN = 32U;
inline constexpr unsigned MAX_HASHES = 16U;

/// Bloom filter serialization header
inline constexpr std::uint8_t SERIALIZATION_VERSION = 1U;
inline constexpr std::uint8_t SERIALIZATION_MAGIC = 42U;
inline constexpr std::size_t SERIALIZATION_HEADER_BYTES = 4U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define FLOWER_NO_EXCEPTIONS=1 to drop the exception classes.
 * @{
 */
#ifndef FLOWER_NO_EXCEPTIONS
#define FLOWER_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace flower

#endif // FLOWER_CONFIG_HPP
