/**
 * @file flower.hpp
 * @brief flower umbrella header.
 */

#ifndef FLOWER_HPP
#define FLOWER_HPP

#include "bitarray.hpp"
#include "bloom.hpp"
#include "chunked.hpp"
#include "config.hpp"
#include "error.hpp"
#include "stream.hpp"

namespace flower {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace flower

#endif // FLOWER_HPP
