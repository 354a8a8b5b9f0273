// Core numeric types
// Multiprecision integers (uint256/uint512) for settlement math; the continuous
// reference curve runs on double/long double
#pragma once

#include <limits>
#include <stdexcept>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

namespace lc {

using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;

// Ledger addresses are opaque identifiers
using Address = std::string;

// Narrow a 512-bit intermediate back to a ledger word; throws if it does not fit
inline uint256_t narrow_u256(const uint512_t& v) {
    static const uint512_t max_word = uint512_t((std::numeric_limits<uint256_t>::max)());
    if (v > max_word) {
        throw std::overflow_error("math: value exceeds 256 bits");
    }
    return static_cast<uint256_t>(v);
}

} // namespace lc
