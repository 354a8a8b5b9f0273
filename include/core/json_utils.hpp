// JSON parsing and serialization utilities
#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/numeric_types.hpp"

namespace lc {

// ============================================================================
// Output formatting (value -> string)
// ============================================================================

// Base-unit integer as a decimal string (wei format)
inline std::string to_wei_str(const uint256_t& v) {
    return v.str();
}

// Base units shown as whole units with the given number of decimals (display only)
inline std::string to_units_str(const uint256_t& v, int decimals = 4) {
    static const uint256_t wad("1000000000000000000");
    const uint256_t whole = v / wad;
    const uint256_t frac = v % wad;
    std::string f = frac.str();
    f.insert(0, 18 - f.size(), '0');
    if (decimals <= 0) return whole.str();
    if (decimals > 18) decimals = 18;
    return whole.str() + "." + f.substr(0, static_cast<size_t>(decimals));
}

// ============================================================================
// JSON value parsing (boost::json::value -> T)
// ============================================================================

// Parse a decimal digit string into a 256-bit unsigned integer (throws on junk or overflow)
inline uint256_t parse_u256_str(const std::string& s) {
    if (s.empty()) {
        throw std::runtime_error("empty integer string");
    }
    static const uint512_t max_word = uint512_t((std::numeric_limits<uint256_t>::max)());
    uint512_t acc = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::runtime_error("not a decimal integer: " + s);
        }
        acc = acc * 10 + static_cast<unsigned>(c - '0');
        if (acc > max_word) {
            throw std::runtime_error("integer exceeds 256 bits: " + s);
        }
    }
    return narrow_u256(acc);
}

// Parse a JSON value as a base-unit amount. Strings keep full precision;
// JSON numbers are accepted only while they are exact non-negative integers.
inline uint256_t parse_u256(const boost::json::value& v) {
    if (v.is_string()) return parse_u256_str(std::string(v.as_string().c_str()));
    if (v.is_uint64()) return uint256_t(v.as_uint64());
    if (v.is_int64()) {
        if (v.as_int64() < 0) throw std::runtime_error("negative amount");
        return uint256_t(static_cast<uint64_t>(v.as_int64()));
    }
    throw std::runtime_error("expected integer amount (decimal string or unsigned number)");
}

// ============================================================================
// JSON object accessors
// ============================================================================

// Get a required string value from a JSON object (throws on missing/wrong type)
inline std::string get_str(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::runtime_error(std::string("missing key: ") + key);
    }
    if (!it->value().is_string()) {
        throw std::runtime_error(std::string("expected string for key: ") + key);
    }
    return std::string(it->value().as_string().c_str());
}

// Get an optional string value (returns default if missing)
inline std::string get_str_opt(const boost::json::object& obj, const char* key,
                               const std::string& default_value) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string()) return default_value;
    return std::string(it->value().as_string().c_str());
}

// Get a required amount from a JSON object
inline uint256_t get_u256(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::runtime_error(std::string("missing key: ") + key);
    }
    try {
        return parse_u256(it->value());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string("bad value for key ") + key + ": " + e.what());
    }
}

// Get an optional uint64 value from a JSON object (returns default if missing)
inline uint64_t get_u64_opt(const boost::json::object& obj, const char* key, uint64_t default_value) {
    auto it = obj.find(key);
    if (it == obj.end()) return default_value;
    const auto& v = it->value();
    if (v.is_uint64()) return v.as_uint64();
    if (v.is_int64()) return static_cast<uint64_t>(v.as_int64());
    if (v.is_string()) {
        try {
            return static_cast<uint64_t>(std::stoull(std::string(v.as_string().c_str())));
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

// ============================================================================
// Environment variable helpers
// ============================================================================

// Get an environment variable as uint64_t (returns default if not set or invalid)
inline uint64_t env_u64(const char* key, uint64_t default_value) {
    if (const char* v = std::getenv(key)) {
        try {
            return static_cast<uint64_t>(std::stoull(v));
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

// Check if an environment variable is set to "1"
inline bool env_flag(const char* key) {
    if (const char* v = std::getenv(key)) {
        return std::string(v) == "1";
    }
    return false;
}

// ============================================================================
// File I/O
// ============================================================================

// Read entire file contents into a string
inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace lc
