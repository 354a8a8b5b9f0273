// Common utilities: io_mu, console logging, differs_rel
#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <string>

namespace lc {

// Global mutex for synchronized console output
inline std::mutex io_mu;

// Progress line to stdout
inline void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(io_mu);
    std::cout << msg << "\n";
}

// Warning line to stderr
inline void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(io_mu);
    std::cerr << "Warning: " << msg << "\n";
}

// Relative difference check for floating-point comparison
// Returns true if values differ by more than rel * max(1, max(|a|, |b|))
template <typename T>
inline bool differs_rel(T a, T b, T rel = T(1e-12), T abs_eps = T(0)) {
    const T da    = std::abs(a - b);
    const T scale = std::max<T>(T(1), std::max(std::abs(a), std::abs(b)));
    return da > std::max(abs_eps, rel * scale);
}

} // namespace lc
