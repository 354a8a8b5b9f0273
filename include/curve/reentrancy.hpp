// Non-reentrant guard scoped to one curve instance
#pragma once

#include <atomic>
#include <mutex>
#include <thread>

#include "curve/errors.hpp"

namespace lc {
namespace curve {

// Re-entry from the thread already inside the curve fails immediately with
// reentrancy_error. Calls from other threads wait their turn, which gives the
// per-instance serialization the curve relies on.
class ReentrancyGuard {
public:
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& g) : g_(g) {
            if (g_.owner_.load() == std::this_thread::get_id()) {
                throw reentrancy_error();
            }
            g_.mu_.lock();
            g_.owner_.store(std::this_thread::get_id());
        }

        ~Scope() {
            g_.owner_.store(std::thread::id());
            g_.mu_.unlock();
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& g_;
    };

private:
    std::mutex mu_;
    std::atomic<std::thread::id> owner_{};
};

} // namespace curve
} // namespace lc
