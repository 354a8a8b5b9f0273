// Notification sink seam and the recording event hub
#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <vector>

#include <boost/json.hpp>

#include "core/numeric_types.hpp"
#include "events/types.hpp"

namespace lc {
namespace events {

// Fire-and-forget notification collaborator.
// Implementations may throw (e.g. unauthorized emitter); callers treat delivery as best-effort.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void publish(const Address& emitter, const Event& ev) = 0;
};

// Hub notifications go through the platform event hub and need an authorized emitter;
// curve-local notifications are the curve's own log.
inline bool is_hub_event(const Event& ev) {
    return std::holds_alternative<TokenTraded>(ev)
        || std::holds_alternative<PlatformFeeCollected>(ev)
        || std::holds_alternative<LargePurchaseAttempted>(ev)
        || std::holds_alternative<TokenGraduated>(ev);
}

// EventRecorder: event hub that keeps an ordered log of everything delivered.
// Thread-safe so scenarios running in parallel may share one hub.
class EventRecorder : public EventSink {
public:
    EventRecorder() = default;
    explicit EventRecorder(bool enabled) : enabled_(enabled) {}

    void authorize(const Address& emitter, bool allowed = true);
    bool is_authorized(const Address& emitter) const;

    void publish(const Address& emitter, const Event& ev) override;

    // Disabled hubs still enforce authorization but keep no log
    bool enabled() const { return enabled_; }

    // Copy of recorded events
    std::vector<Event> events() const;

    std::size_t size() const;

    // Count of recorded events of one type
    template <typename E>
    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::size_t n = 0;
        for (const auto& ev : events_) {
            if (std::holds_alternative<E>(ev)) ++n;
        }
        return n;
    }

    boost::json::array to_json() const;

private:
    mutable std::mutex mu_;
    const bool enabled_{true};
    std::set<Address> authorized_;
    std::vector<Event> events_;
};

} // namespace events
} // namespace lc
