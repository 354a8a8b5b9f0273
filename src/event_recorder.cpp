// Recording event hub - implementation
#include "events/sink.hpp"

#include <stdexcept>

#include "curve/errors.hpp"

namespace lc {
namespace events {

void EventRecorder::authorize(const Address& emitter, bool allowed) {
    if (emitter.empty()) {
        throw std::invalid_argument("EventHub: Invalid contract address");
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (allowed) {
        authorized_.insert(emitter);
    } else {
        authorized_.erase(emitter);
    }
}

bool EventRecorder::is_authorized(const Address& emitter) const {
    std::lock_guard<std::mutex> lock(mu_);
    return authorized_.count(emitter) != 0;
}

void EventRecorder::publish(const Address& emitter, const Event& ev) {
    std::lock_guard<std::mutex> lock(mu_);
    if (is_hub_event(ev) && authorized_.count(emitter) == 0) {
        throw curve::unauthorized("EventHub: Not authorized");
    }
    if (!enabled_) return;
    events_.push_back(ev);
}

std::vector<Event> EventRecorder::events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
}

std::size_t EventRecorder::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_.size();
}

boost::json::array EventRecorder::to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_to_json(events_);
}

} // namespace events
} // namespace lc
