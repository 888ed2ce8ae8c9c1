/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/events.hpp>
#include <mpvctl/logger.hpp>

namespace mpvctl::player {

    EventChannel::EventChannel(size_t capacity) : capacity_(capacity ? capacity : 1), dropped_(0) {}

    void EventChannel::post(PlayerEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
                LOG_PLAYER_TRACE("event channel full, dropped oldest event (total dropped {})", dropped_);
            }
            queue_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    bool EventChannel::wait_next(std::chrono::milliseconds timeout, PlayerEvent &out) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return !queue_.empty(); })) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool EventChannel::try_next(PlayerEvent &out) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t EventChannel::size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return queue_.size();
    }

    uint64_t EventChannel::dropped() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dropped_;
    }

} // namespace mpvctl::player
