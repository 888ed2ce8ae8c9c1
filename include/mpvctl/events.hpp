/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_EVENTS_HPP
#define MPVCTL_EVENTS_HPP

#pragma once

#include <mpvctl/errors.hpp>
#include <mpvctl/player.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace mpvctl::player {

    enum class EventType {
        Progress,
        PlaybackEnd,
        Error
    };

    struct PlayerEvent {
        EventType type = EventType::Progress;
        uint64_t session = 0;        // generation of the session that produced it
        PlaybackProgress progress;   // valid for Progress
        mpvctl::Error error;         // valid for Error
    };

    /**
     * @brief Bounded FIFO of player notifications drained by the owning controller.
     *
     * When full, the oldest event is dropped.
     */
    class EventChannel {
    public:
        explicit EventChannel(size_t capacity = 256);

        void post(PlayerEvent ev);

        /// @return false on timeout.
        bool wait_next(std::chrono::milliseconds timeout, PlayerEvent &out);
        bool try_next(PlayerEvent &out);

        size_t size() const;
        uint64_t dropped() const;

    private:
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<PlayerEvent> queue_;
        size_t capacity_;
        uint64_t dropped_;
    };

} // namespace mpvctl::player

#endif // MPVCTL_EVENTS_HPP
