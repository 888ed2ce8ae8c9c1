/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_CANCEL_HPP
#define MPVCTL_CANCEL_HPP

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace mpvctl {

    class CancelToken;
    using Context = std::shared_ptr<CancelToken>;

    /**
     * @brief Cancellation signal with optional deadline and parent.
     *
     * A token is cancelled when cancel() was called on it, when its deadline
     * passed, or when any parent is cancelled. sleep_for() wakes early on
     * cancel() of this token and notices parent cancellation within one
     * poll slice.
     */
    class CancelToken {
    public:
        using Clock = std::chrono::steady_clock;

        static Context background();
        static Context with_timeout(const Context &parent, std::chrono::milliseconds timeout);
        /// Cancelled as soon as either a or b is. Null contexts are ignored.
        static Context linked(const Context &a, const Context &b);

        void cancel();
        bool cancelled() const;
        bool deadline_exceeded() const;

        /// @return false when the token got cancelled before the duration elapsed.
        bool sleep_for(std::chrono::milliseconds d);

    private:
        CancelToken(std::vector<Context> parents, Clock::time_point deadline, bool has_deadline);

        std::vector<Context> parents_;
        Clock::time_point deadline_;
        bool has_deadline_;
        std::atomic<bool> cancelled_;
        std::mutex mtx_;
        std::condition_variable cv_;
    };

} // namespace mpvctl

#endif // MPVCTL_CANCEL_HPP
