/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/cancel.hpp>

#include <algorithm>

namespace mpvctl {

    namespace {
        constexpr std::chrono::milliseconds kPollSlice{20};

        std::vector<Context> non_null(std::initializer_list<Context> list) {
            std::vector<Context> out;
            for (const auto &c : list) {
                if (c) out.push_back(c);
            }
            return out;
        }
    }

    CancelToken::CancelToken(std::vector<Context> parents, Clock::time_point deadline, bool has_deadline)
        : parents_(std::move(parents)), deadline_(deadline), has_deadline_(has_deadline), cancelled_(false) {}

    Context CancelToken::background() {
        return Context(new CancelToken({}, Clock::time_point{}, false));
    }

    Context CancelToken::with_timeout(const Context &parent, std::chrono::milliseconds timeout) {
        return Context(new CancelToken(non_null({parent}), Clock::now() + timeout, true));
    }

    Context CancelToken::linked(const Context &a, const Context &b) {
        return Context(new CancelToken(non_null({a, b}), Clock::time_point{}, false));
    }

    void CancelToken::cancel() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool CancelToken::deadline_exceeded() const {
        if (has_deadline_ && Clock::now() >= deadline_) return true;
        for (const auto &p : parents_) {
            if (p->deadline_exceeded()) return true;
        }
        return false;
    }

    bool CancelToken::cancelled() const {
        if (cancelled_.load()) return true;
        if (has_deadline_ && Clock::now() >= deadline_) return true;
        for (const auto &p : parents_) {
            if (p->cancelled()) return true;
        }
        return false;
    }

    bool CancelToken::sleep_for(std::chrono::milliseconds d) {
        auto until = Clock::now() + d;
        std::unique_lock<std::mutex> lk(mtx_);
        while (true) {
            if (cancelled()) return false;
            auto now = Clock::now();
            if (now >= until) return true;
            auto slice = std::min<Clock::duration>(until - now, kPollSlice);
            cv_.wait_for(lk, slice, [this] { return cancelled_.load(); });
        }
    }

} // namespace mpvctl
