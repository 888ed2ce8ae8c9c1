/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_PLAYER_HPP
#define MPVCTL_PLAYER_HPP

#pragma once

#include <mpvctl/cancel.hpp>
#include <mpvctl/errors.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mpvctl::player {

    using Seconds = std::chrono::duration<double>;

    /**
     * @brief Everything a single playback request asks of the player.
     *
     * Zero / empty fields mean "player default" and produce no flag. Volume
     * is emitted whenever it is set, 0 included.
     */
    struct PlayOptions {
        Seconds start_time{0};
        std::optional<int> volume; // 0-100, clamped
        double speed = 0.0;       // 1.0 = normal
        bool fullscreen = false;

        std::string subtitle_url;
        std::string subtitle_lang;
        Seconds subtitle_delay{0};

        int audio_track = 0;

        std::vector<std::string> mpv_args; // passed through verbatim

        std::map<std::string, std::string> headers;
        std::string referer;
        std::string user_agent;

        std::string title;
        int episode = 0;          // caller bookkeeping only
        int season = 0;
    };

    struct PlaybackProgress {
        Seconds current_time{0};
        Seconds duration{0};
        double percentage = 0.0;  // 0.0 - 100.0
        bool paused = false;
        int volume = 100;
        double speed = 1.0;
        bool eof = false;
    };

    enum class PlaybackState {
        Stopped,
        Loading,
        Playing,
        Paused,
        Error
    };

    const char *state_name(PlaybackState s);

    using ProgressCallback = std::function<void(const PlaybackProgress &)>;
    using EndCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const Error &)>;

    /**
     * @brief Owned registration of a callback slot.
     *
     * Destroying (or reset()-ing) the handle clears the slot unless a newer
     * registration already replaced it.
     */
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> release) : release_(std::move(release)) {}
        ~Subscription() { reset(); }

        Subscription(Subscription &&o) noexcept : release_(std::move(o.release_)) { o.release_ = nullptr; }
        Subscription &operator=(Subscription &&o) noexcept {
            if (this != &o) {
                reset();
                release_ = std::move(o.release_);
                o.release_ = nullptr;
            }
            return *this;
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (release_) {
                auto r = std::move(release_);
                release_ = nullptr;
                r();
            }
        }

        /// Keep the registration alive for the lifetime of the player.
        void detach() { release_ = nullptr; }

        bool active() const { return static_cast<bool>(release_); }

    private:
        std::function<void()> release_;
    };

    /**
     * @brief Uniform playback-control contract consumed by the application.
     */
    class Player {
    public:
        virtual ~Player() = default;

        virtual Error play(const Context &ctx, const std::string &url, const PlayOptions &options) = 0;
        virtual Error stop(const Context &ctx) = 0;

        virtual Error get_progress(const Context &ctx, PlaybackProgress &out) = 0;
        virtual Error seek(const Context &ctx, Seconds position) = 0;
        virtual Error pause(const Context &ctx) = 0;
        virtual Error resume(const Context &ctx) = 0;

        [[nodiscard]] virtual Subscription on_progress_update(ProgressCallback cb) = 0;
        [[nodiscard]] virtual Subscription on_playback_end(EndCallback cb) = 0;
        [[nodiscard]] virtual Subscription on_error(ErrorCallback cb) = 0;

        virtual bool is_playing() const = 0;
        virtual bool is_paused() const = 0;
        virtual PlaybackState state() const = 0;
    };

} // namespace mpvctl::player

#endif // MPVCTL_PLAYER_HPP
