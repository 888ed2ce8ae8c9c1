/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_MPV_PLAYER_HPP
#define MPVCTL_MPV_PLAYER_HPP

#pragma once

#include <mpvctl/cancel.hpp>
#include <mpvctl/config.hpp>
#include <mpvctl/environment.hpp>
#include <mpvctl/errors.hpp>
#include <mpvctl/events.hpp>
#include <mpvctl/ipc_client.hpp>
#include <mpvctl/launcher.hpp>
#include <mpvctl/platform.hpp>
#include <mpvctl/player.hpp>
#include <mpvctl/transport.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace mpvctl::player {

    /**
     * @brief Player implementation that supervises an external mpv process.
     *
     * play() spawns mpv with a fresh IPC endpoint and returns while the
     * session is still Loading; a background initializer waits for the
     * endpoint, connects the IPC client and moves to Playing. Two monitors
     * then run per session: a progress poller and a process-exit watcher,
     * the latter being the only code that reaps the child.
     *
     * Session state lives behind one reader/writer lock. Callbacks and
     * channel events are delivered from background threads with no lock held.
     */
    class MpvPlayer : public Player {
    public:
        /// Real OS collaborators (SystemEnvironment, SystemProcessSpawner, MpvIpcConnector).
        explicit MpvPlayer(config::PlayerConfig cfg);

        /// Injected collaborators; env and spawner must outlive the player.
        MpvPlayer(config::PlayerConfig cfg, Environment &env, launcher::ProcessSpawner &spawner,
                  std::shared_ptr<ipc::IpcConnector> connector);

        ~MpvPlayer() override;

        MpvPlayer(const MpvPlayer&) = delete;
        MpvPlayer& operator=(const MpvPlayer&) = delete;

        /**
         * @brief Builds a player after checking that the mpv binary is reachable.
         * @return ExecutableNotFound when it is not.
         */
        static Error create(const config::PlayerConfig &cfg, std::unique_ptr<MpvPlayer> &out);

        Error play(const Context &ctx, const std::string &url, const PlayOptions &options) override;
        Error stop(const Context &ctx) override;

        Error get_progress(const Context &ctx, PlaybackProgress &out) override;
        Error seek(const Context &ctx, Seconds position) override;
        Error pause(const Context &ctx) override;
        Error resume(const Context &ctx) override;

        [[nodiscard]] Subscription on_progress_update(ProgressCallback cb) override;
        [[nodiscard]] Subscription on_playback_end(EndCallback cb) override;
        [[nodiscard]] Subscription on_error(ErrorCallback cb) override;

        bool is_playing() const override;
        bool is_paused() const override;
        PlaybackState state() const override;

        /// Every notification is also queued here for the owning controller.
        EventChannel &events() { return events_; }

        platform::Platform platform() const { return platform_; }
        std::string current_url() const;
        transport::TransportConfig current_transport() const;

    private:
        template<typename Cb>
        struct Slot {
            uint64_t token = 0;
            Cb cb;
        };

        struct CallbackTable {
            std::mutex mtx;
            uint64_t seq = 0;
            Slot<ProgressCallback> progress;
            Slot<EndCallback> end;
            Slot<ErrorCallback> error;
        };

        struct Worker {
            std::thread th;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void init_platform();

        // Must be called with mtx_ held exclusively.
        void stop_locked();
        void stop_session(uint64_t session);

        void async_initialize(uint64_t session, Context ctx, transport::TransportConfig tc, Context session_cancel);
        void fail_initialize(uint64_t session, const transport::TransportConfig &tc, const Error &cause);
        void monitor_progress(uint64_t session, Context session_cancel);
        void monitor_process(uint64_t session, std::shared_ptr<launcher::Process> process);

        Error set_pause(bool paused);

        bool is_current(uint64_t session) const;
        void emit_progress(uint64_t session, const PlaybackProgress &p);
        void emit_end(uint64_t session);
        void emit_error(uint64_t session, const Error &err);

        void spawn_worker(std::function<void()> fn);
        void join_workers();

        config::PlayerConfig cfg_;
        std::unique_ptr<launcher::ProcessSpawner> owned_spawner_;
        Environment *env_;
        launcher::ProcessSpawner *spawner_;
        std::shared_ptr<ipc::IpcConnector> connector_;
        platform::Platform platform_;

        mutable std::shared_mutex mtx_;
        PlaybackState state_;
        uint64_t session_;         // generation, bumped by every successful play()
        bool stop_consumed_;       // teardown already ran for session_
        Context cancel_;
        transport::TransportConfig transport_;
        std::shared_ptr<launcher::Process> process_;
        std::shared_ptr<ipc::IpcClient> client_;
        std::string url_;
        PlayOptions options_;

        std::shared_ptr<CallbackTable> callbacks_;
        EventChannel events_;

        std::mutex workers_mtx_;
        std::vector<Worker> workers_;
    };

} // namespace mpvctl::player

#endif // MPVCTL_MPV_PLAYER_HPP
