/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/mpv_player.hpp>
#include <mpvctl/logger.hpp>
#include <mpvctl/progress.hpp>
#include <mpvctl/readiness.hpp>

#include <fmt/core.h>

namespace mpvctl::player {

    using launcher::Process;
    using transport::TransportConfig;
    using transport::TransportKind;

    const char *state_name(PlaybackState s) {
        switch (s) {
            case PlaybackState::Stopped: return "stopped";
            case PlaybackState::Loading: return "loading";
            case PlaybackState::Playing: return "playing";
            case PlaybackState::Paused: return "paused";
            case PlaybackState::Error: return "error";
        }
        return "unknown";
    }

    MpvPlayer::MpvPlayer(config::PlayerConfig cfg)
        : cfg_(std::move(cfg)),
          owned_spawner_(new launcher::SystemProcessSpawner()),
          env_(&SystemEnvironment::instance()),
          spawner_(owned_spawner_.get()),
          connector_(std::make_shared<ipc::MpvIpcConnector>(cfg_.connect_timeout, cfg_.request_timeout)),
          state_(PlaybackState::Stopped), session_(0), stop_consumed_(true),
          callbacks_(std::make_shared<CallbackTable>()) {
        init_platform();
    }

    MpvPlayer::MpvPlayer(config::PlayerConfig cfg, Environment &env, launcher::ProcessSpawner &spawner,
                         std::shared_ptr<ipc::IpcConnector> connector)
        : cfg_(std::move(cfg)),
          env_(&env),
          spawner_(&spawner),
          connector_(std::move(connector)),
          state_(PlaybackState::Stopped), session_(0), stop_consumed_(true),
          callbacks_(std::make_shared<CallbackTable>()) {
        init_platform();
    }

    MpvPlayer::~MpvPlayer() {
        {
            std::unique_lock<std::shared_mutex> lk(mtx_);
            stop_locked();
        }
        join_workers();
    }

    void MpvPlayer::init_platform() {
        platform_ = platform::resolve(*env_);
        LOG_PLAYER_DEBUG("Platform resolved: {} (wsl policy {})", platform::platform_name(platform_),
                         cfg_.wsl_policy == platform::WslPolicy::WindowsBinary ? "windows" : "linux");
    }

    Error MpvPlayer::create(const config::PlayerConfig &cfg, std::unique_ptr<MpvPlayer> &out) {
        std::unique_ptr<MpvPlayer> p(new MpvPlayer(cfg));
        std::string exe;
        Error err = platform::find_executable(*p->env_, p->platform_, cfg.wsl_policy, exe);
        if (err) return err;
        LOG_PLAYER_INFO("Using player binary {}", exe);
        out = std::move(p);
        return Error();
    }

    Error MpvPlayer::play(const Context &ctx, const std::string &url, const PlayOptions &options) {
        if (url.empty()) return Error(ErrorCode::InvalidArgument, "empty url");

        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (state_ != PlaybackState::Stopped) {
            LOG_PLAYER_INFO("Stopping previous session {} before new playback", session_);
            stop_locked();
        }

        std::string exe;
        Error err = platform::find_executable(*env_, platform_, cfg_.wsl_policy, exe);
        if (err) return err;

        TransportConfig tc;
        err = transport::generate_address(platform_, cfg_.wsl_policy, *env_, cfg_.app_name, tc);
        if (err) return err;

        launcher::LaunchFlags flags;
        flags.load_user_config = cfg_.load_user_config;
        flags.debug = cfg_.debug;
        std::vector<std::string> args = launcher::build_args(transport::ipc_argument(tc), url, options, flags);

        std::shared_ptr<Process> proc;
        err = launcher::launch(*spawner_, exe, args, cfg_.spawn_grace, proc);
        if (err) {
            transport::release(tc, *env_);
            return err;
        }

        ++session_;
        stop_consumed_ = false;
        state_ = PlaybackState::Loading;
        transport_ = tc;
        process_ = proc;
        url_ = url;
        options_ = options;
        cancel_ = CancelToken::background();

        uint64_t session = session_;
        Context session_cancel = cancel_;
        LOG_PLAYER_INFO("Session {}: started {} pid={} ipc={} ({})", session, exe, proc->pid(), tc.address,
                        transport::kind_name(tc.kind));

        spawn_worker([this, session, proc]() { monitor_process(session, proc); });
        spawn_worker([this, session, ctx, tc, session_cancel]() {
            async_initialize(session, ctx, tc, session_cancel);
        });
        return Error();
    }

    Error MpvPlayer::stop(const Context &) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        stop_locked();
        return Error();
    }

    void MpvPlayer::stop_session(uint64_t session) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (session != session_) return;
        stop_locked();
    }

    void MpvPlayer::stop_locked() {
        if (stop_consumed_ || state_ == PlaybackState::Stopped) return;
        stop_consumed_ = true;
        PlaybackState prev = state_;
        state_ = PlaybackState::Stopped;

        if (cancel_) cancel_->cancel();

        std::shared_ptr<ipc::IpcClient> client = std::move(client_);
        client_.reset();
        if (client) {
            auto wait = cfg_.quit_wait;
            spawn_worker([client, wait]() {
                Error qerr = client->quit(wait);
                if (qerr) LOG_IPC_DEBUG("quit not acknowledged: {}", qerr.describe());
                client->close();
            });
        }

        if (process_) {
            process_->kill();
            process_.reset();
        }

        std::string address = transport_.address;
        transport::release(transport_, *env_);
        url_.clear();
        options_ = PlayOptions();

        LOG_PLAYER_INFO("Session {}: stopped (was {}), released {}", session_, state_name(prev),
                        address.empty() ? "-" : address);
    }

    void MpvPlayer::async_initialize(uint64_t session, Context ctx, TransportConfig tc, Context session_cancel) {
        transport::ProbeTimings timings = cfg_.probe_timings();
        Context init_ctx = CancelToken::with_timeout(CancelToken::linked(ctx, session_cancel), cfg_.init_timeout);

        std::unique_ptr<transport::ReadinessProbe> probe = transport::make_probe(tc, *env_, timings);
        Error err = transport::wait_ready(*probe, timings, init_ctx);
        if (session_cancel->cancelled()) return;
        if (err) {
            if (tc.kind == TransportKind::NamedPipe) {
                err.message = fmt::format("failed to connect to mpv (timeout waiting for named pipe: {}): {}\n"
                                          "This may indicate mpv.exe failed to start or lacks permissions",
                                          tc.address, err.message);
            } else {
                err.message = fmt::format("timeout waiting for mpv IPC at {}: {}", tc.address, err.message);
            }
            fail_initialize(session, tc, err);
            return;
        }
        LOG_IPC_DEBUG("Session {}: endpoint {} ready", session, tc.address);

        std::shared_ptr<ipc::IpcClient> client;
        err = connector_->connect(tc, client);
        if (session_cancel->cancelled()) {
            if (client) client->close();
            return;
        }
        if (err) {
            Error failure(ErrorCode::ConnectFailed, "");
            if (tc.kind == TransportKind::NamedPipe) {
                failure.message = fmt::format("failed to connect to mpv IPC (Windows named pipe: {}): {}\n"
                                              "Make sure mpv.exe is properly installed and in PATH",
                                              tc.address, err.message);
            } else {
                failure.message = fmt::format("failed to connect to mpv IPC at {}: {}", tc.address, err.message);
            }
            fail_initialize(session, tc, failure);
            return;
        }

        {
            std::unique_lock<std::shared_mutex> lk(mtx_);
            if (session == session_ && !stop_consumed_) {
                client_ = client;
                state_ = PlaybackState::Playing;
                LOG_PLAYER_INFO("Session {}: playing {}", session, url_);
                spawn_worker([this, session, session_cancel]() { monitor_progress(session, session_cancel); });
                return;
            }
        }
        client->close();
    }

    void MpvPlayer::fail_initialize(uint64_t session, const TransportConfig &tc, const Error &cause) {
        {
            std::unique_lock<std::shared_mutex> lk(mtx_);
            if (session != session_ || stop_consumed_) return;
            if (process_) process_->kill();
            transport::release(transport_, *env_);
            state_ = PlaybackState::Error;
        }
        LOG_PLAYER_ERROR("Session {}: initialization failed on {}: {}", session, tc.address, cause.describe());
        emit_error(session, cause);
    }

    void MpvPlayer::monitor_progress(uint64_t session, Context session_cancel) {
        LOG_PLAYER_DEBUG("Session {}: progress monitor started", session);
        while (session_cancel->sleep_for(cfg_.progress_interval)) {
            std::shared_ptr<ipc::IpcClient> client;
            {
                std::shared_lock<std::shared_mutex> lk(mtx_);
                if (session != session_ || stop_consumed_) break;
                client = client_;
            }
            if (!client) break;

            PlaybackProgress p;
            Error err = fetch_progress(*client, p);
            if (err) {
                if (err.code != ErrorCode::DeadTransport) {
                    LOG_PLAYER_DEBUG("Session {}: progress tick skipped: {}", session, err.describe());
                    continue;
                }
                // The exit monitor usually notices a dead player first.
                if (!session_cancel->sleep_for(cfg_.probe_interval)) break;
                LOG_PLAYER_WARN("Session {}: {}", session, err.message);
                emit_error(session, Error(ErrorCode::DeadTransport, "mpv IPC error: " + err.message));
                stop_session(session);
                break;
            }

            {
                std::unique_lock<std::shared_mutex> lk(mtx_);
                if (session == session_) {
                    if (state_ == PlaybackState::Playing && p.paused) state_ = PlaybackState::Paused;
                    else if (state_ == PlaybackState::Paused && !p.paused) state_ = PlaybackState::Playing;
                }
            }
            emit_progress(session, p);

            if (p.eof) {
                LOG_PLAYER_INFO("Session {}: end of file", session);
                emit_end(session);
                break;
            }
        }
        LOG_PLAYER_DEBUG("Session {}: progress monitor exiting", session);
    }

    void MpvPlayer::monitor_process(uint64_t session, std::shared_ptr<Process> process) {
        launcher::ExitStatus st = process->wait();

        bool unexpected = false;
        {
            std::shared_lock<std::shared_mutex> lk(mtx_);
            unexpected = session == session_ && !stop_consumed_ &&
                         state_ != PlaybackState::Stopped && state_ != PlaybackState::Error;
        }
        LOG_PROC_INFO("Session {}: mpv pid={} {}", session, process->pid(), st.describe());
        if (unexpected) {
            emit_error(session, Error(ErrorCode::ProcessExited, "mpv process exited unexpectedly: " + st.describe()));
        }
        stop_session(session);
    }

    Error MpvPlayer::get_progress(const Context &, PlaybackProgress &out) {
        std::shared_ptr<ipc::IpcClient> client;
        {
            std::shared_lock<std::shared_mutex> lk(mtx_);
            if (state_ == PlaybackState::Stopped) return Error(ErrorCode::NotRunning, "player is stopped");
            client = client_;
        }
        if (!client) return Error(ErrorCode::NotInitialized, "player not initialized");

        Error err = fetch_progress(*client, out);
        if (err) err.message = "mpv IPC error: " + err.message;
        return err;
    }

    Error MpvPlayer::seek(const Context &, Seconds position) {
        std::shared_ptr<ipc::IpcClient> client;
        {
            std::shared_lock<std::shared_mutex> lk(mtx_);
            client = client_;
        }
        if (!client) return Error(ErrorCode::NotInitialized, "player not initialized");

        Error err = client->set_property("time-pos", position.count());
        if (err) err.message = "failed to seek: " + err.message;
        return err;
    }

    Error MpvPlayer::set_pause(bool paused) {
        std::shared_ptr<ipc::IpcClient> client;
        {
            std::shared_lock<std::shared_mutex> lk(mtx_);
            client = client_;
        }
        if (!client) return Error(ErrorCode::NotInitialized, "player not initialized");

        Error err = client->set_property("pause", paused);
        if (err) {
            err.message = fmt::format("failed to {}: {}", paused ? "pause" : "resume", err.message);
            return err;
        }

        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (client_ == client) {
            if (paused && state_ == PlaybackState::Playing) state_ = PlaybackState::Paused;
            else if (!paused && state_ == PlaybackState::Paused) state_ = PlaybackState::Playing;
        }
        return Error();
    }

    Error MpvPlayer::pause(const Context &) { return set_pause(true); }
    Error MpvPlayer::resume(const Context &) { return set_pause(false); }

    bool MpvPlayer::is_playing() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return state_ == PlaybackState::Playing;
    }

    bool MpvPlayer::is_paused() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return state_ == PlaybackState::Paused;
    }

    PlaybackState MpvPlayer::state() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return state_;
    }

    std::string MpvPlayer::current_url() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return url_;
    }

    TransportConfig MpvPlayer::current_transport() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return transport_;
    }

    /*
     * Callback slots. Each registration gets a token; the returned
     * Subscription only clears the slot while it still holds that token.
     */

    template<typename Cb>
    static Subscription register_slot(const std::shared_ptr<void> &owner, std::mutex &mtx, uint64_t &seq,
                                      uint64_t &slot_token, Cb &slot_cb, Cb cb) {
        uint64_t token;
        {
            std::lock_guard<std::mutex> lk(mtx);
            token = ++seq;
            slot_token = token;
            slot_cb = std::move(cb);
        }
        std::weak_ptr<void> weak = owner;
        return Subscription([weak, &mtx, &slot_token, &slot_cb, token]() {
            std::shared_ptr<void> alive = weak.lock();
            if (!alive) return;
            std::lock_guard<std::mutex> lk(mtx);
            if (slot_token == token) {
                slot_token = 0;
                slot_cb = nullptr;
            }
        });
    }

    Subscription MpvPlayer::on_progress_update(ProgressCallback cb) {
        CallbackTable &t = *callbacks_;
        return register_slot(callbacks_, t.mtx, t.seq, t.progress.token, t.progress.cb, std::move(cb));
    }

    Subscription MpvPlayer::on_playback_end(EndCallback cb) {
        CallbackTable &t = *callbacks_;
        return register_slot(callbacks_, t.mtx, t.seq, t.end.token, t.end.cb, std::move(cb));
    }

    Subscription MpvPlayer::on_error(ErrorCallback cb) {
        CallbackTable &t = *callbacks_;
        return register_slot(callbacks_, t.mtx, t.seq, t.error.token, t.error.cb, std::move(cb));
    }

    bool MpvPlayer::is_current(uint64_t session) const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return session == session_;
    }

    void MpvPlayer::emit_progress(uint64_t session, const PlaybackProgress &p) {
        if (!is_current(session)) return;
        PlayerEvent ev;
        ev.type = EventType::Progress;
        ev.session = session;
        ev.progress = p;
        events_.post(ev);

        ProgressCallback cb;
        {
            std::lock_guard<std::mutex> lk(callbacks_->mtx);
            cb = callbacks_->progress.cb;
        }
        if (cb) cb(p);
    }

    void MpvPlayer::emit_end(uint64_t session) {
        if (!is_current(session)) return;
        PlayerEvent ev;
        ev.type = EventType::PlaybackEnd;
        ev.session = session;
        events_.post(ev);

        EndCallback cb;
        {
            std::lock_guard<std::mutex> lk(callbacks_->mtx);
            cb = callbacks_->end.cb;
        }
        if (cb) cb();
    }

    void MpvPlayer::emit_error(uint64_t session, const Error &err) {
        if (!is_current(session)) return;
        PlayerEvent ev;
        ev.type = EventType::Error;
        ev.session = session;
        ev.error = err;
        events_.post(ev);

        ErrorCallback cb;
        {
            std::lock_guard<std::mutex> lk(callbacks_->mtx);
            cb = callbacks_->error.cb;
        }
        if (cb) cb(err);
    }

    void MpvPlayer::spawn_worker(std::function<void()> fn) {
        std::vector<std::thread> finished;
        std::lock_guard<std::mutex> lk(workers_mtx_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(it->th));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto &t : finished) t.join();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread th([fn = std::move(fn), done]() {
            fn();
            done->store(true);
        });
        workers_.push_back(Worker{std::move(th), done});
    }

    void MpvPlayer::join_workers() {
        for (;;) {
            std::vector<Worker> batch;
            {
                std::lock_guard<std::mutex> lk(workers_mtx_);
                if (workers_.empty()) return;
                batch.swap(workers_);
            }
            for (auto &w : batch) {
                if (w.th.joinable()) w.th.join();
            }
        }
    }

} // namespace mpvctl::player
