/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/launcher.hpp>
#include <mpvctl/logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include <fmt/core.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#endif

namespace mpvctl::launcher {

    namespace {
#ifndef _WIN32
        constexpr long kMaxCloseFd = 65536;

        int open_error_pipe(int fds[2]) {
#ifdef __linux__
            return pipe2(fds, O_CLOEXEC);
#else
            if (pipe(fds) != 0) return -1;
            fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            fcntl(fds[1], F_SETFD, FD_CLOEXEC);
            return 0;
#endif
        }
#endif

        // Shortest round-trip form: 30 -> "30", 1.25 -> "1.25".
        std::string fmt_seconds(double v) {
            return fmt::format("{}", v);
        }
    }

    std::vector<std::string> build_args(const std::string &ipc_arg, const std::string &url,
                                        const PlayOptions &opts, const LaunchFlags &flags) {
        std::vector<std::string> args = {
            ipc_arg,
            "--idle=yes", // keep running after the stream ends
            "--no-ytdl",  // direct streams only, no youtube-dl hook
        };

        if (!flags.load_user_config) args.emplace_back("--no-config");
        if (!flags.debug) args.emplace_back("--msg-level=all=warn");

        if (opts.start_time.count() > 0) args.push_back("--start=" + fmt_seconds(opts.start_time.count()));
        if (opts.volume) args.push_back(fmt::format("--volume={}", std::clamp(*opts.volume, 0, 100)));
        if (opts.speed > 0) args.push_back("--speed=" + fmt_seconds(opts.speed));
        if (opts.fullscreen) args.emplace_back("--fullscreen");

        if (!opts.subtitle_url.empty()) args.push_back("--sub-file=" + opts.subtitle_url);
        if (!opts.subtitle_lang.empty()) args.push_back("--slang=" + opts.subtitle_lang);
        if (opts.subtitle_delay.count() > 0) args.push_back("--sub-delay=" + fmt_seconds(opts.subtitle_delay.count()));

        if (opts.audio_track > 0) args.push_back(fmt::format("--aid={}", opts.audio_track));

        args.push_back("--user-agent=" + (opts.user_agent.empty() ? std::string(DEFAULT_USER_AGENT) : opts.user_agent));

        if (!opts.referer.empty()) args.push_back("--referrer=" + opts.referer);

        // User-Agent and Referer already have dedicated flags
        std::string headers;
        for (const auto &kv : opts.headers) {
            if (kv.first == "User-Agent" || kv.first == "Referer") continue;
            if (!headers.empty()) headers += ",";
            headers += kv.first + ": " + kv.second;
        }
        if (!headers.empty()) args.push_back("--http-header-fields=" + headers);

        if (!opts.title.empty()) args.push_back("--force-media-title=" + opts.title);

        args.insert(args.end(), opts.mpv_args.begin(), opts.mpv_args.end());

        args.push_back(url);
        return args;
    }

    std::string ExitStatus::describe() const {
        if (signaled) return fmt::format("killed by signal {}", signal);
        if (exited) return fmt::format("exit status {}", code);
        return "unknown exit status";
    }

#ifndef _WIN32

    /**
     * Waits with WNOWAIT first so that kill() can never target a pid that
     * was already reaped and possibly reused.
     */
    class PosixProcess : public Process {
    public:
        explicit PosixProcess(pid_t pid) : pid_(pid), reaped_(false) {}

        long pid() const override { return (long)pid_; }

        void kill() override {
            std::lock_guard<std::mutex> lk(mtx_);
            if (reaped_ || pid_ <= 0) return;
            if (::kill(pid_, SIGKILL) == 0) {
                LOG_PROC_DEBUG("sent SIGKILL to pid={}", (int)pid_);
            }
        }

        ExitStatus wait() override {
            ExitStatus st;
            if (pid_ <= 0) return st;

            siginfo_t info{};
            while (waitid(P_PID, (id_t)pid_, &info, WEXITED | WNOWAIT) != 0) {
                if (errno != EINTR) {
                    LOG_PROC_WARN("waitid pid={} failed: {}", (int)pid_, strerror(errno));
                    break;
                }
            }

            std::lock_guard<std::mutex> lk(mtx_);
            if (reaped_) return st;
            int status = 0;
            pid_t r;
            do {
                r = waitpid(pid_, &status, 0);
            } while (r < 0 && errno == EINTR);
            reaped_ = true;
            if (r == pid_) {
                if (WIFEXITED(status)) {
                    st.exited = true;
                    st.code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    st.signaled = true;
                    st.signal = WTERMSIG(status);
                }
            }
            LOG_PROC_INFO("player process pid={} reaped: {}", (int)pid_, st.describe());
            return st;
        }

        bool reaped() const override {
            std::lock_guard<std::mutex> lk(mtx_);
            return reaped_;
        }

    private:
        pid_t pid_;
        mutable std::mutex mtx_;
        bool reaped_;
    };

    Error SystemProcessSpawner::spawn(const std::string &executable, const std::vector<std::string> &args,
                                      std::shared_ptr<Process> &out) {
        // argv is assembled before fork(): the child only runs async-signal-safe calls
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0 || max_fd > kMaxCloseFd) max_fd = kMaxCloseFd;

        int errpipe[2];
        if (open_error_pipe(errpipe) != 0) {
            return Error(ErrorCode::SpawnFailed, fmt::format("pipe creation failed: {}", strerror(errno)));
        }

        pid_t pid = fork();
        if (pid < 0) {
            int e = errno;
            close(errpipe[0]);
            close(errpipe[1]);
            return Error(ErrorCode::SpawnFailed, fmt::format("fork failed: {}", strerror(e)));
        }
        if (pid == 0) {
            close(errpipe[0]);
            setpgid(0, 0);
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) close(devnull);
            }
            // nothing the controller holds open survives into the player
            for (int fd = STDERR_FILENO + 1; fd < (int)max_fd; ++fd) {
                if (fd != errpipe[1]) close(fd);
            }
            execvp(executable.c_str(), argv.data());
            int e = errno;
            ssize_t ignored = write(errpipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        close(errpipe[1]);
        int child_errno = 0;
        ssize_t n;
        do {
            n = read(errpipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close(errpipe[0]);

        if (n == (ssize_t)sizeof(child_errno)) {
            int status = 0;
            waitpid(pid, &status, 0);
            return Error(ErrorCode::SpawnFailed,
                         fmt::format("failed to start {}: {}", executable, strerror(child_errno)));
        }

        LOG_PROC_INFO("player started: cmd='{}' pid={} args={}", executable, (int)pid, args.size());
        out = std::make_shared<PosixProcess>(pid);
        return Error();
    }

#else

    std::string quote_command_line(const std::string &executable, const std::vector<std::string> &args) {
        auto quote = [](const std::string &a) {
            if (!a.empty() && a.find_first_of(" \t\n\v\"") == std::string::npos) return a;
            std::string q = "\"";
            size_t backslashes = 0;
            for (char c : a) {
                if (c == '\\') {
                    ++backslashes;
                } else if (c == '"') {
                    q.append(backslashes * 2 + 1, '\\');
                    q.push_back('"');
                    backslashes = 0;
                } else {
                    q.append(backslashes, '\\');
                    q.push_back(c);
                    backslashes = 0;
                }
            }
            q.append(backslashes * 2, '\\');
            q.push_back('"');
            return q;
        };
        std::string cmdline = quote(executable);
        for (const auto &a : args) {
            cmdline += " ";
            cmdline += quote(a);
        }
        return cmdline;
    }

    class WinProcess : public Process {
    public:
        explicit WinProcess(PROCESS_INFORMATION pi) : pi_(pi), reaped_(false) {}

        ~WinProcess() override {
            if (pi_.hProcess) CloseHandle(pi_.hProcess);
            if (pi_.hThread) CloseHandle(pi_.hThread);
        }

        long pid() const override { return (long)pi_.dwProcessId; }

        void kill() override {
            std::lock_guard<std::mutex> lk(mtx_);
            if (reaped_ || !pi_.hProcess) return;
            if (TerminateProcess(pi_.hProcess, 1)) {
                LOG_PROC_DEBUG("terminated pid={}", (unsigned long)pi_.dwProcessId);
            }
        }

        ExitStatus wait() override {
            ExitStatus st;
            if (!pi_.hProcess) return st;
            WaitForSingleObject(pi_.hProcess, INFINITE);
            std::lock_guard<std::mutex> lk(mtx_);
            DWORD code = 0;
            if (GetExitCodeProcess(pi_.hProcess, &code)) {
                st.exited = true;
                st.code = (int)code;
            }
            reaped_ = true;
            LOG_PROC_INFO("player process pid={} exited: {}", (unsigned long)pi_.dwProcessId, st.describe());
            return st;
        }

        bool reaped() const override {
            std::lock_guard<std::mutex> lk(mtx_);
            return reaped_;
        }

    private:
        PROCESS_INFORMATION pi_;
        mutable std::mutex mtx_;
        bool reaped_;
    };

    Error SystemProcessSpawner::spawn(const std::string &executable, const std::vector<std::string> &args,
                                      std::shared_ptr<Process> &out) {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        HANDLE nul = CreateFileA("NUL", GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                 &sa, OPEN_EXISTING, 0, nullptr);

        std::string cmdline = quote_command_line(executable, args);

        STARTUPINFOA si{};
        si.cb = sizeof(si);
        if (nul != INVALID_HANDLE_VALUE) {
            si.hStdInput = nul;
            si.hStdOutput = nul;
            si.hStdError = nul;
            si.dwFlags = STARTF_USESTDHANDLES;
        }

        PROCESS_INFORMATION pi{};
        BOOL ok = CreateProcessA(
            nullptr,
            &cmdline[0],
            nullptr, nullptr, nul != INVALID_HANDLE_VALUE, CREATE_NEW_PROCESS_GROUP, nullptr, nullptr, &si, &pi
        );
        DWORD err = GetLastError();
        if (nul != INVALID_HANDLE_VALUE) CloseHandle(nul);
        if (!ok) {
            return Error(ErrorCode::SpawnFailed, fmt::format("CreateProcess failed for {} (err={})", executable, err));
        }

        LOG_PROC_INFO("player started (Windows): cmd='{}' pid={}", executable, (unsigned long)pi.dwProcessId);
        out = std::make_shared<WinProcess>(pi);
        return Error();
    }

#endif

    Error launch(ProcessSpawner &spawner, const std::string &executable, const std::vector<std::string> &args,
                 std::chrono::milliseconds spawn_grace, std::shared_ptr<Process> &out) {
        std::shared_ptr<Process> proc;
        Error err = spawner.spawn(executable, args, proc);
        if (err) return err;
        if (!proc) return Error(ErrorCode::SpawnFailed, fmt::format("{} did not start", executable));

        std::this_thread::sleep_for(spawn_grace);
        if (proc->pid() <= 0) {
            return Error(ErrorCode::SpawnFailed, fmt::format("{} process failed to start", executable));
        }
        out = std::move(proc);
        return Error();
    }

} // namespace mpvctl::launcher
