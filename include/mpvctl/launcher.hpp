/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_LAUNCHER_HPP
#define MPVCTL_LAUNCHER_HPP

#pragma once

#include <mpvctl/errors.hpp>
#include <mpvctl/player.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace mpvctl::launcher {

    using player::PlayOptions;

    constexpr const char *DEFAULT_USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    struct LaunchFlags {
        bool load_user_config = false; // drop --no-config
        bool debug = false;            // drop --msg-level=all=warn
    };

    /**
     * @brief Builds the player argument vector (without argv[0]).
     *
     * Order: IPC flag, --idle=yes, --no-ytdl, [--no-config], [--msg-level],
     * option flags, options.mpv_args verbatim, url last.
     */
    std::vector<std::string> build_args(const std::string &ipc_arg, const std::string &url,
                                        const PlayOptions &opts, const LaunchFlags &flags);

    struct ExitStatus {
        bool exited = false;   // normal exit, `code` valid
        int code = 0;
        bool signaled = false; // killed by `signal`
        int signal = 0;

        std::string describe() const;
    };

    /**
     * @brief Handle to a spawned child process.
     *
     * wait() is meant to be called by exactly one owner; kill() may be called
     * from any thread and is a no-op once the child has been reaped.
     */
    class Process {
    public:
        virtual ~Process() = default;

        /// OS process id, 0 when none was assigned.
        virtual long pid() const = 0;
        virtual void kill() = 0;
        virtual ExitStatus wait() = 0;
        virtual bool reaped() const = 0;
    };

    class ProcessSpawner {
    public:
        virtual ~ProcessSpawner() = default;

        /**
         * @brief Starts `executable` detached from the controlling terminal.
         *
         * stdin/stdout/stderr go to the null device and the child gets its own
         * process group so that terminal interrupts aimed at us do not reach it.
         */
        virtual Error spawn(const std::string &executable, const std::vector<std::string> &args,
                            std::shared_ptr<Process> &out) = 0;
    };

    class SystemProcessSpawner : public ProcessSpawner {
    public:
        Error spawn(const std::string &executable, const std::vector<std::string> &args,
                    std::shared_ptr<Process> &out) override;
    };

    /**
     * @brief spawn() followed by a short grace period and a pid re-check.
     * @return SpawnFailed if spawning failed or no pid was assigned.
     */
    Error launch(ProcessSpawner &spawner, const std::string &executable, const std::vector<std::string> &args,
                 std::chrono::milliseconds spawn_grace, std::shared_ptr<Process> &out);

#ifdef _WIN32
    /// Joins argv into a CreateProcess command line with MSVCRT quoting rules.
    std::string quote_command_line(const std::string &executable, const std::vector<std::string> &args);
#endif

} // namespace mpvctl::launcher

#endif // MPVCTL_LAUNCHER_HPP
