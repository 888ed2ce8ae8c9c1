/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_PLATFORM_HPP
#define MPVCTL_PLATFORM_HPP

#pragma once

#include <mpvctl/environment.hpp>
#include <mpvctl/errors.hpp>

#include <string>

namespace mpvctl::platform {

    enum class Platform {
        Linux,
        MacOS,
        Windows,
        WSL
    };

    /**
     * @brief Which player build a WSL host drives.
     *
     * LinuxBinary runs the Linux mpv over a Unix socket. WindowsBinary runs
     * mpv.exe over a named pipe, which needs a client able to reach Windows
     * pipes from inside WSL.
     */
    enum class WslPolicy {
        LinuxBinary,
        WindowsBinary
    };

    constexpr const char *KERNEL_VERSION_FILE = "/proc/version";

    /// Detects the host platform. Only reads KERNEL_VERSION_FILE on Linux hosts.
    Platform resolve(const Environment &env);

    /// True if the kernel identification text names Microsoft or WSL (case-insensitive).
    bool is_wsl_kernel(const std::string &version_text);

    std::string executable_name(Platform p, WslPolicy policy = WslPolicy::LinuxBinary);

    /**
     * @brief Locates the player binary for the platform on the search path.
     * @return ExecutableNotFound with an install hint when missing.
     */
    Error find_executable(const Environment &env, Platform p, WslPolicy policy, std::string &full_path);

    const char *platform_name(Platform p);

    bool parse_wsl_policy(const std::string &s, WslPolicy &out);

} // namespace mpvctl::platform

#endif // MPVCTL_PLATFORM_HPP
