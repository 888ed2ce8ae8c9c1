/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/platform.hpp>
#include <mpvctl/logger.hpp>

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace mpvctl::platform {

    bool is_wsl_kernel(const std::string &version_text) {
        std::string v = version_text;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return v.find("microsoft") != std::string::npos || v.find("wsl") != std::string::npos;
    }

    Platform resolve(const Environment &env) {
        switch (env.host_os()) {
            case HostOs::Windows: return Platform::Windows;
            case HostOs::MacOS:   return Platform::MacOS;
            case HostOs::Linux:   break;
        }
        std::string version;
        if (!env.read_file(KERNEL_VERSION_FILE, version)) {
            LOG_GEN_DEBUG("cannot read {}, assuming native Linux", KERNEL_VERSION_FILE);
            return Platform::Linux;
        }
        return is_wsl_kernel(version) ? Platform::WSL : Platform::Linux;
    }

    std::string executable_name(Platform p, WslPolicy policy) {
        switch (p) {
            case Platform::Windows: return "mpv.exe";
            case Platform::WSL:     return policy == WslPolicy::WindowsBinary ? "mpv.exe" : "mpv";
            case Platform::Linux:
            case Platform::MacOS:   return "mpv";
        }
        return "mpv";
    }

    Error find_executable(const Environment &env, Platform p, WslPolicy policy, std::string &full_path) {
        std::string exe = executable_name(p, policy);
        if (env.find_executable(exe, full_path)) return Error();

        if (p == Platform::WSL && policy == WslPolicy::WindowsBinary) {
            return Error(ErrorCode::ExecutableNotFound,
                         "mpv.exe not found in PATH. Please install mpv on Windows and ensure it's in your Windows PATH");
        }
        return Error(ErrorCode::ExecutableNotFound,
                     fmt::format("{} not found in PATH. Please install mpv and ensure it's in your system PATH", exe));
    }

    const char *platform_name(Platform p) {
        switch (p) {
            case Platform::Linux:   return "linux";
            case Platform::MacOS:   return "macos";
            case Platform::Windows: return "windows";
            case Platform::WSL:     return "wsl";
        }
        return "unknown";
    }

    bool parse_wsl_policy(const std::string &s, WslPolicy &out) {
        if (s == "linux-binary" || s == "linux") { out = WslPolicy::LinuxBinary; return true; }
        if (s == "windows-binary" || s == "windows") { out = WslPolicy::WindowsBinary; return true; }
        return false;
    }

} // namespace mpvctl::platform
