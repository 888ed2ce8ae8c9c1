/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <mpvctl/platform.hpp>

#include "fakes.hpp"

using namespace mpvctl;
using namespace mpvctl::platform;
using mpvctl::testing::FakeEnvironment;

TEST_CASE("executable name per platform", "[platform]") {
    REQUIRE(executable_name(Platform::Windows) == "mpv.exe");
    REQUIRE(executable_name(Platform::Linux) == "mpv");
    REQUIRE(executable_name(Platform::MacOS) == "mpv");
    REQUIRE(executable_name(Platform::WSL) == "mpv");
    REQUIRE(executable_name(Platform::WSL, WslPolicy::WindowsBinary) == "mpv.exe");
    REQUIRE(executable_name(Platform::Linux, WslPolicy::WindowsBinary) == "mpv");
}

TEST_CASE("resolve follows the host os", "[platform]") {
    FakeEnvironment env;
    env.os = HostOs::Windows;
    REQUIRE(resolve(env) == Platform::Windows);
    env.os = HostOs::MacOS;
    REQUIRE(resolve(env) == Platform::MacOS);
    REQUIRE(env.reads() == 0);

    env.os = HostOs::Linux;
    REQUIRE(resolve(env) == Platform::Linux);
    REQUIRE(env.reads() == 1);
}

TEST_CASE("resolve detects WSL from kernel version", "[platform]") {
    FakeEnvironment env;
    env.version_text = "Linux version 5.15.90.1-microsoft-standard-WSL2 (oe-user@oe-host)";
    REQUIRE(resolve(env) == Platform::WSL);

    env.version_text = "Linux version 4.4.0-19041-Microsoft (Microsoft@Microsoft.com)";
    REQUIRE(resolve(env) == Platform::WSL);

    REQUIRE(is_wsl_kernel("linux version 6.6.0-wsl"));
    REQUIRE_FALSE(is_wsl_kernel("Linux version 6.1.0-18-amd64 (debian-kernel@lists.debian.org)"));
}

TEST_CASE("unreadable kernel version means native Linux", "[platform]") {
    FakeEnvironment env;
    env.has_version_file = false;
    REQUIRE(resolve(env) == Platform::Linux);
}

TEST_CASE("find_executable reports a hint when missing", "[platform]") {
    FakeEnvironment env;
    std::string path;
    REQUIRE(find_executable(env, Platform::Linux, WslPolicy::LinuxBinary, path).ok());
    REQUIRE(path == "/usr/bin/mpv");

    Error err = find_executable(env, Platform::Windows, WslPolicy::LinuxBinary, path);
    REQUIRE(err.code == ErrorCode::ExecutableNotFound);
    REQUIRE(err.message.find("mpv.exe") != std::string::npos);

    env.executables.clear();
    err = find_executable(env, Platform::WSL, WslPolicy::WindowsBinary, path);
    REQUIRE(err.code == ErrorCode::ExecutableNotFound);
    REQUIRE(err.message.find("Windows PATH") != std::string::npos);
}

TEST_CASE("wsl policy names", "[platform]") {
    WslPolicy p = WslPolicy::LinuxBinary;
    REQUIRE(parse_wsl_policy("windows-binary", p));
    REQUIRE(p == WslPolicy::WindowsBinary);
    REQUIRE(parse_wsl_policy("linux-binary", p));
    REQUIRE(p == WslPolicy::LinuxBinary);
    REQUIRE_FALSE(parse_wsl_policy("both", p));
    REQUIRE(std::string(platform_name(Platform::WSL)) == "wsl");
}
