/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <mpvctl/transport.hpp>

#include "fakes.hpp"

#include <set>

using namespace mpvctl;
using namespace mpvctl::transport;
using mpvctl::platform::Platform;
using mpvctl::platform::WslPolicy;
using mpvctl::testing::FakeEnvironment;

static bool is_hex(const std::string &s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return !s.empty();
}

TEST_CASE("unix socket address under temp dir", "[transport]") {
    FakeEnvironment env;
    env.tmp = "/var/tmp";
    TransportConfig cfg;
    REQUIRE(generate_address(Platform::Linux, WslPolicy::LinuxBinary, env, "app", cfg).ok());
    REQUIRE(cfg.kind == TransportKind::UnixSocket);
    REQUIRE(cfg.file_backed);

    const std::string prefix = "/var/tmp/app-mpv-";
    REQUIRE(cfg.address.compare(0, prefix.size(), prefix) == 0);
    REQUIRE(cfg.address.size() == prefix.size() + 16 + 5);
    REQUIRE(cfg.address.substr(cfg.address.size() - 5) == ".sock");
    REQUIRE(is_hex(cfg.address.substr(prefix.size(), 16)));
    REQUIRE(ipc_argument(cfg) == "--input-ipc-server=" + cfg.address);
}

TEST_CASE("named pipe address on Windows", "[transport]") {
    FakeEnvironment env;
    TransportConfig cfg;
    REQUIRE(generate_address(Platform::Windows, WslPolicy::LinuxBinary, env, "app", cfg).ok());
    REQUIRE(cfg.kind == TransportKind::NamedPipe);
    REQUIRE_FALSE(cfg.file_backed);

    const std::string prefix = "\\\\.\\pipe\\app-mpv-";
    REQUIRE(cfg.address.compare(0, prefix.size(), prefix) == 0);
    REQUIRE(is_hex(cfg.address.substr(prefix.size())));
    REQUIRE(cfg.address.size() == prefix.size() + 16);
}

TEST_CASE("transport kind depends only on platform and policy", "[transport]") {
    FakeEnvironment env;
    struct Row { Platform p; WslPolicy w; TransportKind k; };
    const Row rows[] = {
        {Platform::Linux, WslPolicy::LinuxBinary, TransportKind::UnixSocket},
        {Platform::MacOS, WslPolicy::LinuxBinary, TransportKind::UnixSocket},
        {Platform::WSL, WslPolicy::LinuxBinary, TransportKind::UnixSocket},
        {Platform::WSL, WslPolicy::WindowsBinary, TransportKind::NamedPipe},
        {Platform::Windows, WslPolicy::LinuxBinary, TransportKind::NamedPipe},
    };
    for (const auto &r : rows) {
        for (int i = 0; i < 3; ++i) {
            TransportConfig cfg;
            REQUIRE(generate_address(r.p, r.w, env, "app", cfg).ok());
            REQUIRE(cfg.kind == r.k);
        }
    }
}

TEST_CASE("1000 generated addresses are distinct", "[transport]") {
    mpvctl::SystemEnvironment &env = mpvctl::SystemEnvironment::instance();
    for (Platform p : {Platform::Linux, Platform::Windows}) {
        std::set<std::string> seen;
        for (int i = 0; i < 1000; ++i) {
            TransportConfig cfg;
            REQUIRE(generate_address(p, WslPolicy::LinuxBinary, env, "mpvctl", cfg).ok());
            REQUIRE(seen.insert(cfg.address).second);
        }
    }
}

TEST_CASE("random source failure is reported", "[transport]") {
    FakeEnvironment env;
    env.random_fails = true;
    TransportConfig cfg;
    Error err = generate_address(Platform::Linux, WslPolicy::LinuxBinary, env, "app", cfg);
    REQUIRE(err.code == ErrorCode::AddressGenerationFailed);
    REQUIRE(cfg.empty());
}

TEST_CASE("release removes socket file once and resets config", "[transport]") {
    FakeEnvironment env;
    TransportConfig cfg;
    REQUIRE(generate_address(Platform::Linux, WslPolicy::LinuxBinary, env, "app", cfg).ok());
    std::string address = cfg.address;

    release(cfg, env);
    REQUIRE(cfg.empty());
    REQUIRE(env.remove_count(address) == 1);

    release(cfg, env);
    REQUIRE(env.total_removes() == 1);

    TransportConfig pipe;
    REQUIRE(generate_address(Platform::Windows, WslPolicy::LinuxBinary, env, "app", pipe).ok());
    release(pipe, env);
    REQUIRE(env.total_removes() == 1);
}

TEST_CASE("tcp transport address", "[transport]") {
    TransportConfig cfg = make_tcp_transport("127.0.0.1", 9999);
    REQUIRE(cfg.kind == TransportKind::Tcp);
    REQUIRE(cfg.address == "127.0.0.1:9999");
    REQUIRE_FALSE(cfg.file_backed);
    REQUIRE(make_tcp_transport("::1", 80).address == "[::1]:80");
    REQUIRE(std::string(kind_name(TransportKind::NamedPipe)) == "named-pipe");
}
