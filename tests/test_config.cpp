/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <mpvctl/config.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace mpvctl;
using namespace mpvctl::config;
using json = nlohmann::json;
using std::chrono::milliseconds;

TEST_CASE("config defaults", "[config]") {
    PlayerConfig cfg;
    REQUIRE(cfg.app_name == "mpvctl");
    REQUIRE_FALSE(cfg.debug);
    REQUIRE_FALSE(cfg.load_user_config);
    REQUIRE(cfg.wsl_policy == platform::WslPolicy::LinuxBinary);
    REQUIRE(cfg.init_timeout == milliseconds(15000));
    REQUIRE(cfg.socket_timeout == milliseconds(5000));
    REQUIRE(cfg.pipe_timeout == milliseconds(10000));
    REQUIRE(cfg.progress_interval == milliseconds(1000));
    REQUIRE(cfg.quit_wait == milliseconds(500));

    transport::ProbeTimings t = cfg.probe_timings();
    REQUIRE(t.startup_delay == milliseconds(300));
    REQUIRE(t.interval == milliseconds(100));
    REQUIRE(t.tcp_grace == milliseconds(300));
}

TEST_CASE("apply_json overlays known keys", "[config]") {
    PlayerConfig cfg;
    json j = {
        {"app_name", "anime"},
        {"debug", true},
        {"wsl_policy", "windows-binary"},
        {"init_timeout_ms", 3000},
        {"progress_interval_ms", 250},
        {"log_level", "debug"},
        {"unknown_key", 1},
    };
    apply_json(j, cfg);
    REQUIRE(cfg.app_name == "anime");
    REQUIRE(cfg.debug);
    REQUIRE(cfg.wsl_policy == platform::WslPolicy::WindowsBinary);
    REQUIRE(cfg.init_timeout == milliseconds(3000));
    REQUIRE(cfg.progress_interval == milliseconds(250));
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.socket_timeout == milliseconds(5000));
}

TEST_CASE("wrong typed keys keep defaults", "[config]") {
    PlayerConfig cfg;
    json j = {
        {"debug", "yes"},
        {"init_timeout_ms", "soon"},
        {"quit_wait_ms", -5},
        {"wsl_policy", "sometimes"},
        {"app_name", ""},
    };
    apply_json(j, cfg);
    REQUIRE_FALSE(cfg.debug);
    REQUIRE(cfg.init_timeout == milliseconds(15000));
    REQUIRE(cfg.quit_wait == milliseconds(500));
    REQUIRE(cfg.wsl_policy == platform::WslPolicy::LinuxBinary);
    REQUIRE(cfg.app_name == "mpvctl");
}

TEST_CASE("load_file reads json and reports problems", "[config]") {
    const std::string path = "mpvctl_test_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"app_name": "viewer", "load_user_config": true, "request_timeout_ms": 750})";
    }
    PlayerConfig cfg;
    REQUIRE(load_file(path, cfg).ok());
    REQUIRE(cfg.app_name == "viewer");
    REQUIRE(cfg.load_user_config);
    REQUIRE(cfg.request_timeout == milliseconds(750));

    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    PlayerConfig broken;
    REQUIRE(load_file(path, broken).code == ErrorCode::InvalidArgument);
    REQUIRE(broken.app_name == "mpvctl");
    std::remove(path.c_str());

    REQUIRE(load_file("definitely-missing-config.json", broken).code == ErrorCode::InvalidArgument);
}
