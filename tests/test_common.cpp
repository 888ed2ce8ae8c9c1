/*
* @license
* (C) zachbabanov
*
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <mpvctl/cancel.hpp>
#include <mpvctl/common.hpp>
#include <mpvctl/errors.hpp>
#include <mpvctl/events.hpp>
#include <mpvctl/logger.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace mpvctl;
using namespace mpvctl::common;
using namespace std::chrono;

TEST_CASE("Error default is success", "[common]") {
    Error e;
    REQUIRE(e.ok());
    REQUIRE_FALSE(static_cast<bool>(e));

    Error f(ErrorCode::SpawnFailed, "boom");
    REQUIRE_FALSE(f.ok());
    REQUIRE(static_cast<bool>(f));
    REQUIRE(f.describe() == "SpawnFailed: boom");
    REQUIRE(std::string(error_code_name(ErrorCode::DeadTransport)) == "DeadTransport");
}

TEST_CASE("splitHostPort", "[common]") {
    std::string host;
    int port = 0;
    REQUIRE(splitHostPort("127.0.0.1:8000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8000);

    REQUIRE(splitHostPort("[::1]:9000", host, port));
    REQUIRE(host == "::1");
    REQUIRE(port == 9000);

    REQUIRE_FALSE(splitHostPort("localhost", host, port));
    REQUIRE_FALSE(splitHostPort("localhost:abc", host, port));
}

TEST_CASE("toHex lowercase", "[common]") {
    const uint8_t b[] = {0x00, 0x0f, 0xab, 0xff};
    REQUIRE(toHex(b, sizeof(b)) == "000fabff");
    REQUIRE(toHex(b, 0).empty());
}

TEST_CASE("CancelToken cancel and parents", "[common][cancel]") {
    Context root = CancelToken::background();
    Context child = CancelToken::with_timeout(root, std::chrono::minutes(10));
    REQUIRE_FALSE(child->cancelled());
    root->cancel();
    REQUIRE(child->cancelled());
    REQUIRE_FALSE(child->deadline_exceeded());
}

TEST_CASE("CancelToken linked fires on either side", "[common][cancel]") {
    Context a = CancelToken::background();
    Context b = CancelToken::background();
    Context l = CancelToken::linked(a, b);
    REQUIRE_FALSE(l->cancelled());
    b->cancel();
    REQUIRE(l->cancelled());
    REQUIRE_FALSE(a->cancelled());

    Context only = CancelToken::linked(nullptr, a);
    REQUIRE_FALSE(only->cancelled());
}

TEST_CASE("CancelToken deadline", "[common][cancel]") {
    Context t = CancelToken::with_timeout(CancelToken::background(), milliseconds(30));
    REQUIRE_FALSE(t->cancelled());
    REQUIRE_FALSE(t->sleep_for(milliseconds(2000)));
    REQUIRE(t->cancelled());
    REQUIRE(t->deadline_exceeded());
}

TEST_CASE("CancelToken sleep_for wakes on cancel", "[common][cancel]") {
    Context t = CancelToken::background();
    std::thread canceller([t] {
        std::this_thread::sleep_for(milliseconds(30));
        t->cancel();
    });
    auto start = steady_clock::now();
    bool finished = t->sleep_for(milliseconds(5000));
    auto elapsed = steady_clock::now() - start;
    canceller.join();
    REQUIRE_FALSE(finished);
    REQUIRE(elapsed < milliseconds(2000));

    Context fresh = CancelToken::background();
    REQUIRE(fresh->sleep_for(milliseconds(1)));
}

TEST_CASE("EventChannel drops oldest when full", "[common][events]") {
    using namespace mpvctl::player;
    EventChannel ch(2);
    for (uint64_t i = 1; i <= 3; ++i) {
        PlayerEvent ev;
        ev.session = i;
        ch.post(ev);
    }
    REQUIRE(ch.size() == 2);
    REQUIRE(ch.dropped() == 1);

    PlayerEvent out;
    REQUIRE(ch.try_next(out));
    REQUIRE(out.session == 2);
    REQUIRE(ch.wait_next(milliseconds(10), out));
    REQUIRE(out.session == 3);
    REQUIRE_FALSE(ch.wait_next(milliseconds(10), out));
}

TEST_CASE("Logger respects level and reaches sink", "[common][log]") {
    using namespace mpvctl::log;
    std::vector<std::string> lines;
    Logger::instance().set_sink([&](const std::string &l) { lines.push_back(l); });
    Level prev = Logger::instance().level();
    Logger::instance().set_level(Level::WARN);

    LOG_PLAYER_INFO("hidden {}", 1);
    LOG_IPC_WARN("visible {}", 2);

    Logger::instance().set_sink(nullptr);
    Logger::instance().set_level(prev);

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("visible 2") != std::string::npos);
    REQUIRE(lines[0].find("IPC") != std::string::npos);

    REQUIRE(parse_level("Debug") == Level::DEBUG);
    REQUIRE(parse_level("bogus", Level::ERROR) == Level::ERROR);
}

TEST_CASE("Logger with console off still writes file and sink", "[common][log]") {
    using namespace mpvctl::log;
    const std::string path = "mpvctl-console-test.log";
    std::remove(path.c_str());

    std::vector<std::string> lines;
    Logger &lg = Logger::instance();
    REQUIRE(lg.console());
    REQUIRE(lg.open_logfile(path));
    lg.set_sink([&](const std::string &l) { lines.push_back(l); });
    lg.set_console(false);
    REQUIRE_FALSE(lg.console());

    LOG_GEN_WARN("quiet terminal {}", 7);

    lg.set_console(true);
    lg.set_sink(nullptr);
    lg.close_logfile();

    REQUIRE_FALSE(lines.empty());
    REQUIRE(lines.back().find("quiet terminal 7") != std::string::npos);
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("quiet terminal 7") != std::string::npos);
    in.close();
    std::remove(path.c_str());
}
