/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <mpvctl/ipc_client.hpp>
#include <mpvctl/transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#ifndef _WIN32
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

using namespace mpvctl;
using namespace mpvctl::ipc;
using namespace std::chrono;

#ifndef _WIN32

/**
 * Minimal mpv-like JSON IPC endpoint on a Unix socket: one client,
 * newline-delimited requests, property store, and a few scripted behaviours.
 */
class FakeMpvServer {
public:
    explicit FakeMpvServer(std::string hang_up_on = "", std::string ignore = "")
        : hang_up_on_(std::move(hang_up_on)), ignore_(std::move(ignore)) {
        path_ = "/tmp/mpvctl-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter_++) + ".sock";
        ::unlink(path_.c_str());
        lfd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path_.c_str());
        ok_ = lfd_ >= 0 && ::bind(lfd_, (sockaddr *)&addr, sizeof(addr)) == 0 && ::listen(lfd_, 1) == 0;

        props_["volume"] = 100.0;
        props_["time-pos"] = 4.0;
        props_["pause"] = false;

        if (ok_) thread_ = std::thread([this] { serve(); });
    }

    ~FakeMpvServer() {
        stop_.store(true);
        ::shutdown(lfd_, SHUT_RDWR);
        int c = cfd_.exchange(-1);
        if (c >= 0) ::shutdown(c, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        if (c >= 0) ::close(c);
        if (lfd_ >= 0) ::close(lfd_);
        ::unlink(path_.c_str());
    }

    bool ok() const { return ok_; }

    transport::TransportConfig config() const {
        transport::TransportConfig cfg;
        cfg.kind = transport::TransportKind::UnixSocket;
        cfg.address = path_;
        cfg.file_backed = true;
        return cfg;
    }

    json prop(const std::string &name) {
        std::lock_guard<std::mutex> lk(mtx_);
        return props_[name];
    }

    int requests() const { return requests_.load(); }

private:
    void serve() {
        int c = ::accept(lfd_, nullptr, nullptr);
        if (c < 0) return;
        cfd_.store(c);
        std::string buf;
        char chunk[1024];
        while (!stop_.load()) {
            ssize_t n = ::recv(c, chunk, sizeof(chunk), 0);
            if (n <= 0) break;
            buf.append(chunk, (size_t)n);
            size_t pos;
            while ((pos = buf.find('\n')) != std::string::npos) {
                std::string line = buf.substr(0, pos);
                buf.erase(0, pos + 1);
                if (!handle(c, line)) {
                    int mine = cfd_.exchange(-1);
                    if (mine >= 0) {
                        ::shutdown(mine, SHUT_RDWR);
                        ::close(mine);
                    }
                    return;
                }
            }
        }
    }

    bool handle(int c, const std::string &line) {
        ++requests_;
        json req = json::parse(line);
        json cmd = req["command"];
        std::string verb = cmd[0].get<std::string>();
        if (verb == hang_up_on_) return false;
        if (verb == ignore_) return true;

        json reply;
        reply["request_id"] = req["request_id"];
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (verb == "get_property") {
                auto it = props_.find(cmd[1].get<std::string>());
                if (it == props_.end()) {
                    reply["error"] = "property unavailable";
                } else {
                    reply["error"] = "success";
                    reply["data"] = it->second;
                }
            } else if (verb == "set_property") {
                props_[cmd[1].get<std::string>()] = cmd[2];
                reply["error"] = "success";
            } else {
                reply["error"] = "success";
            }
        }

        // mpv interleaves asynchronous events with replies
        std::string out = json{{"event", "playback-restart"}}.dump() + "\n" + reply.dump() + "\n";
        ::send(c, out.data(), out.size(), MSG_NOSIGNAL);
        return verb != "quit";
    }

    static std::atomic<int> counter_;
    std::string hang_up_on_; // drop the connection when this command arrives
    std::string ignore_;     // never answer this command
    std::string path_;
    int lfd_ = -1;
    std::atomic<int> cfd_{-1};
    bool ok_ = false;
    std::atomic<bool> stop_{false};
    std::atomic<int> requests_{0};
    std::thread thread_;
    std::mutex mtx_;
    std::map<std::string, json> props_;
};

std::atomic<int> FakeMpvServer::counter_{0};

static std::shared_ptr<IpcClient> connect_to(const FakeMpvServer &srv, milliseconds request_timeout = milliseconds(500)) {
    MpvIpcConnector connector(milliseconds(500), request_timeout);
    std::shared_ptr<IpcClient> client;
    Error err = connector.connect(srv.config(), client);
    REQUIRE(err.ok());
    REQUIRE(client);
    return client;
}

TEST_CASE("get and set property over a unix socket", "[ipc]") {
    FakeMpvServer srv;
    REQUIRE(srv.ok());
    auto client = connect_to(srv);
    REQUIRE(client->connected());

    json v;
    REQUIRE(client->get_property("volume", v).ok());
    REQUIRE(v.get<double>() == Approx(100.0));

    REQUIRE(client->set_property("volume", 0).ok());
    REQUIRE(client->get_property("volume", v).ok());
    REQUIRE(v.get<int>() == 0);
    REQUIRE(srv.prop("volume").get<int>() == 0);

    REQUIRE(client->set_property("time-pos", 3.0).ok());
    REQUIRE(srv.prop("time-pos").get<double>() == Approx(3.0));
    client->close();
    REQUIRE_FALSE(client->connected());
}

TEST_CASE("raw request returns the reply data", "[ipc]") {
    FakeMpvServer srv;
    REQUIRE(srv.ok());
    auto client = connect_to(srv);

    json data;
    REQUIRE(client->request(json::array({"get_property", "pause"}), data).ok());
    REQUIRE(data.is_boolean());
    REQUIRE_FALSE(data.get<bool>());

    REQUIRE(client->request(json::array({"set_property", "pause", true}), data, milliseconds(500)).ok());
    REQUIRE(srv.prop("pause").get<bool>());

    Error err = client->request(json::array({"get_property", "no-such-property"}), data);
    REQUIRE(err.code == ErrorCode::TransportError);
    client->close();
}

TEST_CASE("error reply becomes a transport error", "[ipc]") {
    FakeMpvServer srv;
    REQUIRE(srv.ok());
    auto client = connect_to(srv);

    json v;
    Error err = client->get_property("no-such-property", v);
    REQUIRE(err.code == ErrorCode::TransportError);
    REQUIRE(err.message == "property unavailable");
    REQUIRE(client->connected());
}

TEST_CASE("quit is acknowledged", "[ipc]") {
    FakeMpvServer srv;
    REQUIRE(srv.ok());
    auto client = connect_to(srv);
    REQUIRE(client->quit(milliseconds(500)).ok());
}

TEST_CASE("connection loss fails requests without retry", "[ipc]") {
    FakeMpvServer srv("get_property");
    REQUIRE(srv.ok());
    auto client = connect_to(srv, milliseconds(2000));

    json v;
    auto start = steady_clock::now();
    Error err = client->get_property("volume", v);
    REQUIRE(err.code == ErrorCode::TransportError);
    REQUIRE(steady_clock::now() - start < milliseconds(1500));
    REQUIRE(srv.requests() == 1);

    auto until = steady_clock::now() + milliseconds(1000);
    while (client->connected() && steady_clock::now() < until) std::this_thread::sleep_for(milliseconds(5));
    REQUIRE_FALSE(client->connected());
    err = client->get_property("volume", v);
    REQUIRE(err.code == ErrorCode::TransportError);
    REQUIRE(srv.requests() == 1);
}

TEST_CASE("unanswered request times out", "[ipc]") {
    FakeMpvServer srv("", "get_property");
    REQUIRE(srv.ok());
    auto client = connect_to(srv, milliseconds(100));

    json v;
    Error err = client->get_property("volume", v);
    REQUIRE(err.code == ErrorCode::TransportError);
    REQUIRE(err.message.find("no reply") != std::string::npos);

    REQUIRE(client->set_property("pause", true).ok());
}

TEST_CASE("event handler sees async events", "[ipc]") {
    FakeMpvServer srv;
    REQUIRE(srv.ok());
    std::unique_ptr<Connection> conn;
    REQUIRE(open_connection(srv.config(), milliseconds(500), conn).ok());
    auto client = std::make_shared<MpvIpcClient>(std::move(conn), milliseconds(500));

    std::atomic<int> events{0};
    client->set_event_handler([&](const json &ev) {
        if (ev.value("event", "") == "playback-restart") ++events;
    });
    json v;
    REQUIRE(client->get_property("pause", v).ok());
    REQUIRE(v.get<bool>() == false);
    REQUIRE(events.load() == 1);
}

#endif

TEST_CASE("connect to a missing endpoint fails", "[ipc]") {
    MpvIpcConnector connector(milliseconds(200), milliseconds(200));
    std::shared_ptr<IpcClient> client;

    transport::TransportConfig cfg;
    cfg.kind = transport::TransportKind::UnixSocket;
    cfg.address = "/tmp/mpvctl-test-does-not-exist.sock";
    REQUIRE(connector.connect(cfg, client).code == ErrorCode::ConnectFailed);
    REQUIRE_FALSE(client);
}
