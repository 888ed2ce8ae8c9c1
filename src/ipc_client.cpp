/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/ipc_client.hpp>
#include <mpvctl/logger.hpp>

#include <cerrno>
#include <cstring>
#include <vector>

#include <fmt/core.h>

#ifdef _WIN32
#include <winsock2.h>
#include <windows.h>
#else
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace mpvctl::ipc {

    using namespace mpvctl::common;
    using transport::TransportConfig;
    using transport::TransportKind;

//
// SocketConnection
//

    SocketConnection::SocketConnection(sock_t fd) : fd_(fd), shut_(false) {}

    SocketConnection::~SocketConnection() {
        shutdown();
        closeSocket(fd_.exchange(INVALID_SOCK));
    }

    bool SocketConnection::write_all(const std::string &data) {
        std::lock_guard<std::mutex> lk(write_mtx_);
        if (shut_.load()) return false;
        sock_t fd = fd_.load();
        size_t total = 0;
        while (total < data.size()) {
#ifdef _WIN32
            int n = send(fd, data.data() + total, (int)(data.size() - total), 0);
#else
            ssize_t n = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
#endif
            if (n <= 0) {
                LOG_IPC_DEBUG("ipc socket send failed");
                return false;
            }
            total += (size_t)n;
        }
        return true;
    }

    long SocketConnection::read_some(char *buf, size_t len) {
        while (true) {
            if (shut_.load()) return -1;
#ifdef _WIN32
            int n = recv(fd_.load(), buf, (int)len, 0);
#else
            ssize_t n = recv(fd_.load(), buf, len, 0);
            if (n < 0 && errno == EINTR) continue;
#endif
            if (n < 0) return -1;
            return (long)n;
        }
    }

    void SocketConnection::shutdown() {
        if (shut_.exchange(true)) return;
        sock_t fd = fd_.load();
        if (fd != INVALID_SOCK) {
#ifdef _WIN32
            ::shutdown(fd, SD_BOTH);
#else
            ::shutdown(fd, SHUT_RDWR);
#endif
        }
    }

#ifdef _WIN32
    /// Overlapped named pipe so that the reader thread never blocks writers.
    class PipeConnection : public Connection {
    public:
        explicit PipeConnection(HANDLE h) : h_(h), shut_(false) {
            read_ev_ = CreateEventA(nullptr, TRUE, FALSE, nullptr);
            write_ev_ = CreateEventA(nullptr, TRUE, FALSE, nullptr);
        }

        ~PipeConnection() override {
            shutdown();
            CloseHandle(h_);
            CloseHandle(read_ev_);
            CloseHandle(write_ev_);
        }

        bool write_all(const std::string &data) override {
            std::lock_guard<std::mutex> lk(write_mtx_);
            if (shut_.load()) return false;
            size_t total = 0;
            while (total < data.size()) {
                OVERLAPPED ov{};
                ov.hEvent = write_ev_;
                ResetEvent(write_ev_);
                DWORD n = 0;
                if (!WriteFile(h_, data.data() + total, (DWORD)(data.size() - total), nullptr, &ov)
                    && GetLastError() != ERROR_IO_PENDING) {
                    return false;
                }
                if (!GetOverlappedResult(h_, &ov, &n, TRUE) || n == 0) return false;
                total += n;
            }
            return true;
        }

        long read_some(char *buf, size_t len) override {
            if (shut_.load()) return -1;
            OVERLAPPED ov{};
            ov.hEvent = read_ev_;
            ResetEvent(read_ev_);
            DWORD n = 0;
            if (!ReadFile(h_, buf, (DWORD)len, nullptr, &ov) && GetLastError() != ERROR_IO_PENDING) {
                return GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
            }
            if (!GetOverlappedResult(h_, &ov, &n, TRUE)) {
                return GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
            }
            return (long)n;
        }

        void shutdown() override {
            if (shut_.exchange(true)) return;
            CancelIoEx(h_, nullptr);
        }

    private:
        HANDLE h_;
        HANDLE read_ev_;
        HANDLE write_ev_;
        std::mutex write_mtx_;
        std::atomic<bool> shut_;
    };
#endif

    Error open_connection(const TransportConfig &cfg, milliseconds timeout, std::unique_ptr<Connection> &out) {
        switch (cfg.kind) {
            case TransportKind::UnixSocket: {
                sock_t fd = connectUnix(cfg.address, (int)timeout.count());
                if (fd == INVALID_SOCK) {
                    return Error(ErrorCode::ConnectFailed, fmt::format("cannot connect to unix socket {}", cfg.address));
                }
                out = std::make_unique<SocketConnection>(fd);
                return Error();
            }
            case TransportKind::Tcp: {
                sock_t fd = connectTcp(cfg.address, (int)timeout.count());
                if (fd == INVALID_SOCK) {
                    return Error(ErrorCode::ConnectFailed, fmt::format("cannot connect to tcp://{}", cfg.address));
                }
                out = std::make_unique<SocketConnection>(fd);
                return Error();
            }
            case TransportKind::NamedPipe: {
#ifdef _WIN32
                if (!WaitNamedPipeA(cfg.address.c_str(), (DWORD)timeout.count())) {
                    return Error(ErrorCode::ConnectFailed,
                                 fmt::format("named pipe {} not available (err={})", cfg.address, GetLastError()));
                }
                HANDLE h = CreateFileA(cfg.address.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                                       OPEN_EXISTING, FILE_FLAG_OVERLAPPED, nullptr);
                if (h == INVALID_HANDLE_VALUE) {
                    return Error(ErrorCode::ConnectFailed,
                                 fmt::format("cannot open named pipe {} (err={})", cfg.address, GetLastError()));
                }
                out = std::make_unique<PipeConnection>(h);
                return Error();
#else
                return Error(ErrorCode::ConnectFailed,
                             fmt::format("named pipe {} is not reachable from this platform", cfg.address));
#endif
            }
        }
        return Error(ErrorCode::InvalidArgument, "unknown transport kind");
    }

//
// IpcClient
//

    Error IpcClient::request(const json &command, json &result) {
        return do_request(command, result, default_timeout());
    }

    Error IpcClient::request(const json &command, json &result, milliseconds timeout) {
        return do_request(command, result, timeout);
    }

    Error IpcClient::get_property(const std::string &name, json &value) {
        return request(json::array({"get_property", name}), value);
    }

    Error IpcClient::set_property(const std::string &name, const json &value) {
        json ignored;
        return request(json::array({"set_property", name, value}), ignored);
    }

    Error IpcClient::quit(milliseconds timeout) {
        json ignored;
        return request(json::array({"quit"}), ignored, timeout);
    }

//
// MpvIpcClient
//

    MpvIpcClient::MpvIpcClient(std::unique_ptr<Connection> conn, milliseconds request_timeout)
        : conn_(std::move(conn)), request_timeout_(request_timeout), next_id_(1), closed_(false) {
        reader_ = std::thread([this] { reader_loop(); });
    }

    MpvIpcClient::~MpvIpcClient() {
        close();
        if (reader_.joinable()) reader_.join();
    }

    void MpvIpcClient::set_event_handler(EventHandler h) {
        std::lock_guard<std::mutex> lk(mtx_);
        on_event_ = std::move(h);
    }

    bool MpvIpcClient::connected() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return !closed_;
    }

    void MpvIpcClient::close() {
        conn_->shutdown();
        fail_all("connection closed by client");
    }

    void MpvIpcClient::fail_all(const std::string &why) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!closed_) {
                closed_ = true;
                close_reason_ = why;
                LOG_IPC_DEBUG("ipc connection closed: {}", why);
            }
            for (auto &kv : pending_) {
                if (!kv.second->done) {
                    kv.second->done = true;
                    kv.second->err = Error(ErrorCode::TransportError, close_reason_);
                }
            }
            pending_.clear();
        }
        cv_.notify_all();
    }

    Error MpvIpcClient::do_request(const json &command, json &result, milliseconds timeout) {
        auto p = std::make_shared<Pending>();
        uint64_t id;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return Error(ErrorCode::TransportError, close_reason_);
            id = next_id_++;
            pending_[id] = p;
        }

        json msg;
        msg["command"] = command;
        msg["request_id"] = id;
        std::string line = msg.dump() + "\n";
        LOG_IPC_TRACE("-> {}", msg.dump());

        if (!conn_->write_all(line)) {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                pending_.erase(id);
            }
            fail_all("write to player failed");
            return Error(ErrorCode::TransportError, fmt::format("failed to send {}", command.dump()));
        }

        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [&] { return p->done; })) {
            pending_.erase(id);
            return Error(ErrorCode::TransportError,
                         fmt::format("no reply to {} within {}ms", command.dump(), timeout.count()));
        }
        if (p->err) return p->err;
        result = std::move(p->data);
        return Error();
    }

    void MpvIpcClient::handle_line(const std::string &line) {
        if (line.empty()) return;
        json msg;
        try {
            msg = json::parse(line);
        } catch (const json::exception &e) {
            LOG_IPC_WARN("ignoring malformed ipc message: {} ({})", line, e.what());
            return;
        }
        if (!msg.is_object()) return;
        LOG_IPC_TRACE("<- {}", line);

        if (msg.contains("event")) {
            EventHandler h;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                h = on_event_;
            }
            if (h) h(msg);
            return;
        }

        auto rid = msg.find("request_id");
        if (rid == msg.end() || !rid->is_number_unsigned()) return;
        uint64_t id = rid->get<uint64_t>();

        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = pending_.find(id);
            if (it == pending_.end()) return; // caller gave up
            auto p = it->second;
            pending_.erase(it);

            std::string status = msg.value("error", std::string("success"));
            if (status != "success") {
                p->err = Error(ErrorCode::TransportError, status);
            } else {
                auto d = msg.find("data");
                p->data = d != msg.end() ? *d : json();
            }
            p->done = true;
        }
        cv_.notify_all();
    }

    void MpvIpcClient::reader_loop() {
        std::string buffer;
        std::vector<char> chunk(BUFFER_SIZE);
        while (true) {
            long n = conn_->read_some(chunk.data(), chunk.size());
            if (n <= 0) {
                fail_all(n == 0 ? "player closed the ipc connection" : "ipc read failed");
                return;
            }
            buffer.append(chunk.data(), (size_t)n);
            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                handle_line(line);
            }
            if (buffer.size() > MAX_LINE_SIZE) {
                LOG_IPC_ERROR("ipc message exceeds {} bytes, dropping connection", MAX_LINE_SIZE);
                conn_->shutdown();
                fail_all("oversized ipc message");
                return;
            }
        }
    }

//
// MpvIpcConnector
//

    MpvIpcConnector::MpvIpcConnector(milliseconds connect_timeout, milliseconds request_timeout)
        : connect_timeout_(connect_timeout), request_timeout_(request_timeout) {}

    Error MpvIpcConnector::connect(const TransportConfig &cfg, std::shared_ptr<IpcClient> &out) {
        std::unique_ptr<Connection> conn;
        Error err = open_connection(cfg, connect_timeout_, conn);
        if (err) return err;
        out = std::make_shared<MpvIpcClient>(std::move(conn), request_timeout_);
        LOG_IPC_INFO("connected to player over {} {}", transport::kind_name(cfg.kind), cfg.address);
        return Error();
    }

} // namespace mpvctl::ipc
