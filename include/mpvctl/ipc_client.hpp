/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_IPC_CLIENT_HPP
#define MPVCTL_IPC_CLIENT_HPP

#pragma once

#include <mpvctl/common.hpp>
#include <mpvctl/errors.hpp>
#include <mpvctl/transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace mpvctl::ipc {

    using json = nlohmann::json;
    using std::chrono::milliseconds;

    /**
     * @brief Bidirectional byte stream to the player.
     *
     * read_some() is called from a single reader thread while write_all()
     * may be called concurrently from request threads.
     */
    class Connection {
    public:
        virtual ~Connection() = default;

        virtual bool write_all(const std::string &data) = 0;

        /// @return bytes read, 0 on orderly EOF, -1 on error or after shutdown().
        virtual long read_some(char *buf, size_t len) = 0;

        /// Unblocks a pending read_some() and releases the OS handle.
        virtual void shutdown() = 0;
    };

    /// Unix domain or TCP stream socket.
    class SocketConnection : public Connection {
    public:
        explicit SocketConnection(common::sock_t fd);
        ~SocketConnection() override;

        bool write_all(const std::string &data) override;
        long read_some(char *buf, size_t len) override;
        void shutdown() override;

    private:
        std::mutex write_mtx_;
        std::atomic<common::sock_t> fd_;
        std::atomic<bool> shut_;
    };

    /// Opens the OS-level stream for the transport.
    Error open_connection(const transport::TransportConfig &cfg, milliseconds timeout, std::unique_ptr<Connection> &out);

    /**
     * @brief Request/response view of the player's IPC protocol.
     *
     * A failed request on a live connection is TransportError; once the
     * connection is lost every later request fails the same way and nothing
     * is retried.
     */
    class IpcClient {
    public:
        virtual ~IpcClient() = default;

        /// Sends {"command": command} and returns the "data" member of the reply.
        Error request(const json &command, json &result);
        Error request(const json &command, json &result, milliseconds timeout);

        Error get_property(const std::string &name, json &value);
        Error set_property(const std::string &name, const json &value);
        Error quit(milliseconds timeout);

        virtual bool connected() const = 0;
        virtual void close() = 0;

    protected:
        virtual Error do_request(const json &command, json &result, milliseconds timeout) = 0;
        virtual milliseconds default_timeout() const = 0;
    };

    /**
     * @brief Newline-delimited JSON client for mpv's --input-ipc-server.
     *
     * Requests carry a "request_id"; a reader thread matches replies to
     * waiting callers and drops asynchronous "event" messages after handing
     * them to the optional event handler.
     */
    class MpvIpcClient : public IpcClient {
    public:
        using EventHandler = std::function<void(const json &event)>;

        MpvIpcClient(std::unique_ptr<Connection> conn, milliseconds request_timeout);
        ~MpvIpcClient() override;

        MpvIpcClient(const MpvIpcClient&) = delete;
        MpvIpcClient& operator=(const MpvIpcClient&) = delete;

        /// Must be set before traffic starts; invoked on the reader thread.
        void set_event_handler(EventHandler h);

        bool connected() const override;
        void close() override;

    protected:
        Error do_request(const json &command, json &result, milliseconds timeout) override;
        milliseconds default_timeout() const override { return request_timeout_; }

    private:
        struct Pending {
            bool done = false;
            Error err;
            json data;
        };

        void reader_loop();
        void handle_line(const std::string &line);
        void fail_all(const std::string &why);

        std::unique_ptr<Connection> conn_;
        milliseconds request_timeout_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::map<uint64_t, std::shared_ptr<Pending>> pending_;
        uint64_t next_id_;
        bool closed_;
        std::string close_reason_;
        EventHandler on_event_;

        std::thread reader_;
    };

    /**
     * @brief Creates a connected client for a ready transport.
     */
    class IpcConnector {
    public:
        virtual ~IpcConnector() = default;
        virtual Error connect(const transport::TransportConfig &cfg, std::shared_ptr<IpcClient> &out) = 0;
    };

    class MpvIpcConnector : public IpcConnector {
    public:
        MpvIpcConnector(milliseconds connect_timeout, milliseconds request_timeout);
        Error connect(const transport::TransportConfig &cfg, std::shared_ptr<IpcClient> &out) override;

    private:
        milliseconds connect_timeout_;
        milliseconds request_timeout_;
    };

} // namespace mpvctl::ipc

#endif // MPVCTL_IPC_CLIENT_HPP
