/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_TRANSPORT_HPP
#define MPVCTL_TRANSPORT_HPP

#pragma once

#include <mpvctl/environment.hpp>
#include <mpvctl/errors.hpp>
#include <mpvctl/platform.hpp>

#include <string>

namespace mpvctl::transport {

    enum class TransportKind {
        UnixSocket,
        NamedPipe,
        Tcp
    };

    /**
     * @brief Local endpoint of one playback session.
     *
     * Created per Play() and owned by that session only. A file-backed
     * address (Unix socket) leaves a filesystem entry that release() removes.
     */
    struct TransportConfig {
        TransportKind kind = TransportKind::UnixSocket;
        std::string address;
        bool file_backed = false;

        bool empty() const { return address.empty(); }
    };

    constexpr size_t SUFFIX_BYTES = 8;

    /**
     * @brief Produces a fresh endpoint for the platform.
     *
     * Unix-socket platforms get "<tmp>/<app>-mpv-<16 hex>.sock", Windows (and
     * WSL under the windows-binary policy) gets "\\.\pipe\<app>-mpv-<16 hex>".
     * Fails with AddressGenerationFailed only if the random source fails.
     */
    Error generate_address(platform::Platform p, platform::WslPolicy policy, Environment &env,
                           const std::string &app_name, TransportConfig &out);

    /// "host:port" endpoint; never produced by generate_address.
    TransportConfig make_tcp_transport(const std::string &host, int port);

    /// The player's "--input-ipc-server=<address>" flag.
    std::string ipc_argument(const TransportConfig &cfg);

    /// Removes the filesystem artifact of a file-backed address and clears cfg.
    void release(TransportConfig &cfg, Environment &env);

    const char *kind_name(TransportKind k);

} // namespace mpvctl::transport

#endif // MPVCTL_TRANSPORT_HPP
