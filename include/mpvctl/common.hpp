/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_COMMON_HPP
#define MPVCTL_COMMON_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
#define INVALID_SOCK INVALID_SOCKET
#else
#define INVALID_SOCK (-1)
#endif

namespace mpvctl {
    namespace common {
#ifdef _WIN32
        using sock_t = SOCKET;
#else
        using sock_t = int;
#endif

        constexpr size_t BUFFER_SIZE = 4096;
        constexpr size_t MAX_LINE_SIZE = 1024 * 1024; // one IPC message never exceeds 1 MiB

//
// Utility functions
//
        /// Process-wide socket library init (WSAStartup on Windows, no-op elsewhere).
        bool initSocketRuntime();

        int setSocketNonBlocking(sock_t fd);
        int setSocketBlocking(sock_t fd);
        void closeSocket(sock_t fd);

        /**
         * @brief Connect a stream socket to a Unix domain socket path.
         * @return connected blocking socket, or INVALID_SOCK.
         */
        sock_t connectUnix(const std::string &path, int timeoutMs);

        /**
         * @brief Connect a TCP socket to "host:port".
         * @return connected blocking socket with TCP_NODELAY, or INVALID_SOCK.
         */
        sock_t connectTcp(const std::string &hostport, int timeoutMs);

        /// Split "host:port"; returns false when the port part is missing or not numeric.
        bool splitHostPort(const std::string &hostport, std::string &host, int &port);

        /// Lowercase hex encoding of a byte buffer.
        std::string toHex(const uint8_t *data, size_t len);

    } // namespace common
} // namespace mpvctl

#endif // MPVCTL_COMMON_HPP
