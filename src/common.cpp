/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/common.hpp>
#include <mpvctl/logger.hpp>

#include <cerrno>
#include <cstring>
#include <mutex>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#include <afunix.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#endif

namespace mpvctl {
    namespace common {

        namespace {
            // Waits for a non-blocking connect to finish; 0 on success.
            int finishConnect(sock_t fd, int timeoutMs) {
#ifdef _WIN32
                fd_set wfds;
                FD_ZERO(&wfds);
                FD_SET(fd, &wfds);
                timeval tv{};
                tv.tv_sec = timeoutMs / 1000;
                tv.tv_usec = (timeoutMs % 1000) * 1000;
                int r = select(0, nullptr, &wfds, nullptr, &tv);
                if (r <= 0) return -1;
#else
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                int r;
                do {
                    r = poll(&pfd, 1, timeoutMs);
                } while (r < 0 && errno == EINTR);
                if (r <= 0) return -1;
#endif
                int soerr = 0;
                socklen_t len = sizeof(soerr);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, (char*)&soerr, &len) != 0) return -1;
                return soerr == 0 ? 0 : -1;
            }

            bool connectInProgress() {
#ifdef _WIN32
                int err = WSAGetLastError();
                return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
                return errno == EINPROGRESS || errno == EAGAIN;
#endif
            }

            // Sockets are never inherited by spawned children.
            sock_t openSocket(int family, int type, int protocol) {
#ifdef _WIN32
                return WSASocketW(family, type, protocol, nullptr, 0, WSA_FLAG_OVERLAPPED | WSA_FLAG_NO_HANDLE_INHERIT);
#elif defined(SOCK_CLOEXEC)
                return ::socket(family, type | SOCK_CLOEXEC, protocol);
#else
                sock_t fd = ::socket(family, type, protocol);
                if (fd >= 0) fcntl(fd, F_SETFD, FD_CLOEXEC);
                return fd;
#endif
            }
        }

        bool initSocketRuntime() {
#ifdef _WIN32
            static std::once_flag once;
            static bool ok = false;
            std::call_once(once, [] {
                WSADATA wsa;
                ok = WSAStartup(MAKEWORD(2,2), &wsa) == 0;
                if (!ok) LOG_NET_ERROR("WSAStartup failed");
            });
            return ok;
#else
            return true;
#endif
        }

        int setSocketNonBlocking(sock_t fd) {
#ifdef _WIN32
            u_long mode = 1;
            if (ioctlsocket(fd, FIONBIO, &mode) != 0) {
                LOG_NET_INFO("setSocketNonBlocking failed: socket={} err={}", (long long)fd, WSAGetLastError());
                return -1;
            }
            return 0;
#else
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_INFO("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_INFO("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
#endif
        }

        int setSocketBlocking(sock_t fd) {
#ifdef _WIN32
            u_long mode = 0;
            if (ioctlsocket(fd, FIONBIO, &mode) != 0) {
                LOG_NET_INFO("setSocketBlocking failed: socket={} err={}", (long long)fd, WSAGetLastError());
                return -1;
            }
            return 0;
#else
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_INFO("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == -1) {
                LOG_NET_INFO("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
#endif
        }

        void closeSocket(sock_t fd) {
#ifdef _WIN32
            if (fd != INVALID_SOCKET) {
                closesocket(fd);
                LOG_NET_TRACE("socket closed: {}", (long long)fd);
            }
#else
            if (fd >= 0) {
                close(fd);
                LOG_NET_TRACE("socket closed: {}", fd);
            }
#endif
        }

        sock_t connectUnix(const std::string &path, int timeoutMs) {
            if (!initSocketRuntime()) return INVALID_SOCK;

            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
                LOG_NET_WARN("unix socket path too long or empty: '{}'", path);
                return INVALID_SOCK;
            }
            std::memcpy(addr.sun_path, path.c_str(), path.size());

            sock_t fd = openSocket(AF_UNIX, SOCK_STREAM, 0);
            if (fd == INVALID_SOCK) {
                LOG_NET_WARN("unix socket creation failed");
                return INVALID_SOCK;
            }
            setSocketNonBlocking(fd);
            int r = ::connect(fd, (const sockaddr*)&addr, (int)sizeof(addr));
            if (r != 0 && !(connectInProgress() && finishConnect(fd, timeoutMs) == 0)) {
                LOG_NET_DEBUG("connect to unix socket '{}' failed", path);
                closeSocket(fd);
                return INVALID_SOCK;
            }
            setSocketBlocking(fd);
            return fd;
        }

        sock_t connectTcp(const std::string &hostport, int timeoutMs) {
            if (!initSocketRuntime()) return INVALID_SOCK;

            std::string host;
            int port = 0;
            if (!splitHostPort(hostport, host, port)) {
                LOG_NET_WARN("invalid tcp address '{}'", hostport);
                return INVALID_SOCK;
            }

            addrinfo hints{};
            addrinfo *res = nullptr;
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0) {
                LOG_NET_WARN("getaddrinfo failed for {}:{}", host, port);
                return INVALID_SOCK;
            }

            sock_t fd = INVALID_SOCK;
            for (addrinfo *rp = res; rp; rp = rp->ai_next) {
                fd = openSocket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
                if (fd == INVALID_SOCK) continue;
                setSocketNonBlocking(fd);
                int r = ::connect(fd, rp->ai_addr, (int)rp->ai_addrlen);
                if (r == 0 || (connectInProgress() && finishConnect(fd, timeoutMs) == 0)) break;
                closeSocket(fd);
                fd = INVALID_SOCK;
            }
            freeaddrinfo(res);
            if (fd == INVALID_SOCK) {
                LOG_NET_DEBUG("connect to {}:{} failed", host, port);
                return INVALID_SOCK;
            }
            setSocketBlocking(fd);
            int on = 1;
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (const char*)&on, sizeof(on)) != 0) {
                LOG_NET_DEBUG("setsockopt(TCP_NODELAY) failed on {}", hostport);
            }
            return fd;
        }

        bool splitHostPort(const std::string &hostport, std::string &host, int &port) {
            size_t colon = hostport.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 >= hostport.size()) return false;
            std::string port_s = hostport.substr(colon + 1);
            for (char c : port_s) {
                if (c < '0' || c > '9') return false;
            }
            if (port_s.size() > 5) return false;
            int p = std::stoi(port_s);
            if (p <= 0 || p > 65535) return false;
            host = hostport.substr(0, colon);
            if (host.size() >= 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
            port = p;
            return true;
        }

        std::string toHex(const uint8_t *data, size_t len) {
            static const char digits[] = "0123456789abcdef";
            std::string out;
            out.reserve(len * 2);
            for (size_t i = 0; i < len; ++i) {
                out.push_back(digits[data[i] >> 4]);
                out.push_back(digits[data[i] & 0x0f]);
            }
            return out;
        }

    } // namespace common
} // namespace mpvctl
