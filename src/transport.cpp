/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/transport.hpp>
#include <mpvctl/common.hpp>
#include <mpvctl/logger.hpp>

#include <fmt/core.h>

namespace mpvctl::transport {

    using platform::Platform;
    using platform::WslPolicy;

    namespace {
        bool random_suffix(Environment &env, std::string &out) {
            uint8_t b[SUFFIX_BYTES];
            if (!env.secure_random(b, sizeof(b))) return false;
            out = common::toHex(b, sizeof(b));
            return true;
        }

        std::string join_temp(const std::string &dir, const std::string &file) {
            if (dir.empty()) return file;
            char last = dir.back();
            if (last == '/' || last == '\\') return dir + file;
            char sep = dir.find('\\') != std::string::npos && dir.find('/') == std::string::npos ? '\\' : '/';
            return dir + sep + file;
        }
    }

    Error generate_address(Platform p, WslPolicy policy, Environment &env,
                           const std::string &app_name, TransportConfig &out) {
        std::string suffix;
        if (!random_suffix(env, suffix)) {
            return Error(ErrorCode::AddressGenerationFailed, "secure random source failed while generating IPC address");
        }

        bool pipe = p == Platform::Windows || (p == Platform::WSL && policy == WslPolicy::WindowsBinary);
        TransportConfig cfg;
        if (pipe) {
            cfg.kind = TransportKind::NamedPipe;
            cfg.address = fmt::format("\\\\.\\pipe\\{}-mpv-{}", app_name, suffix);
            cfg.file_backed = false;
        } else {
            cfg.kind = TransportKind::UnixSocket;
            cfg.address = join_temp(env.temp_dir(), fmt::format("{}-mpv-{}.sock", app_name, suffix));
            cfg.file_backed = true;
        }
        LOG_IPC_DEBUG("generated {} address {}", kind_name(cfg.kind), cfg.address);
        out = cfg;
        return Error();
    }

    TransportConfig make_tcp_transport(const std::string &host, int port) {
        TransportConfig cfg;
        cfg.kind = TransportKind::Tcp;
        if (host.find(':') != std::string::npos) {
            cfg.address = fmt::format("[{}]:{}", host, port);
        } else {
            cfg.address = fmt::format("{}:{}", host, port);
        }
        cfg.file_backed = false;
        return cfg;
    }

    std::string ipc_argument(const TransportConfig &cfg) {
        return fmt::format("--input-ipc-server={}", cfg.address);
    }

    void release(TransportConfig &cfg, Environment &env) {
        if (cfg.file_backed && !cfg.address.empty()) {
            if (env.remove_file(cfg.address)) {
                LOG_IPC_DEBUG("removed socket file {}", cfg.address);
            }
        }
        cfg = TransportConfig();
    }

    const char *kind_name(TransportKind k) {
        switch (k) {
            case TransportKind::UnixSocket: return "unix-socket";
            case TransportKind::NamedPipe:  return "named-pipe";
            case TransportKind::Tcp:        return "tcp";
        }
        return "unknown";
    }

} // namespace mpvctl::transport
