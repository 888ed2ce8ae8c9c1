/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/readiness.hpp>
#include <mpvctl/common.hpp>
#include <mpvctl/logger.hpp>

#include <fmt/core.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace mpvctl::transport {

    using namespace mpvctl::common;

    SocketFileProbe::SocketFileProbe(TransportConfig cfg, const Environment &env, const ProbeTimings &t)
        : ReadinessProbe(std::move(cfg)), env_(env), t_(t) {}

    bool SocketFileProbe::check() {
        return env_.file_exists(cfg_.address);
    }

    NamedPipeProbe::NamedPipeProbe(TransportConfig cfg, const ProbeTimings &t)
        : ReadinessProbe(std::move(cfg)), t_(t) {}

    bool NamedPipeProbe::check() {
#ifdef _WIN32
        if (!WaitNamedPipeA(cfg_.address.c_str(), (DWORD)t_.trial_connect.count())) return false;
        HANDLE h = CreateFileA(cfg_.address.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_EXISTING, 0, nullptr);
        if (h == INVALID_HANDLE_VALUE) return false;
        CloseHandle(h);
        return true;
#else
        return false;
#endif
    }

    TcpProbe::TcpProbe(TransportConfig cfg, const ProbeTimings &t)
        : ReadinessProbe(std::move(cfg)), t_(t) {}

    bool TcpProbe::check() {
        sock_t s = connectTcp(cfg_.address, (int)t_.trial_connect.count());
        if (s == INVALID_SOCK) return false;
        closeSocket(s);
        return true;
    }

    std::unique_ptr<ReadinessProbe> make_probe(const TransportConfig &cfg, const Environment &env, const ProbeTimings &t) {
        switch (cfg.kind) {
            case TransportKind::UnixSocket: return std::make_unique<SocketFileProbe>(cfg, env, t);
            case TransportKind::NamedPipe:  return std::make_unique<NamedPipeProbe>(cfg, t);
            case TransportKind::Tcp:        return std::make_unique<TcpProbe>(cfg, t);
        }
        return nullptr;
    }

    Error wait_ready(ReadinessProbe &probe, const ProbeTimings &t, const Context &ctx) {
        const auto &cfg = probe.config();
        auto probe_ctx = CancelToken::with_timeout(ctx ? ctx : CancelToken::background(), probe.timeout());

        auto stopped = [&]() -> Error {
            if (ctx && ctx->cancelled() && !ctx->deadline_exceeded()) {
                return Error(ErrorCode::Cancelled, fmt::format("waiting for IPC at {} cancelled", cfg.address));
            }
            return Error(ErrorCode::ReadinessTimeout,
                         fmt::format("timeout waiting for IPC at {} after {}ms", cfg.address, probe.timeout().count()));
        };

        LOG_IPC_DEBUG("waiting for {} endpoint {}", kind_name(cfg.kind), cfg.address);
        if (!probe_ctx->sleep_for(t.startup_delay)) return stopped();

        while (true) {
            if (probe.check()) {
                if (!probe_ctx->sleep_for(probe.grace()) && ctx && ctx->cancelled()) return stopped();
                LOG_IPC_DEBUG("endpoint {} ready", cfg.address);
                return Error();
            }
            if (!probe_ctx->sleep_for(t.interval)) return stopped();
        }
    }

} // namespace mpvctl::transport
