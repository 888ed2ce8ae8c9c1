/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_READINESS_HPP
#define MPVCTL_READINESS_HPP

#pragma once

#include <mpvctl/cancel.hpp>
#include <mpvctl/environment.hpp>
#include <mpvctl/errors.hpp>
#include <mpvctl/transport.hpp>

#include <chrono>
#include <memory>

namespace mpvctl::transport {

    using std::chrono::milliseconds;

    struct ProbeTimings {
        milliseconds startup_delay{300};  // before the first check
        milliseconds interval{100};
        milliseconds socket_timeout{5000};
        milliseconds pipe_timeout{10000}; // named pipes and TCP
        milliseconds socket_grace{200};
        milliseconds pipe_grace{200};
        milliseconds tcp_grace{300};
        milliseconds trial_connect{200};
    };

    /**
     * @brief One readiness check strategy per transport kind.
     */
    class ReadinessProbe {
    public:
        explicit ReadinessProbe(TransportConfig cfg) : cfg_(std::move(cfg)) {}
        virtual ~ReadinessProbe() = default;

        /// Single non-blocking-ish check whether the endpoint accepts clients.
        virtual bool check() = 0;
        /// Extra settle time once check() succeeded.
        virtual milliseconds grace() const = 0;
        virtual milliseconds timeout() const = 0;

        const TransportConfig &config() const { return cfg_; }

    protected:
        TransportConfig cfg_;
    };

    /// Socket file exists on disk.
    class SocketFileProbe : public ReadinessProbe {
    public:
        SocketFileProbe(TransportConfig cfg, const Environment &env, const ProbeTimings &t);
        bool check() override;
        milliseconds grace() const override { return t_.socket_grace; }
        milliseconds timeout() const override { return t_.socket_timeout; }
    private:
        const Environment &env_;
        ProbeTimings t_;
    };

    /// Trial open-and-close of the named pipe (Windows only; never ready elsewhere).
    class NamedPipeProbe : public ReadinessProbe {
    public:
        NamedPipeProbe(TransportConfig cfg, const ProbeTimings &t);
        bool check() override;
        milliseconds grace() const override { return t_.pipe_grace; }
        milliseconds timeout() const override { return t_.pipe_timeout; }
    private:
        ProbeTimings t_;
    };

    /// Trial TCP dial-and-close.
    class TcpProbe : public ReadinessProbe {
    public:
        TcpProbe(TransportConfig cfg, const ProbeTimings &t);
        bool check() override;
        milliseconds grace() const override { return t_.tcp_grace; }
        milliseconds timeout() const override { return t_.pipe_timeout; }
    private:
        ProbeTimings t_;
    };

    std::unique_ptr<ReadinessProbe> make_probe(const TransportConfig &cfg, const Environment &env, const ProbeTimings &t);

    /**
     * @brief Polls the probe until ready, its own timeout, or ctx is done.
     * @return ReadinessTimeout on timeout or ctx deadline, Cancelled on explicit cancel.
     */
    Error wait_ready(ReadinessProbe &probe, const ProbeTimings &t, const Context &ctx);

} // namespace mpvctl::transport

#endif // MPVCTL_READINESS_HPP
