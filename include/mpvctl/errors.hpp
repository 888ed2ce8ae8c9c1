/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_ERRORS_HPP
#define MPVCTL_ERRORS_HPP

#pragma once

#include <string>
#include <utility>

namespace mpvctl {

    enum class ErrorCode : int {
        None = 0,
        ExecutableNotFound,
        AddressGenerationFailed,
        SpawnFailed,
        ReadinessTimeout,
        ConnectFailed,
        TransportError,     // a request on a live connection failed
        DeadTransport,      // repeated property-read failures
        NotInitialized,     // no IPC client connected yet
        NotRunning,         // session is stopped
        ProcessExited,      // player exited while the session was not stopped
        AlreadyStopped,     // names the idempotent no-op; stop() never returns it
        InvalidArgument,
        Cancelled
    };

    const char *error_code_name(ErrorCode code);

    /**
     * @brief Status value returned by every fallible operation.
     *
     * A default-constructed Error means success.
     */
    struct Error {
        ErrorCode code = ErrorCode::None;
        std::string message;

        Error() = default;
        Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

        bool ok() const { return code == ErrorCode::None; }
        explicit operator bool() const { return !ok(); }

        /// "<CodeName>: <message>"
        std::string describe() const;
    };

} // namespace mpvctl

#endif // MPVCTL_ERRORS_HPP
