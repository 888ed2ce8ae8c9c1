/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/errors.hpp>

#include <fmt/core.h>

namespace mpvctl {

    const char *error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::None:                    return "None";
            case ErrorCode::ExecutableNotFound:      return "ExecutableNotFound";
            case ErrorCode::AddressGenerationFailed: return "AddressGenerationFailed";
            case ErrorCode::SpawnFailed:             return "SpawnFailed";
            case ErrorCode::ReadinessTimeout:        return "ReadinessTimeout";
            case ErrorCode::ConnectFailed:           return "ConnectFailed";
            case ErrorCode::TransportError:          return "TransportError";
            case ErrorCode::DeadTransport:           return "DeadTransport";
            case ErrorCode::NotInitialized:          return "NotInitialized";
            case ErrorCode::NotRunning:              return "NotRunning";
            case ErrorCode::ProcessExited:           return "ProcessExited";
            case ErrorCode::AlreadyStopped:          return "AlreadyStopped";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::Cancelled:               return "Cancelled";
        }
        return "Unknown";
    }

    std::string Error::describe() const {
        if (ok()) return "None";
        return fmt::format("{}: {}", error_code_name(code), message);
    }

} // namespace mpvctl
