/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_CONFIG_HPP
#define MPVCTL_CONFIG_HPP

#pragma once

#include <mpvctl/errors.hpp>
#include <mpvctl/platform.hpp>
#include <mpvctl/readiness.hpp>

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace mpvctl::config {

    using std::chrono::milliseconds;

    /**
     * @brief Player supervisor settings.
     *
     * JSON keys match the field names; durations are integers in milliseconds.
     */
    struct PlayerConfig {
        std::string app_name = "mpvctl";
        bool debug = false;
        bool load_user_config = false;
        platform::WslPolicy wsl_policy = platform::WslPolicy::LinuxBinary;

        milliseconds init_timeout{15000};
        milliseconds socket_timeout{5000};
        milliseconds pipe_timeout{10000};
        milliseconds startup_delay{300};
        milliseconds probe_interval{100};
        milliseconds socket_grace{200};
        milliseconds pipe_grace{200};
        milliseconds tcp_grace{300};
        milliseconds spawn_grace{100};
        milliseconds quit_wait{500};
        milliseconds progress_interval{1000};
        milliseconds request_timeout{2000};
        milliseconds connect_timeout{2000};

        std::string log_level = "info";
        std::string log_file;

        transport::ProbeTimings probe_timings() const;
    };

    /// Overlays keys present in `j`; wrong-typed keys are logged and skipped.
    void apply_json(const nlohmann::json &j, PlayerConfig &cfg);

    /**
     * @brief Reads a JSON config file into cfg.
     * @return InvalidArgument when the file is missing or not valid JSON; cfg keeps defaults then.
     */
    Error load_file(const std::string &path, PlayerConfig &cfg);

} // namespace mpvctl::config

#endif // MPVCTL_CONFIG_HPP
