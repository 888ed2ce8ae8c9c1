/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/config.hpp>
#include <mpvctl/logger.hpp>

#include <fstream>

#include <fmt/core.h>

namespace mpvctl::config {

    using json = nlohmann::json;

    namespace {
        void read_string(const json &j, const char *key, std::string &out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_string()) {
                LOG_GEN_WARN("config key '{}' must be a string, keeping default", key);
                return;
            }
            out = it->get<std::string>();
        }

        void read_bool(const json &j, const char *key, bool &out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_boolean()) {
                LOG_GEN_WARN("config key '{}' must be a boolean, keeping default", key);
                return;
            }
            out = it->get<bool>();
        }

        void read_ms(const json &j, const char *key, milliseconds &out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_number_integer() || it->get<long long>() < 0) {
                LOG_GEN_WARN("config key '{}' must be a non-negative integer (ms), keeping default", key);
                return;
            }
            out = milliseconds(it->get<long long>());
        }
    }

    transport::ProbeTimings PlayerConfig::probe_timings() const {
        transport::ProbeTimings t;
        t.startup_delay = startup_delay;
        t.interval = probe_interval;
        t.socket_timeout = socket_timeout;
        t.pipe_timeout = pipe_timeout;
        t.socket_grace = socket_grace;
        t.pipe_grace = pipe_grace;
        t.tcp_grace = tcp_grace;
        return t;
    }

    void apply_json(const json &j, PlayerConfig &cfg) {
        if (!j.is_object()) {
            LOG_GEN_WARN("config root must be an object, ignoring");
            return;
        }
        read_string(j, "app_name", cfg.app_name);
        read_bool(j, "debug", cfg.debug);
        read_bool(j, "load_user_config", cfg.load_user_config);

        std::string policy;
        read_string(j, "wsl_policy", policy);
        if (!policy.empty() && !platform::parse_wsl_policy(policy, cfg.wsl_policy)) {
            LOG_GEN_WARN("unknown wsl_policy '{}', keeping default", policy);
        }

        read_ms(j, "init_timeout_ms", cfg.init_timeout);
        read_ms(j, "socket_timeout_ms", cfg.socket_timeout);
        read_ms(j, "pipe_timeout_ms", cfg.pipe_timeout);
        read_ms(j, "startup_delay_ms", cfg.startup_delay);
        read_ms(j, "probe_interval_ms", cfg.probe_interval);
        read_ms(j, "socket_grace_ms", cfg.socket_grace);
        read_ms(j, "pipe_grace_ms", cfg.pipe_grace);
        read_ms(j, "tcp_grace_ms", cfg.tcp_grace);
        read_ms(j, "spawn_grace_ms", cfg.spawn_grace);
        read_ms(j, "quit_wait_ms", cfg.quit_wait);
        read_ms(j, "progress_interval_ms", cfg.progress_interval);
        read_ms(j, "request_timeout_ms", cfg.request_timeout);
        read_ms(j, "connect_timeout_ms", cfg.connect_timeout);

        read_string(j, "log_level", cfg.log_level);
        read_string(j, "log_file", cfg.log_file);

        if (cfg.app_name.empty()) cfg.app_name = "mpvctl";
    }

    Error load_file(const std::string &path, PlayerConfig &cfg) {
        std::ifstream ifs(path);
        if (!ifs) {
            return Error(ErrorCode::InvalidArgument, fmt::format("cannot open config file '{}'", path));
        }
        try {
            json j;
            ifs >> j;
            apply_json(j, cfg);
        } catch (const json::exception &e) {
            return Error(ErrorCode::InvalidArgument, fmt::format("error parsing config '{}': {}", path, e.what()));
        }
        LOG_GEN_INFO("loaded player config from '{}'", path);
        return Error();
    }

} // namespace mpvctl::config
