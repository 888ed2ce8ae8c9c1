/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/progress.hpp>
#include <mpvctl/logger.hpp>

#include <cmath>

#include <fmt/core.h>

namespace mpvctl::player {

    using ipc::json;

    namespace {
        bool read_number(ipc::IpcClient &client, const char *name, double &value, int &failures) {
            json v;
            Error err = client.get_property(name, v);
            if (err) {
                ++failures;
                LOG_IPC_TRACE("get_property {} failed: {}", name, err.describe());
                return false;
            }
            if (!v.is_number()) return false;
            value = v.get<double>();
            return true;
        }

        bool read_flag(ipc::IpcClient &client, const char *name, bool &value, int &failures) {
            json v;
            Error err = client.get_property(name, v);
            if (err) {
                ++failures;
                LOG_IPC_TRACE("get_property {} failed: {}", name, err.describe());
                return false;
            }
            if (!v.is_boolean()) return false;
            value = v.get<bool>();
            return true;
        }
    }

    double compute_percentage(Seconds position, Seconds duration) {
        if (!(duration.count() > 0.0)) return 0.0;
        double pct = (position.count() / duration.count()) * 100.0;
        return std::isfinite(pct) ? pct : 0.0;
    }

    Error fetch_progress(ipc::IpcClient &client, PlaybackProgress &out) {
        double time_pos = 0.0, duration = 0.0;
        double volume = DEFAULT_VOLUME, speed = DEFAULT_SPEED;
        bool paused = false, eof = false;
        int failures = 0;

        read_number(client, "time-pos", time_pos, failures);
        read_number(client, "duration", duration, failures);
        read_flag(client, "pause", paused, failures);
        read_flag(client, "eof-reached", eof, failures);

        int ignored = 0;
        if (!read_number(client, "volume", volume, ignored)) volume = DEFAULT_VOLUME;
        if (!read_number(client, "speed", speed, ignored)) speed = DEFAULT_SPEED;

        if (failures >= DEAD_TRANSPORT_FAILURES) {
            return Error(ErrorCode::DeadTransport,
                         fmt::format("IPC connection failed (failed to get {} properties)", failures));
        }

        PlaybackProgress p;
        p.current_time = Seconds(time_pos);
        p.duration = Seconds(duration);
        p.percentage = compute_percentage(p.current_time, p.duration);
        p.paused = paused;
        p.volume = (int)std::lround(volume);
        p.speed = speed;
        p.eof = eof;
        out = p;
        return Error();
    }

} // namespace mpvctl::player
