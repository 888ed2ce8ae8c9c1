/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_PROGRESS_HPP
#define MPVCTL_PROGRESS_HPP

#pragma once

#include <mpvctl/errors.hpp>
#include <mpvctl/ipc_client.hpp>
#include <mpvctl/player.hpp>

namespace mpvctl::player {

    /// Failed critical reads (time-pos, duration, pause, eof-reached) that mean the transport is gone.
    constexpr int DEAD_TRANSPORT_FAILURES = 3;

    constexpr int DEFAULT_VOLUME = 100;
    constexpr double DEFAULT_SPEED = 1.0;

    /// (position / duration) * 100, or 0 when duration is not positive.
    double compute_percentage(Seconds position, Seconds duration);

    /**
     * @brief Reads one complete progress snapshot from the player.
     *
     * Properties are requested in order time-pos, duration, pause,
     * eof-reached, volume, speed. Values of the wrong type fall back to
     * zero / false for the first four and to DEFAULT_VOLUME / DEFAULT_SPEED
     * for the last two. DEAD_TRANSPORT_FAILURES or more failed critical
     * reads yield DeadTransport and leave `out` untouched.
     */
    Error fetch_progress(ipc::IpcClient &client, PlaybackProgress &out);

} // namespace mpvctl::player

#endif // MPVCTL_PROGRESS_HPP
