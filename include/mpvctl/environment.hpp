/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_ENVIRONMENT_HPP
#define MPVCTL_ENVIRONMENT_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mpvctl {

    /// Host operating system family the binary was compiled for.
    enum class HostOs {
        Linux,
        MacOS,
        Windows
    };

    /**
     * @brief Every OS touchpoint the player subsystem needs.
     *
     * The supervisor and its helpers never read the filesystem, PATH or the
     * random device directly; tests substitute a fake.
     */
    class Environment {
    public:
        virtual ~Environment() = default;

        virtual HostOs host_os() const = 0;

        /// Reads a whole file. Returns false if it cannot be read.
        virtual bool read_file(const std::string &path, std::string &out) const = 0;

        virtual std::string temp_dir() const = 0;

        /// Looks `name` up on the executable search path.
        virtual bool find_executable(const std::string &name, std::string &full_path) const = 0;

        virtual bool file_exists(const std::string &path) const = 0;

        /// Best-effort removal; false when nothing was removed.
        virtual bool remove_file(const std::string &path) = 0;

        /// Fills buf from a cryptographically strong source.
        virtual bool secure_random(uint8_t *buf, size_t len) = 0;
    };

    /**
     * @brief Environment backed by the real OS.
     */
    class SystemEnvironment : public Environment {
    public:
        /// Shared process-wide instance.
        static SystemEnvironment &instance();

        HostOs host_os() const override;
        bool read_file(const std::string &path, std::string &out) const override;
        std::string temp_dir() const override;
        bool find_executable(const std::string &name, std::string &full_path) const override;
        bool file_exists(const std::string &path) const override;
        bool remove_file(const std::string &path) override;
        bool secure_random(uint8_t *buf, size_t len) override;
    };

} // namespace mpvctl

#endif // MPVCTL_ENVIRONMENT_HPP
