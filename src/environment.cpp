/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/environment.hpp>
#include <mpvctl/logger.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <sys/stat.h>

#ifdef _WIN32
#include <windows.h>
#include <bcrypt.h>
#else
#include <unistd.h>
#include <fcntl.h>
#if defined(__linux__)
#include <sys/random.h>
#endif
#endif

namespace mpvctl {

    namespace {
#ifdef _WIN32
        constexpr char kPathListSep = ';';
        constexpr char kDirSep = '\\';
#else
        constexpr char kPathListSep = ':';
        constexpr char kDirSep = '/';
#endif

        bool is_executable_file(const std::string &path) {
#ifdef _WIN32
            DWORD attrs = GetFileAttributesA(path.c_str());
            return attrs != INVALID_FILE_ATTRIBUTES && !(attrs & FILE_ATTRIBUTE_DIRECTORY);
#else
            struct stat st;
            if (stat(path.c_str(), &st) != 0) return false;
            return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
#endif
        }
    }

    SystemEnvironment &SystemEnvironment::instance() {
        static SystemEnvironment env;
        return env;
    }

    HostOs SystemEnvironment::host_os() const {
#if defined(_WIN32)
        return HostOs::Windows;
#elif defined(__APPLE__)
        return HostOs::MacOS;
#else
        return HostOs::Linux;
#endif
    }

    bool SystemEnvironment::read_file(const std::string &path, std::string &out) const {
        std::ifstream ifs(path, std::ios::in | std::ios::binary);
        if (!ifs) return false;
        std::ostringstream ss;
        ss << ifs.rdbuf();
        out = ss.str();
        return true;
    }

    std::string SystemEnvironment::temp_dir() const {
#ifdef _WIN32
        char buf[MAX_PATH + 1];
        DWORD n = GetTempPathA(sizeof(buf), buf);
        if (n > 0 && n <= MAX_PATH) {
            std::string p(buf, n);
            while (p.size() > 3 && (p.back() == '\\' || p.back() == '/')) p.pop_back();
            return p;
        }
        return "C:\\Windows\\Temp";
#else
        const char *t = std::getenv("TMPDIR");
        std::string p = (t && t[0] != '\0') ? t : "/tmp";
        while (p.size() > 1 && p.back() == '/') p.pop_back();
        return p;
#endif
    }

    bool SystemEnvironment::find_executable(const std::string &name, std::string &full_path) const {
        if (name.empty()) return false;
        if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
            if (!is_executable_file(name)) return false;
            full_path = name;
            return true;
        }
        const char *path_env = std::getenv("PATH");
        if (!path_env) return false;

        std::string paths(path_env);
        size_t start = 0;
        while (start <= paths.size()) {
            size_t end = paths.find(kPathListSep, start);
            if (end == std::string::npos) end = paths.size();
            std::string dir = paths.substr(start, end - start);
            if (dir.empty()) dir = ".";
            std::string candidate = dir + kDirSep + name;
            if (is_executable_file(candidate)) {
                full_path = candidate;
                return true;
            }
            start = end + 1;
        }
        return false;
    }

    bool SystemEnvironment::file_exists(const std::string &path) const {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    bool SystemEnvironment::remove_file(const std::string &path) {
        if (std::remove(path.c_str()) == 0) return true;
        if (errno != ENOENT) LOG_GEN_DEBUG("remove '{}' failed: {}", path, strerror(errno));
        return false;
    }

    bool SystemEnvironment::secure_random(uint8_t *buf, size_t len) {
#ifdef _WIN32
        return BCRYPT_SUCCESS(BCryptGenRandom(nullptr, buf, (ULONG)len, BCRYPT_USE_SYSTEM_PREFERRED_RNG));
#elif defined(__linux__)
        size_t got = 0;
        while (got < len) {
            ssize_t n = getrandom(buf + got, len - got, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                LOG_GEN_WARN("getrandom failed: {}", strerror(errno));
                return false;
            }
            got += (size_t)n;
        }
        return true;
#else
        int fd = open("/dev/urandom", O_RDONLY);
        if (fd < 0) return false;
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::read(fd, buf + got, len - got);
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                close(fd);
                return false;
            }
            got += (size_t)n;
        }
        close(fd);
        return true;
#endif
    }

} // namespace mpvctl
