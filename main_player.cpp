/*
* @license
* (C) zachbabanov
*
*/

#include <mpvctl/config.hpp>
#include <mpvctl/logger.hpp>
#include <mpvctl/mpv_player.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <sys/stat.h>

#if defined(__linux__) || defined(__APPLE__)
#include <unistd.h>
#include <limits.h>
#endif
#if defined(__APPLE__)
#include <mach-o/dyld.h>
#elif defined(_WIN32)
#include <windows.h>
#endif

using namespace mpvctl;
using namespace mpvctl::log;
using namespace mpvctl::player;

static std::atomic<bool> g_interrupted{false};

static void on_sigint(int) { g_interrupted.store(true); }

static bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static std::string get_exe_dir(const char *argv0) {
#if defined(__linux__)
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf)-1);
    if (len > 0) {
        buf[len] = '\0';
        std::string p(buf);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
#elif defined(__APPLE__)
    char buf[PATH_MAX];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0) {
        std::string p(buf);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
#elif defined(_WIN32)
    char buf[MAX_PATH];
    DWORD r = GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (r > 0 && r < MAX_PATH) {
        std::string p(buf);
        size_t pos = p.find_last_of("\\/");
        if (pos != std::string::npos) return p.substr(0, pos);
    }
#endif

    if (argv0) {
        std::string p(argv0);
        size_t pos = p.find_last_of("\\/");
        if (pos != std::string::npos) return p.substr(0, pos);
    }
    return ".";
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--log <log_file>] [--log-level trace|debug|info|warn|error]\n"
              << "       [--debug] [--load-user-config] [--wsl-policy linux-binary|windows-binary]\n"
              << "       [--start <sec>] [--volume <0-100>] [--speed <x>] [--fullscreen]\n"
              << "       [--sub-file <url>] [--slang <lang>] [--sub-delay <sec>] [--aid <n>]\n"
              << "       [--referer <url>] [--user-agent <ua>] [--header <Key: Value>]... [--title <t>]\n"
              << "       [--mpv-arg <arg>]... <url>\n";
    std::cerr << "Settings are read from config.json next to the binary (or --config); CLI options override them.\n";
    std::cerr << "Example: " << prog << " --volume 50 --start 90 --log-level debug https://example.com/video.m3u8\n";
}

static bool parse_seconds(const std::string &s, Seconds &out) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size() || v < 0) return false;
        out = Seconds(v);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

static bool parse_int(const std::string &s, int &out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}
// Progress goes to stderr, log lines to stdout.
// The progress line lives on stderr so it never shares a stream with log output.
static void print_progress(const PlaybackProgress &p) {
    std::cerr << fmt::format("\r[{}] {:.1f}/{:.1f}s ({:.1f}%) vol={} speed={:.2f}   ",
                             p.paused ? "paused " : "playing",
                             p.current_time.count(), p.duration.count(), p.percentage, p.volume, p.speed)
              << std::flush;
}

int main(int argc, char **argv) {
    std::string config_path_cli;     bool config_path_cli_set = false;
    std::string log_file_cli;        bool log_file_cli_set = false;
    std::string log_level_cli;       bool log_level_cli_set = false;
    bool debug_cli = false;
    bool user_config_cli = false;
    std::string wsl_policy_cli;      bool wsl_policy_cli_set = false;

    PlayOptions opts;
    std::vector<std::string> pos;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto need_value = [&](const char *what) -> const char * {
            if (i + 1 >= argc) {
                std::cerr << a << " requires " << what << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (a == "--config") {
            const char *v = need_value("a path"); if (!v) return 1;
            config_path_cli = v;
            config_path_cli_set = true;
        } else if (a == "--log") {
            const char *v = need_value("a path"); if (!v) return 1;
            log_file_cli = v;
            log_file_cli_set = true;
        } else if (a == "--log-level") {
            const char *v = need_value("a value"); if (!v) return 1;
            log_level_cli = v;
            log_level_cli_set = true;
        } else if (a == "--debug") {
            debug_cli = true;
        } else if (a == "--load-user-config") {
            user_config_cli = true;
        } else if (a == "--wsl-policy") {
            const char *v = need_value("a value"); if (!v) return 1;
            wsl_policy_cli = v;
            wsl_policy_cli_set = true;
        } else if (a == "--start" || a == "--sub-delay") {
            const char *v = need_value("seconds"); if (!v) return 1;
            Seconds s;
            if (!parse_seconds(v, s)) { std::cerr << "Invalid seconds for " << a << ": " << v << "\n"; return 1; }
            if (a == "--start") opts.start_time = s; else opts.subtitle_delay = s;
        } else if (a == "--volume" || a == "--aid") {
            const char *v = need_value("a number"); if (!v) return 1;
            int n = 0;
            if (!parse_int(v, n) || n < 0) { std::cerr << "Invalid number for " << a << ": " << v << "\n"; return 1; }
            if (a == "--volume") opts.volume = n; else opts.audio_track = n;
        } else if (a == "--speed") {
            const char *v = need_value("a factor"); if (!v) return 1;
            Seconds s;
            if (!parse_seconds(v, s)) { std::cerr << "Invalid speed: " << v << "\n"; return 1; }
            opts.speed = s.count();
        } else if (a == "--fullscreen") {
            opts.fullscreen = true;
        } else if (a == "--sub-file") {
            const char *v = need_value("a url"); if (!v) return 1;
            opts.subtitle_url = v;
        } else if (a == "--slang") {
            const char *v = need_value("a language"); if (!v) return 1;
            opts.subtitle_lang = v;
        } else if (a == "--referer") {
            const char *v = need_value("a url"); if (!v) return 1;
            opts.referer = v;
        } else if (a == "--user-agent") {
            const char *v = need_value("a value"); if (!v) return 1;
            opts.user_agent = v;
        } else if (a == "--header") {
            const char *v = need_value("\"Key: Value\""); if (!v) return 1;
            std::string h(v);
            size_t colon = h.find(':');
            if (colon == std::string::npos || colon == 0) { std::cerr << "Invalid header: " << h << "\n"; return 1; }
            size_t vstart = h.find_first_not_of(' ', colon + 1);
            opts.headers[h.substr(0, colon)] = vstart == std::string::npos ? "" : h.substr(vstart);
        } else if (a == "--title") {
            const char *v = need_value("a title"); if (!v) return 1;
            opts.title = v;
        } else if (a == "--mpv-arg") {
            const char *v = need_value("an argument"); if (!v) return 1;
            opts.mpv_args.push_back(v);
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            pos.push_back(a);
        }
    }

    if (pos.size() != 1) {
        std::cerr << "exactly one url expected\n";
        print_usage(argv[0]);
        return 1;
    }
    const std::string url = pos[0];

    config::PlayerConfig cfg;
    std::string config_path = config_path_cli_set ? config_path_cli
                                                  : get_exe_dir(argc > 0 ? argv[0] : nullptr) + "/config.json";
    if (config_path_cli_set || file_exists(config_path)) {
        Error err = config::load_file(config_path, cfg);
        if (err) {
            if (config_path_cli_set) {
                std::cerr << "Cannot use config '" << config_path << "': " << err.describe() << "\n";
                return 1;
            }
            std::cerr << "Warning: " << err.describe() << " - ignoring\n";
        }
    }

    if (log_file_cli_set) cfg.log_file = log_file_cli;
    if (log_level_cli_set) cfg.log_level = log_level_cli;
    if (debug_cli) cfg.debug = true;
    if (user_config_cli) cfg.load_user_config = true;
    if (wsl_policy_cli_set && !platform::parse_wsl_policy(wsl_policy_cli, cfg.wsl_policy)) {
        std::cerr << "Invalid --wsl-policy: " << wsl_policy_cli << "\n";
        return 1;
    }

    Logger::instance().set_level(parse_level(cfg.log_level, Level::INFO));
    bool file_logging = false;
    if (!cfg.log_file.empty()) {
        std::ofstream ofs(cfg.log_file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << cfg.log_file << "' for append - continuing without file logging\n";
        } else {
            ofs.close();
            file_logging = Logger::instance().open_logfile(cfg.log_file);
        }
    }

    std::unique_ptr<MpvPlayer> mp;
    Error err = MpvPlayer::create(cfg, mp);
    if (err) {
        LOG_GEN_ERROR("{}", err.message);
        std::cerr << err.message << "\n";
        return 2;
    }

    std::signal(SIGINT, on_sigint);
#ifdef SIGTERM
    std::signal(SIGTERM, on_sigint);
#endif

    Context ctx = CancelToken::background();
    err = mp->play(ctx, url, opts);
    if (err) {
        LOG_GEN_ERROR("failed to start player: {}", err.describe());
        std::cerr << "failed to start player: " << err.message << "\n";
        return 2;
    }
    LOG_GEN_INFO("Playing '{}' on {}", url, platform::platform_name(mp->platform()));

    // with a log file the terminal is left to the progress display
    if (file_logging) Logger::instance().set_console(false);

    int rc = 0;
    bool done = false;
    while (!done && !g_interrupted.load()) {
        PlayerEvent ev;
        if (!mp->events().wait_next(std::chrono::milliseconds(200), ev)) continue;
        switch (ev.type) {
            case EventType::Progress:
                print_progress(ev.progress);
                break;
            case EventType::PlaybackEnd:
                std::cerr << "\nplayback finished\n";
                done = true;
                break;
            case EventType::Error:
                std::cerr << "\nplayer error: " << ev.error.message << "\n";
                LOG_GEN_ERROR("player error: {}", ev.error.describe());
                rc = 3;
                done = true;
                break;
        }
    }
    Logger::instance().set_console(true);
    if (g_interrupted.load()) {
        std::cerr << "\ninterrupted\n";
        LOG_GEN_INFO("Interrupted, stopping player");
    }

    err = mp->stop(ctx);
    if (err) LOG_GEN_WARN("stop: {}", err.describe());
    LOG_GEN_INFO("Exiting with code {}", rc);
    Logger::instance().close_logfile();
    return rc;
}
