#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace gdfs::config {
struct LoggingConfig;
}

namespace gdfs::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Loggers requested before init() log to the extra sinks only.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> gdfs()    { return get("gdfs"); }
    static std::shared_ptr<spdlog::logger> drive()   { return get("drive"); }
    static std::shared_ptr<spdlog::logger> cache()   { return get("cache"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("filesystem"); }
    static std::shared_ptr<spdlog::logger> buffer()  { return get("buffer"); }
    static std::shared_ptr<spdlog::logger> auth()    { return get("auth"); }

    // Attach a sink to every subsystem logger, present and future.
    static void addSink(const spdlog::sink_ptr& sink);
    static void removeSink(const spdlog::sink_ptr& sink);

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const char* SUBSYSTEMS[] = {"gdfs", "drive", "cache", "filesystem", "buffer", "auth"};

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::vector<spdlog::sink_ptr> extra_sinks_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static std::vector<spdlog::sink_ptr> sinks_();
    static std::shared_ptr<spdlog::logger> makeLogger_(const std::string& name, spdlog::level::level_enum lvl);
};

}
