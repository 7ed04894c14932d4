#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <algorithm>

namespace gdfs::log {

static spdlog::level::level_enum levelFor(const std::string& name, const config::SubsystemLogLevelsConfig& lv) {
    if (name == "gdfs") return lv.gdfs;
    if (name == "drive") return lv.drive;
    if (name == "cache") return lv.cache;
    if (name == "filesystem") return lv.filesystem;
    if (name == "buffer") return lv.buffer;
    if (name == "auth") return lv.auth;
    return spdlog::level::info;
}

void Registry::init(const config::LoggingConfig& cnf) {
    std::scoped_lock lock(mutex_);
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "gdfs.log";

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    }

    initialized_ = true;

    for (const auto* name : SUBSYSTEMS) {
        spdlog::drop(name);
        makeLogger_(name, levelFor(name, cnf.levels.subsystem_levels));
    }

    spdlog::get("gdfs")->info("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;

    std::scoped_lock lock(mutex_);
    if (auto logger = spdlog::get(name)) return logger;
    return makeLogger_(name, spdlog::level::info);
}

void Registry::addSink(const spdlog::sink_ptr& sink) {
    std::scoped_lock lock(mutex_);
    extra_sinks_.push_back(sink);
    for (const auto* name : SUBSYSTEMS)
        if (const auto lg = spdlog::get(name)) lg->sinks().push_back(sink);
}

void Registry::removeSink(const spdlog::sink_ptr& sink) {
    std::scoped_lock lock(mutex_);
    std::erase(extra_sinks_, sink);
    for (const auto* name : SUBSYSTEMS)
        if (const auto lg = spdlog::get(name)) {
            lg->flush();
            std::erase(lg->sinks(), sink);
        }
}

bool Registry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

std::vector<spdlog::sink_ptr> Registry::sinks_() {
    std::vector<spdlog::sink_ptr> sinks;
    if (console_sink_) sinks.push_back(console_sink_);
    if (main_file_sink_) sinks.push_back(main_file_sink_);
    sinks.insert(sinks.end(), extra_sinks_.begin(), extra_sinks_.end());
    return sinks;
}

std::shared_ptr<spdlog::logger> Registry::makeLogger_(const std::string& name, const spdlog::level::level_enum lvl) {
    const auto sinks = sinks_();
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

}
