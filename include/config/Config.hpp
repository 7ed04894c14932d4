#pragma once

#include "fs/buffer/Strategy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace gdfs::config {

constexpr static uintmax_t DEFAULT_WRITE_BUFFER_BYTES = 1024 * 1024;  // 1MB
constexpr static uintmax_t DEFAULT_READ_CHUNK_BYTES = 1024 * 1024;    // 1MB

struct DriveConfig {
    std::string api_base = "https://www.googleapis.com";
    std::string upload_base = "https://www.googleapis.com/upload";
    std::string root_path{};
    std::string root_id{};
    bool trash_for_delete = false;
    unsigned int page_size = 100;
    long connect_timeout_sec = 30;
    long transfer_timeout_sec = 0; // 0 = no limit
};

struct WriteBufferConfig {
    fs::buffer::Strategy strategy = fs::buffer::Strategy::Simple;
    uintmax_t size_bytes = DEFAULT_WRITE_BUFFER_BYTES;
    unsigned int queue_depth = 8;
};

struct ReadConfig {
    uintmax_t chunk_bytes = DEFAULT_READ_CHUNK_BYTES;
};

struct AuthConfig {
    std::filesystem::path token_file{};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gdfs       = spdlog::level::info;   // Startup, root selection, CLI
    spdlog::level::level_enum drive      = spdlog::level::warn;   // Remote API failures
    spdlog::level::level_enum cache      = spdlog::level::warn;   // Evictions and misses are debug-only
    spdlog::level::level_enum filesystem = spdlog::level::warn;   // Tree operations
    spdlog::level::level_enum buffer     = spdlog::level::warn;   // Upload strategy failures
    spdlog::level::level_enum auth       = spdlog::level::warn;   // Token load/store problems
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    DriveConfig drive;
    WriteBufferConfig write_buffer;
    ReadConfig read;
    AuthConfig auth;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config loadConfigFromString(const std::string& yaml);

} // namespace gdfs::config
