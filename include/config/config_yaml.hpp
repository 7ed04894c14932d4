#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gdfs::config;

template<>
struct convert<DriveConfig> {
    static Node encode(const DriveConfig& rhs) {
        Node node;
        node["api_base"] = rhs.api_base;
        node["upload_base"] = rhs.upload_base;
        node["root_path"] = rhs.root_path;
        node["root_id"] = rhs.root_id;
        node["trash_for_delete"] = rhs.trash_for_delete;
        node["page_size"] = rhs.page_size;
        node["connect_timeout_sec"] = rhs.connect_timeout_sec;
        node["transfer_timeout_sec"] = rhs.transfer_timeout_sec;
        return node;
    }

    static bool decode(const Node& node, DriveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_base = node["api_base"].as<std::string>("https://www.googleapis.com");
        rhs.upload_base = node["upload_base"].as<std::string>("https://www.googleapis.com/upload");
        rhs.root_path = node["root_path"].as<std::string>("");
        rhs.root_id = node["root_id"].as<std::string>("");
        rhs.trash_for_delete = node["trash_for_delete"].as<bool>(false);
        rhs.page_size = node["page_size"].as<unsigned int>(100);
        rhs.connect_timeout_sec = node["connect_timeout_sec"].as<long>(30);
        rhs.transfer_timeout_sec = node["transfer_timeout_sec"].as<long>(0);
        return true;
    }
};

template<>
struct convert<WriteBufferConfig> {
    static Node encode(const WriteBufferConfig& rhs) {
        Node node;
        node["strategy"] = gdfs::fs::buffer::to_string(rhs.strategy);
        node["size_kb"] = rhs.size_bytes / 1024;
        node["queue_depth"] = rhs.queue_depth;
        return node;
    }

    static bool decode(const Node& node, WriteBufferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.strategy = gdfs::fs::buffer::strategyFromString(node["strategy"].as<std::string>("simple"));
        rhs.size_bytes = node["size_kb"].as<uintmax_t>(1024) * 1024; // Default 1MB
        rhs.queue_depth = node["queue_depth"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<ReadConfig> {
    static Node encode(const ReadConfig& rhs) {
        Node node;
        node["chunk_kb"] = rhs.chunk_bytes / 1024;
        return node;
    }

    static bool decode(const Node& node, ReadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_bytes = node["chunk_kb"].as<uintmax_t>(1024) * 1024;
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["token_file"] = rhs.token_file.string();
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.token_file = node["token_file"].as<std::string>("");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["gdfs"]       = to_std_string(spdlog::level::to_string_view(rhs.gdfs));
        node["drive"]      = to_std_string(spdlog::level::to_string_view(rhs.drive));
        node["cache"]      = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["filesystem"] = to_std_string(spdlog::level::to_string_view(rhs.filesystem));
        node["buffer"]     = to_std_string(spdlog::level::to_string_view(rhs.buffer));
        node["auth"]       = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.gdfs = spdlog::level::from_str(node["gdfs"].as<std::string>("info"));
        rhs.drive = spdlog::level::from_str(node["drive"].as<std::string>("warn"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.filesystem = spdlog::level::from_str(node["filesystem"].as<std::string>("warn"));
        rhs.buffer = spdlog::level::from_str(node["buffer"].as<std::string>("warn"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
