#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace gdfs::config {

static Config fromYaml(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["drive"]) YAML::convert<DriveConfig>::decode(node, cfg.drive);
    if (auto node = root["write_buffer"]) YAML::convert<WriteBufferConfig>::decode(node, cfg.write_buffer);
    if (auto node = root["read"]) YAML::convert<ReadConfig>::decode(node, cfg.read);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.write_buffer.size_bytes == 0) throw std::runtime_error("write_buffer.size_kb must be greater than zero");
    if (cfg.write_buffer.queue_depth == 0) throw std::runtime_error("write_buffer.queue_depth must be greater than zero");
    if (cfg.read.chunk_bytes == 0) throw std::runtime_error("read.chunk_kb must be greater than zero");
    if (cfg.drive.page_size == 0 || cfg.drive.page_size > 1000)
        throw std::runtime_error("drive.page_size must be between 1 and 1000");

    return cfg;
}

Config loadConfig(const std::string& path) {
    return fromYaml(YAML::LoadFile(path));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromYaml(YAML::Load(yaml));
}

} // namespace gdfs::config
