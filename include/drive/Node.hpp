#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace gdfs::drive {

inline constexpr const char* FOLDER_MIME_TYPE = "application/vnd.google-apps.folder";

enum class NodeKind { File, Directory };

// Snapshot of one remote entry. Never mutated in place once handed out; a fresh lookup yields a new value.
struct Node {
    std::string id{}, name{}, mime_type{};
    std::vector<std::string> parents{};
    NodeKind kind{NodeKind::File};
    uintmax_t size{0};
    std::time_t modified_at{}, accessed_at{}, created_at{};
    bool trashed{false}, explicitly_trashed{false};

    [[nodiscard]] bool isDirectory() const { return kind == NodeKind::Directory; }
    [[nodiscard]] bool hasParent(const std::string& parentId) const;

    [[nodiscard]] bool operator==(const Node& other) const = default;
};

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

}
