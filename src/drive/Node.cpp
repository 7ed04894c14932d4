#include "drive/Node.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace gdfs::drive;
using namespace gdfs::util;

bool Node::hasParent(const std::string& parentId) const {
    return std::ranges::find(parents, parentId) != parents.end();
}

void gdfs::drive::to_json(nlohmann::json& j, const Node& node) {
    j = {
        {"id", node.id},
        {"name", node.name},
        {"mimeType", node.isDirectory() ? std::string(FOLDER_MIME_TYPE) : node.mime_type},
        {"parents", node.parents},
        {"size", std::to_string(node.size)},
        {"trashed", node.trashed},
        {"explicitlyTrashed", node.explicitly_trashed},
    };
    if (node.modified_at) j["modifiedTime"] = formatRfc3339(node.modified_at);
    if (node.accessed_at) j["viewedByMeTime"] = formatRfc3339(node.accessed_at);
    if (node.created_at) j["createdTime"] = formatRfc3339(node.created_at);
}

void gdfs::drive::from_json(const nlohmann::json& j, Node& node) {
    node.id = j.at("id").get<std::string>();
    node.name = j.value("name", std::string());
    node.mime_type = j.value("mimeType", std::string());
    node.kind = node.mime_type == FOLDER_MIME_TYPE ? NodeKind::Directory : NodeKind::File;
    node.parents = j.value("parents", std::vector<std::string>{});

    // Drive reports int64 fields as JSON strings; folders and native docs have no size at all.
    node.size = 0;
    if (const auto it = j.find("size"); it != j.end()) {
        if (it->is_string()) node.size = std::stoull(it->get<std::string>());
        else if (it->is_number_unsigned()) node.size = it->get<uintmax_t>();
    }

    node.modified_at = parseRfc3339(j.value("modifiedTime", std::string()));
    node.accessed_at = parseRfc3339(j.value("viewedByMeTime", std::string()));
    node.created_at = parseRfc3339(j.value("createdTime", std::string()));
    node.trashed = j.value("trashed", false);
    node.explicitly_trashed = j.value("explicitlyTrashed", false);
}
