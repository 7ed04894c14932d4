#pragma once

#include "drive/Node.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace gdfs::drive {
class NodeClient;
}

namespace gdfs::fs {

namespace cache {
class Registry;
}

// The node every path is resolved from. `base` is where root paths are resolved from: the backend's
// top, or a node adopted by id.
class RootScope {
public:
    RootScope(std::shared_ptr<drive::NodeClient> client, std::shared_ptr<cache::Registry> cache);

    [[nodiscard]] drive::Node root() const;
    [[nodiscard]] drive::Node base() const;

    // Path of the active root below the base; empty when they coincide.
    [[nodiscard]] std::string rootPath() const;

    drive::Node setRootByPath(const std::string& path);
    drive::Node setRootByID(const std::string& id);

    // Walks the parent chain upward. On success, returns the path of the node's parent relative to the
    // active root (empty for direct children).
    [[nodiscard]] std::pair<bool, std::string> isInRoot(const drive::Node& node) const;

private:
    std::shared_ptr<drive::NodeClient> client_;
    std::shared_ptr<cache::Registry> cache_;

    mutable std::mutex mutex_;
    drive::Node base_, root_;
    std::string rootPath_;
};

}
