#include "fs/RootScope.hpp"
#include "fs/cache/Registry.hpp"
#include "fs/Error.hpp"
#include "drive/NodeClient.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <unordered_set>
#include <vector>

using namespace gdfs::fs;
using namespace gdfs::drive;
using namespace gdfs::util;

RootScope::RootScope(std::shared_ptr<NodeClient> client, std::shared_ptr<cache::Registry> cache)
    : client_(std::move(client)), cache_(std::move(cache)) {
    if (!client_ || !cache_) throw std::invalid_argument("RootScope requires a node client and a cache");
    base_ = root_ = client_->topNode();
    log::Registry::fs()->debug("[RootScope] Starting at backend top {} ({})", root_.name, root_.id);
}

Node RootScope::root() const {
    std::scoped_lock lock(mutex_);
    return root_;
}

Node RootScope::base() const {
    std::scoped_lock lock(mutex_);
    return base_;
}

std::string RootScope::rootPath() const {
    std::scoped_lock lock(mutex_);
    return rootPath_;
}

Node RootScope::setRootByPath(const std::string& path) {
    const auto norm = normalizePath(path);
    const auto segments = splitPath(norm);
    const auto origin = base();

    const auto res = cache_->resolve(origin, segments);
    if (res.status == cache::ResolveStatus::NotADirectory) throw NotADirectoryError(joinPath(segments, res.resolved));
    if (res.status == cache::ResolveStatus::Missing) throw NotExistError(norm);
    if (!res.node.isDirectory()) throw NotADirectoryError(norm);

    {
        std::scoped_lock lock(mutex_);
        root_ = res.node;
        rootPath_ = norm;
    }

    log::Registry::gdfs()->info("[RootScope] Root set to '{}' ({})", norm.empty() ? "/" : norm, res.node.id);
    return res.node;
}

Node RootScope::setRootByID(const std::string& id) {
    auto node = cache_->getById(id);
    if (!node) throw NotExistError(id);

    {
        std::scoped_lock lock(mutex_);
        base_ = root_ = *node;
        rootPath_.clear();
    }

    log::Registry::gdfs()->info("[RootScope] Root adopted by id {} ({})", id, node->name);
    return *node;
}

std::pair<bool, std::string> RootScope::isInRoot(const Node& node) const {
    const auto rootId = root().id;
    if (node.id == rootId) return {false, {}};

    std::vector<std::string> names; // collected bottom-up
    std::unordered_set<std::string> visited{node.id};
    Node current = node;

    while (true) {
        if (current.parents.empty()) return {false, {}};
        if (current.hasParent(rootId)) break;

        // Several parent links: follow the first one that resolves and is not trashed
        std::optional<Node> next;
        for (const auto& parentId : current.parents) {
            if (visited.contains(parentId)) continue;
            if (auto parent = cache_->getById(parentId); parent && !parent->trashed) {
                next = std::move(parent);
                break;
            }
        }
        if (!next) return {false, {}};

        visited.insert(next->id);
        names.push_back(next->name);
        current = std::move(*next);
    }

    std::ranges::reverse(names);
    return {true, joinPath(names)};
}
