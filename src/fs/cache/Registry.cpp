#include "fs/cache/Registry.hpp"
#include "drive/NodeClient.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <stdexcept>

using namespace gdfs::fs::cache;
using namespace gdfs::drive;

Registry::Registry(std::shared_ptr<NodeClient> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("Cache registry requires a node client");
}

Resolution Registry::resolve(const Node& origin, const std::vector<std::string>& segments) {
    Resolution res;
    res.parent = origin;

    if (segments.empty()) {
        res.status = ResolveStatus::Found;
        res.node = origin;
        return res;
    }

    for (const auto& segment : segments) {
        if (!res.parent.isDirectory()) {
            res.status = ResolveStatus::NotADirectory;
            res.node = res.parent;
            return res;
        }

        const auto child = lookupChild(res.parent.id, segment);
        if (!child) {
            res.status = ResolveStatus::Missing;
            return res;
        }

        ++res.resolved;
        res.node = *child;
        if (res.resolved < segments.size()) res.parent = *child;
    }

    res.status = ResolveStatus::Found;
    return res;
}

std::optional<Node> Registry::lookupChild(const std::string& parentId, const std::string& name) {
    {
        std::shared_lock lock(mutex_);
        if (const auto dir = children_.find(parentId); dir != children_.end())
            if (const auto it = dir->second.find(name); it != dir->second.end()) {
                ++hits_;
                return it->second;
            }
    }

    ++misses_;
    ++remoteLookups_;
    const auto matches = client_->findChildren(parentId, name);
    if (matches.empty()) return std::nullopt;

    if (matches.size() > 1)
        log::Registry::cache()->debug("[Registry::lookupChild] {} entries named '{}' under {}, using the oldest ({})",
                                      matches.size(), name, parentId, matches.front().id);

    store(parentId, matches.front());
    return matches.front();
}

std::optional<Node> Registry::getById(const std::string& id) {
    {
        std::shared_lock lock(mutex_);
        if (const auto it = byId_.find(id); it != byId_.end()) {
            ++hits_;
            return it->second;
        }
    }

    ++misses_;
    ++remoteLookups_;
    auto node = client_->getNode(id);
    if (!node) return std::nullopt;

    std::unique_lock lock(mutex_);
    byId_.insert_or_assign(id, *node);
    return node;
}

void Registry::store(const std::string& parentId, const Node& node) {
    std::unique_lock lock(mutex_);
    children_[parentId].insert_or_assign(node.name, node);
    byId_.insert_or_assign(node.id, node);
}

void Registry::storeIfAbsent(const std::string& parentId, const Node& node) {
    std::unique_lock lock(mutex_);
    children_[parentId].try_emplace(node.name, node);
    byId_.insert_or_assign(node.id, node);
}

void Registry::forget(const std::string& parentId, const std::string& name) {
    std::unique_lock lock(mutex_);
    const auto dir = children_.find(parentId);
    if (dir == children_.end()) return;
    if (dir->second.erase(name) > 0) ++evictions_;
    if (dir->second.empty()) children_.erase(dir);
}

void Registry::evictLocked(const std::string& id) {
    if (const auto dir = children_.find(id); dir != children_.end()) {
        std::vector<std::string> below;
        below.reserve(dir->second.size());
        for (const auto& [name, child] : dir->second) below.push_back(child.id);
        evictions_ += dir->second.size();
        children_.erase(dir);
        for (const auto& childId : below) evictLocked(childId);
    }

    // The node may be cached under any of its parents
    for (auto& [parentId, entries] : children_)
        std::erase_if(entries, [&](const auto& kv) { return kv.second.id == id; });
    std::erase_if(children_, [](const auto& kv) { return kv.second.empty(); });

    byId_.erase(id);
}

void Registry::evictSubtree(const std::string& id) {
    std::unique_lock lock(mutex_);
    evictLocked(id);
    ++evictions_;
    log::Registry::cache()->debug("[Registry::evictSubtree] Evicted subtree rooted at {}", id);
}

void Registry::clear() {
    std::unique_lock lock(mutex_);
    children_.clear();
    byId_.clear();
    log::Registry::cache()->debug("[Registry::clear] Cache cleared");
}

CacheStatsSnapshot Registry::stats() const {
    CacheStatsSnapshot snap;
    snap.hits = hits_.load();
    snap.misses = misses_.load();
    snap.remote_lookups = remoteLookups_.load();
    snap.evictions = evictions_.load();

    std::shared_lock lock(mutex_);
    for (const auto& [parentId, entries] : children_) snap.entries += entries.size();
    return snap;
}
