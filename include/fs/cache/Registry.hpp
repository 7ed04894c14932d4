#pragma once

#include "drive/Node.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gdfs::drive {
class NodeClient;
}

namespace gdfs::fs::cache {

struct CacheStatsSnapshot {
    uint64_t hits{0}, misses{0}, remote_lookups{0}, evictions{0};
    size_t entries{0};
};

enum class ResolveStatus { Found, Missing, NotADirectory };

struct Resolution {
    ResolveStatus status{ResolveStatus::Missing};
    drive::Node node{};     // Found: the target. NotADirectory: the file standing where a directory was needed.
    drive::Node parent{};   // Deepest directory reached
    size_t resolved{0};     // Segments matched, including `node` when set

    [[nodiscard]] bool found() const { return status == ResolveStatus::Found; }
};

// Path -> node mappings keyed by (parent id, name), plus a by-id index for ancestry walks.
// No lock is held across remote calls, so concurrent misses may query the backend twice.
class Registry {
public:
    explicit Registry(std::shared_ptr<drive::NodeClient> client);

    // Walks `segments` from `origin`, one cached or remote lookup per segment.
    [[nodiscard]] Resolution resolve(const drive::Node& origin, const std::vector<std::string>& segments);

    [[nodiscard]] std::optional<drive::Node> lookupChild(const std::string& parentId, const std::string& name);
    [[nodiscard]] std::optional<drive::Node> getById(const std::string& id);

    void store(const std::string& parentId, const drive::Node& node);
    // Listing results: keeps whatever already holds the name, so the oldest duplicate stays in place.
    void storeIfAbsent(const std::string& parentId, const drive::Node& node);
    void forget(const std::string& parentId, const std::string& name);

    // Drops the node, everything cached below it and its by-id entry.
    void evictSubtree(const std::string& id);
    void clear();

    [[nodiscard]] CacheStatsSnapshot stats() const;

private:
    std::shared_ptr<drive::NodeClient> client_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unordered_map<std::string, drive::Node>> children_;
    std::unordered_map<std::string, drive::Node> byId_;

    std::atomic<uint64_t> hits_{0}, misses_{0}, remoteLookups_{0}, evictions_{0};

    void evictLocked(const std::string& id);
};

}
