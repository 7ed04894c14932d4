#pragma once

#include "fs/FileInfo.hpp"
#include "fs/buffer/Strategy.hpp"
#include "fs/cache/Registry.hpp"

#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace gdfs::config {
struct Config;
}

namespace gdfs::drive {
class NodeClient;
}

namespace gdfs::fs {

class File;
class RootScope;

struct DriveOptions {
    buffer::Options write_buffer{};
    bool trash_for_delete{false};
    uintmax_t read_chunk_bytes{1024 * 1024};
    unsigned int page_size{100};

    static DriveOptions fromConfig(const config::Config& config);
};

struct NewFileContext {
    std::string path{};
    int flags{0};
    mode_t mode{0644};
};

struct RenameContext {
    std::string from{}, to{};
    drive::Node node{}, oldParent{}, newParent{};
};

// Path-addressed filesystem over a node-graph store. Paths are relative to the active root; the empty
// path is the root itself. Safe for concurrent use.
class Drive {
public:
    Drive(std::shared_ptr<drive::NodeClient> client, DriveOptions options = {});
    ~Drive();

    // Root scope
    drive::Node setRootDirectory(const std::string& path);
    drive::Node setRootNode(const std::string& id);
    [[nodiscard]] drive::Node rootNode() const;
    [[nodiscard]] std::pair<bool, std::string> isInRoot(const drive::Node& node) const;

    // Metadata
    [[nodiscard]] FileInfo stat(const std::string& path);
    void chmod(const std::string& path, mode_t mode);
    // A path that does not resolve is left alone without error.
    void chtimes(const std::string& path, std::time_t atime, std::time_t mtime);
    void chown(const std::string& path, uid_t uid, gid_t gid);

    // Tree
    void mkdir(const std::string& path, mode_t mode = 0755);
    void mkdirAll(const std::string& path, mode_t mode = 0755);
    void rename(const std::string& oldPath, const std::string& newPath);
    void remove(const std::string& path);
    void removeAll(const std::string& path);
    void deleteDirectory(const std::string& path);

    // Handles
    [[nodiscard]] std::unique_ptr<File> open(const std::string& path);
    [[nodiscard]] std::unique_ptr<File> create(const std::string& path);
    [[nodiscard]] std::unique_ptr<File> openFile(const std::string& path, int flags, mode_t mode = 0644);

    // Trash
    FileInfo trashPath(const std::string& path);
    [[nodiscard]] std::vector<FileInfo> listTrash(const std::string& scopePath, int limit = 0);
    FileInfo restore(const FileInfo& entry);

    // Options
    void setWriteBuffer(const buffer::Options& options);
    void setTrashForDelete(bool enabled);
    [[nodiscard]] DriveOptions options() const;
    [[nodiscard]] cache::CacheStatsSnapshot cacheStats() const;

private:
    std::shared_ptr<drive::NodeClient> client_;
    std::shared_ptr<cache::Registry> cache_;
    std::unique_ptr<RootScope> scope_;

    mutable std::mutex optionsMutex_;
    DriveOptions options_;

    [[nodiscard]] cache::Resolution resolve(const std::string& normalized) const;

    // Found node, or NotExist naming the requested path
    [[nodiscard]] cache::Resolution require(const std::string& normalized) const;

    void removeNode(const std::string& normalized, const cache::Resolution& res);
    drive::Node mkdirAllNormalized(const std::string& normalized);
    std::unique_ptr<File> createFile(const NewFileContext& ctx);
    void handleRename(const RenameContext& ctx);
};

}
