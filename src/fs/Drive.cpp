#include "fs/Drive.hpp"
#include "fs/Error.hpp"
#include "fs/File.hpp"
#include "fs/RootScope.hpp"
#include "config/Config.hpp"
#include "drive/NodeClient.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <fcntl.h>
#include <stdexcept>
#include <tuple>

using namespace gdfs::fs;
using namespace gdfs::fs::cache;
using namespace gdfs::drive;
using namespace gdfs::util;

DriveOptions DriveOptions::fromConfig(const config::Config& config) {
    DriveOptions opts;
    opts.write_buffer.strategy = config.write_buffer.strategy;
    opts.write_buffer.size_bytes = static_cast<size_t>(config.write_buffer.size_bytes);
    opts.write_buffer.queue_depth = config.write_buffer.queue_depth;
    opts.trash_for_delete = config.drive.trash_for_delete;
    opts.read_chunk_bytes = config.read.chunk_bytes;
    opts.page_size = config.drive.page_size;
    return opts;
}

Drive::Drive(std::shared_ptr<NodeClient> client, DriveOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
    if (!client_) throw std::invalid_argument("Drive requires a node client");
    cache_ = std::make_shared<Registry>(client_);
    scope_ = withRemoteContext("connect", "", [&] { return std::make_unique<RootScope>(client_, cache_); });
}

Drive::~Drive() = default;

// ---------------------------------------------------------------------------------------------------------------------
// Options and root scope
// ---------------------------------------------------------------------------------------------------------------------

void Drive::setWriteBuffer(const buffer::Options& options) {
    std::scoped_lock lock(optionsMutex_);
    options_.write_buffer = options;
}

void Drive::setTrashForDelete(const bool enabled) {
    std::scoped_lock lock(optionsMutex_);
    options_.trash_for_delete = enabled;
}

DriveOptions Drive::options() const {
    std::scoped_lock lock(optionsMutex_);
    return options_;
}

CacheStatsSnapshot Drive::cacheStats() const { return cache_->stats(); }

Node Drive::setRootDirectory(const std::string& path) {
    return withRemoteContext("setRootDirectory", normalizePath(path), [&] { return scope_->setRootByPath(path); });
}

Node Drive::setRootNode(const std::string& id) {
    return withRemoteContext("setRootNode", id, [&] { return scope_->setRootByID(id); });
}

Node Drive::rootNode() const { return scope_->root(); }

std::pair<bool, std::string> Drive::isInRoot(const Node& node) const {
    return withRemoteContext("isInRoot", node.name, [&] { return scope_->isInRoot(node); });
}

// ---------------------------------------------------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------------------------------------------------

Resolution Drive::resolve(const std::string& normalized) const {
    return withRemoteContext("resolve", normalized, [&] {
        return cache_->resolve(scope_->root(), splitPath(normalized));
    });
}

Resolution Drive::require(const std::string& normalized) const {
    auto res = resolve(normalized);
    if (res.status == ResolveStatus::NotADirectory)
        throw NotADirectoryError(joinPath(splitPath(normalized), res.resolved));
    if (res.status == ResolveStatus::Missing) throw NotExistError(normalized);
    return res;
}

FileInfo Drive::stat(const std::string& path) {
    const auto norm = normalizePath(path);
    const auto segments = splitPath(norm);
    const auto res = resolve(norm);

    if (res.status == ResolveStatus::NotADirectory) throw NotADirectoryError(joinPath(segments, res.resolved));
    if (res.status == ResolveStatus::Missing) throw NotExistError(joinPath(segments, res.resolved + 1));
    return {res.node, norm};
}

// ---------------------------------------------------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------------------------------------------------

void Drive::chmod(const std::string& path, const mode_t mode) {
    const auto norm = normalizePath(path);
    log::Registry::fs()->debug("[Drive::chmod] Ignoring mode {:o} for '{}', the backend has no permission bits", mode, norm);
}

void Drive::chtimes(const std::string& path, const std::time_t atime, const std::time_t mtime) {
    const auto norm = normalizePath(path);
    const auto res = resolve(norm);
    if (!res.found()) {
        log::Registry::fs()->debug("[Drive::chtimes] '{}' does not resolve, nothing to update", norm);
        return;
    }

    NodePatch patch;
    patch.modified_at = mtime;
    patch.accessed_at = atime;

    const auto updated = withRemoteContext("chtimes", norm, [&] { return client_->patchNode(res.node.id, patch); });
    if (res.resolved > 0) cache_->store(res.parent.id, updated);
}

void Drive::chown(const std::string&, uid_t, gid_t) {
    throw UnsupportedError();
}

// ---------------------------------------------------------------------------------------------------------------------
// Directories
// ---------------------------------------------------------------------------------------------------------------------

Node Drive::mkdirAllNormalized(const std::string& normalized) {
    const auto segments = splitPath(normalized);

    return withRemoteContext("mkdirAll", normalized, [&] {
        auto current = scope_->root();

        for (size_t i = 0; i < segments.size(); ++i) {
            if (auto child = cache_->lookupChild(current.id, segments[i])) {
                if (!child->isDirectory()) throw NotADirectoryError(joinPath(segments, i + 1));
                current = std::move(*child);
                continue;
            }

            try {
                auto created = client_->createNode({segments[i], current.id, NodeKind::Directory});
                cache_->store(current.id, created);
                log::Registry::fs()->debug("[Drive::mkdirAll] Created '{}' ({})", joinPath(segments, i + 1), created.id);
                current = std::move(created);
            } catch (const RemoteError& e) {
                // Lost a race with another creator; adopt whatever now holds the name
                if (!e.conflict()) throw;
                auto existing = cache_->lookupChild(current.id, segments[i]);
                if (!existing) throw;
                if (!existing->isDirectory()) throw NotADirectoryError(joinPath(segments, i + 1));
                current = std::move(*existing);
            }
        }
        return current;
    });
}

void Drive::mkdirAll(const std::string& path, const mode_t mode) {
    const auto norm = normalizePath(path);
    log::Registry::fs()->debug("[Drive::mkdirAll] '{}' (mode {:o} ignored)", norm, mode);
    std::ignore = mkdirAllNormalized(norm);
}

void Drive::mkdir(const std::string& path, const mode_t mode) {
    const auto norm = normalizePath(path);
    if (norm.empty()) return;

    const auto parentPath = parentOf(norm);
    const auto name = baseName(norm);
    const auto parent = resolve(parentPath);

    if (parent.status == ResolveStatus::NotADirectory) throw NotADirectoryError(joinPath(splitPath(parentPath), parent.resolved));
    if (parent.status == ResolveStatus::Missing) throw NotExistError(parentPath);
    if (!parent.node.isDirectory()) throw NotADirectoryError(parentPath);

    withRemoteContext("mkdir", norm, [&] {
        if (const auto existing = cache_->lookupChild(parent.node.id, name)) {
            if (!existing->isDirectory()) throw AlreadyExistsError(norm);
            return;
        }

        try {
            const auto created = client_->createNode({name, parent.node.id, NodeKind::Directory});
            cache_->store(parent.node.id, created);
        } catch (const RemoteError& e) {
            if (!e.conflict() || !cache_->lookupChild(parent.node.id, name)) throw;
        }
    });

    log::Registry::fs()->debug("[Drive::mkdir] Created '{}' (mode {:o} ignored)", norm, mode);
}

// ---------------------------------------------------------------------------------------------------------------------
// Rename and removal
// ---------------------------------------------------------------------------------------------------------------------

void Drive::handleRename(const RenameContext& ctx) {
    NodePatch patch;
    const auto newName = baseName(ctx.to);
    if (newName != ctx.node.name) patch.name = newName;
    if (ctx.newParent.id != ctx.oldParent.id) {
        patch.add_parent = ctx.newParent.id;
        patch.remove_parent = ctx.oldParent.id;
    }
    if (patch.empty()) return;

    const auto updated = withRemoteContext("rename", ctx.from, [&] { return client_->patchNode(ctx.node.id, patch); });

    cache_->forget(ctx.oldParent.id, ctx.node.name);
    cache_->store(ctx.newParent.id, updated);

    log::Registry::fs()->debug("[Drive::rename] '{}' -> '{}' ({})", ctx.from, ctx.to, ctx.node.id);
}

void Drive::rename(const std::string& oldPath, const std::string& newPath) {
    const auto from = normalizePath(oldPath);
    const auto to = normalizePath(newPath);
    if (from.empty()) throw ForbiddenRootError();
    if (to.empty()) throw EmptyPathError();

    const auto res = require(from);
    if (from == to) return;
    if (isPathPrefix(from, to)) throw InvalidMoveError(from, to);

    const auto parentPath = parentOf(to);
    const auto parent = resolve(parentPath);
    if (parent.status == ResolveStatus::NotADirectory) throw NotADirectoryError(joinPath(splitPath(parentPath), parent.resolved));
    if (parent.status == ResolveStatus::Missing) throw NotExistError(parentPath);
    if (!parent.node.isDirectory()) throw NotADirectoryError(parentPath);

    // An existing file at the target is replaced; anything else standing there is a conflict
    const auto existing = withRemoteContext("rename", to, [&] { return cache_->lookupChild(parent.node.id, baseName(to)); });
    if (existing && existing->id != res.node.id) {
        if (existing->isDirectory() || res.node.isDirectory()) throw AlreadyExistsError(to);
        Resolution target;
        target.status = ResolveStatus::Found;
        target.node = *existing;
        target.parent = parent.node;
        target.resolved = splitPath(to).size();
        removeNode(to, target);
    }

    handleRename({from, to, res.node, res.parent, parent.node});
}

void Drive::removeNode(const std::string& normalized, const Resolution& res) {
    const auto trash = options().trash_for_delete;

    withRemoteContext(trash ? "trash" : "remove", normalized, [&] {
        if (trash) {
            NodePatch patch;
            patch.trashed = true;
            std::ignore = client_->patchNode(res.node.id, patch);
        } else {
            client_->deleteNode(res.node.id);
        }
    });

    cache_->forget(res.parent.id, res.node.name);
    cache_->evictSubtree(res.node.id);
    log::Registry::fs()->debug("[Drive::{}] '{}' ({})", trash ? "trash" : "remove", normalized, res.node.id);
}

void Drive::remove(const std::string& path) {
    const auto norm = normalizePath(path);
    if (norm.empty()) throw ForbiddenRootError();
    removeNode(norm, require(norm));
}

void Drive::removeAll(const std::string& path) {
    const auto norm = normalizePath(path);
    if (norm.empty()) throw ForbiddenRootError();

    const auto res = resolve(norm);
    if (!res.found()) return;
    removeNode(norm, res);
}

void Drive::deleteDirectory(const std::string& path) {
    const auto norm = normalizePath(path);
    if (norm.empty()) throw ForbiddenRootError();

    const auto res = require(norm);
    if (!res.node.isDirectory()) throw NotADirectoryError(norm);
    removeNode(norm, res);
}

// ---------------------------------------------------------------------------------------------------------------------
// Trash
// ---------------------------------------------------------------------------------------------------------------------

FileInfo Drive::trashPath(const std::string& path) {
    const auto norm = normalizePath(path);
    if (norm.empty()) throw ForbiddenRootError();

    const auto res = require(norm);

    NodePatch patch;
    patch.trashed = true;
    const auto updated = withRemoteContext("trash", norm, [&] { return client_->patchNode(res.node.id, patch); });

    cache_->forget(res.parent.id, res.node.name);
    cache_->evictSubtree(res.node.id);
    log::Registry::fs()->debug("[Drive::trashPath] Trashed '{}' ({})", norm, res.node.id);
    return {updated, norm};
}

std::vector<FileInfo> Drive::listTrash(const std::string& scopePath, const int limit) {
    const auto scope = normalizePath(scopePath);
    if (!scope.empty()) std::ignore = require(scope);

    const auto pageSize = options().page_size;
    std::vector<FileInfo> out;

    withRemoteContext("listTrash", scope, [&] {
        std::string token;
        do {
            auto page = client_->listTrashed(token, pageSize);
            for (const auto& node : page.nodes) {
                // Descendants of a trashed folder are trashed implicitly; list only what was trashed directly
                if (!node.explicitly_trashed) continue;

                const auto [inRoot, parentPath] = scope_->isInRoot(node);
                if (!inRoot || !isPathPrefix(scope, parentPath)) continue;

                out.emplace_back(node, joinPath(parentPath, node.name));
                if (limit > 0 && out.size() >= static_cast<size_t>(limit)) return;
            }
            token = std::move(page.next_page_token);
        } while (!token.empty());
    });

    log::Registry::fs()->debug("[Drive::listTrash] {} entries under '{}'", out.size(), scope);
    return out;
}

FileInfo Drive::restore(const FileInfo& entry) {
    NodePatch patch;
    patch.trashed = false;
    const auto updated = withRemoteContext("restore", entry.path, [&] { return client_->patchNode(entry.node.id, patch); });
    log::Registry::fs()->debug("[Drive::restore] Restored '{}' ({})", entry.path, updated.id);
    return {updated, entry.path};
}

// ---------------------------------------------------------------------------------------------------------------------
// Handles
// ---------------------------------------------------------------------------------------------------------------------

std::unique_ptr<File> Drive::open(const std::string& path) {
    return openFile(path, O_RDONLY, 0);
}

std::unique_ptr<File> Drive::create(const std::string& path) {
    return openFile(path, O_RDWR | O_CREAT | O_TRUNC, 0666);
}

std::unique_ptr<File> Drive::createFile(const NewFileContext& ctx) {
    const auto parentPath = parentOf(ctx.path);
    const auto parent = mkdirAllNormalized(parentPath);

    const auto node = withRemoteContext("create", ctx.path, [&] {
        return client_->createNode({baseName(ctx.path), parent.id, NodeKind::File});
    });
    cache_->store(parent.id, node);
    log::Registry::fs()->debug("[Drive::createFile] Created '{}' ({}, mode {:o} ignored)", ctx.path, node.id, ctx.mode);

    const auto opts = options();
    return std::make_unique<File>(FileContext{
        client_, cache_, node, ctx.path, parent.id, ctx.flags,
        opts.write_buffer, opts.read_chunk_bytes, opts.page_size});
}

std::unique_ptr<File> Drive::openFile(const std::string& path, const int flags, const mode_t mode) {
    const auto norm = normalizePath(path);
    const bool write = (flags & O_ACCMODE) != O_RDONLY;
    const bool create = (flags & O_CREAT) != 0;

    if (flags & O_APPEND) throw UnsupportedError();
    if (norm.empty() && write) {
        if (create) throw EmptyPathError();
        throw IsADirectoryError(norm);
    }

    const auto res = resolve(norm);
    if (res.status == ResolveStatus::NotADirectory) throw NotADirectoryError(joinPath(splitPath(norm), res.resolved));

    if (res.status == ResolveStatus::Missing) {
        if (!create || !write) throw NotExistError(norm);
        return createFile({norm, flags, mode});
    }

    if (create && (flags & O_EXCL)) throw AlreadyExistsError(norm);
    if (res.node.isDirectory() && write) throw IsADirectoryError(norm);

    const auto opts = options();
    return std::make_unique<File>(FileContext{
        client_, cache_, res.node, norm, res.resolved > 0 ? res.parent.id : std::string(), flags,
        opts.write_buffer, opts.read_chunk_bytes, opts.page_size});
}
