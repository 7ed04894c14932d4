#pragma once

#include "fs/FileInfo.hpp"
#include "fs/buffer/Strategy.hpp"
#include "fs/buffer/Writer.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdfs::drive {
class NodeClient;
}

namespace gdfs::fs {

namespace cache {
class Registry;
}

struct FileContext {
    std::shared_ptr<drive::NodeClient> client;
    std::shared_ptr<cache::Registry> cache;
    drive::Node node{};
    std::string path{};        // root-relative, as opened
    std::string parent_id{};   // directory the node was resolved under
    int flags{0};              // O_* open flags
    buffer::Options buffer{};
    uintmax_t read_chunk_bytes{1024 * 1024};
    unsigned int page_size{100};
};

enum class Whence { Set, Current, End };

// One open session on a node. Writes are buffered per the chosen strategy and become visible
// remotely when close() returns; a read-write handle reads back its own uncommitted content.
// Destroying an open write handle closes it and logs any failure.
class File {
public:
    explicit File(FileContext ctx);
    ~File();

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    [[nodiscard]] const std::string& name() const { return ctx_.path; }
    [[nodiscard]] FileInfo stat() const;

    size_t read(uint8_t* out, size_t len);
    size_t readAt(uint8_t* out, size_t len, uintmax_t offset);
    std::vector<uint8_t> readAll();
    uintmax_t seek(int64_t offset, Whence whence);

    size_t write(const uint8_t* data, size_t len);
    size_t write(std::string_view data);

    // limit <= 0 returns everything left; limit > 0 pages forward from the previous call.
    std::vector<FileInfo> readdir(int limit);
    std::vector<std::string> readdirnames(int limit);

    void truncate(uintmax_t size);

    void close();
    [[nodiscard]] bool isClosed() const;

private:
    FileContext ctx_;
    mutable std::mutex mutex_;
    bool closed_{false};

    // read side
    uintmax_t offset_{0};
    std::vector<uint8_t> window_;
    uintmax_t windowOffset_{0};

    // write side
    std::optional<buffer::Writer> writer_;
    std::vector<uint8_t> pending_;   // uncommitted content, kept only on read-write handles

    // directory listing cursor
    std::deque<drive::Node> listed_;
    std::string pageToken_;
    bool listingExhausted_{false};

    [[nodiscard]] bool readable() const;
    [[nodiscard]] bool writable() const;
    void ensureOpen() const;
    [[nodiscard]] bool readsPending() const;
    size_t readAtLocked(uint8_t* out, size_t len, uintmax_t offset);
    void closeLocked();
};

}
