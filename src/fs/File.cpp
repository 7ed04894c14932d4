#include "fs/File.hpp"
#include "fs/Error.hpp"
#include "fs/cache/Registry.hpp"
#include "drive/NodeClient.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>

using namespace gdfs::fs;
using namespace gdfs::drive;

File::File(FileContext ctx) : ctx_(std::move(ctx)) {
    if (!ctx_.client || !ctx_.cache) throw std::invalid_argument("File requires a node client and a cache");
    if (ctx_.read_chunk_bytes == 0) ctx_.read_chunk_bytes = 1;
}

File::~File() {
    std::scoped_lock lock(mutex_);
    if (closed_) return;
    try {
        closeLocked();
    } catch (const std::exception& e) {
        log::Registry::fs()->error("[File] Closing {} on destruction failed, buffered content is lost: {}", ctx_.path, e.what());
    }
}

bool File::readable() const {
    return (ctx_.flags & O_ACCMODE) != O_WRONLY;
}

bool File::writable() const {
    return (ctx_.flags & O_ACCMODE) != O_RDONLY;
}

void File::ensureOpen() const {
    if (closed_) throw ClosedError(ctx_.path);
}

// Once a read-write handle has replaced the content, reads come from what it wrote
bool File::readsPending() const {
    return readable() && writable() && (writer_ || (ctx_.flags & O_TRUNC));
}

bool File::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

FileInfo File::stat() const {
    std::scoped_lock lock(mutex_);
    return {ctx_.node, ctx_.path};
}

size_t File::readAtLocked(uint8_t* out, const size_t len, uintmax_t offset) {
    if (ctx_.node.isDirectory()) throw IsADirectoryError(ctx_.path);
    if (!readable()) throw Error(ErrorCode::Unsupported, fmt::format("file {} is not open for reading", ctx_.path), ctx_.path);

    if (readsPending()) {
        if (offset >= pending_.size()) return 0;
        const auto n = std::min<uintmax_t>(len, pending_.size() - offset);
        std::memcpy(out, pending_.data() + offset, static_cast<size_t>(n));
        return static_cast<size_t>(n);
    }

    size_t copied = 0;
    while (copied < len) {
        if (offset >= windowOffset_ && offset < windowOffset_ + window_.size()) {
            const auto at = static_cast<size_t>(offset - windowOffset_);
            const auto n = std::min(len - copied, window_.size() - at);
            std::memcpy(out + copied, window_.data() + at, n);
            copied += n;
            offset += n;
            continue;
        }

        const auto want = std::max<uintmax_t>(len - copied, ctx_.read_chunk_bytes);
        window_ = withRemoteContext("read", ctx_.path, [&] {
            return ctx_.client->download(ctx_.node.id, offset, want);
        });
        windowOffset_ = offset;
        if (window_.empty()) break;
    }
    return copied;
}

size_t File::read(uint8_t* out, const size_t len) {
    std::scoped_lock lock(mutex_);
    ensureOpen();
    const auto n = readAtLocked(out, len, offset_);
    offset_ += n;
    return n;
}

size_t File::readAt(uint8_t* out, const size_t len, const uintmax_t offset) {
    std::scoped_lock lock(mutex_);
    ensureOpen();
    return readAtLocked(out, len, offset);
}

std::vector<uint8_t> File::readAll() {
    std::scoped_lock lock(mutex_);
    ensureOpen();

    std::vector<uint8_t> out;
    std::vector<uint8_t> chunk(static_cast<size_t>(std::min<uintmax_t>(ctx_.read_chunk_bytes, 4 * 1024 * 1024)));
    while (const auto n = readAtLocked(chunk.data(), chunk.size(), offset_)) {
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        offset_ += n;
    }
    return out;
}

uintmax_t File::seek(const int64_t offset, const Whence whence) {
    std::scoped_lock lock(mutex_);
    ensureOpen();

    int64_t base = 0;
    switch (whence) {
        case Whence::Set: base = 0; break;
        case Whence::Current: base = static_cast<int64_t>(offset_); break;
        case Whence::End: base = static_cast<int64_t>(readsPending() ? pending_.size() : ctx_.node.size); break;
    }

    const auto target = base + offset;
    if (target < 0) throw std::invalid_argument(fmt::format("seek before start of {}", ctx_.path));
    offset_ = static_cast<uintmax_t>(target);
    return offset_;
}

size_t File::write(const uint8_t* data, const size_t len) {
    std::scoped_lock lock(mutex_);
    ensureOpen();
    if (ctx_.node.isDirectory()) throw IsADirectoryError(ctx_.path);
    if (!writable()) throw Error(ErrorCode::Unsupported, fmt::format("file {} is not open for writing", ctx_.path), ctx_.path);

    withRemoteContext("write", ctx_.path, [&] {
        if (!writer_) writer_.emplace(buffer::makeWriter(ctx_.client, ctx_.node.id, ctx_.buffer));
        buffer::write(*writer_, data, len);
    });
    if (readable()) pending_.insert(pending_.end(), data, data + len);
    offset_ += len;
    return len;
}

size_t File::write(const std::string_view data) {
    return write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<FileInfo> File::readdir(const int limit) {
    std::scoped_lock lock(mutex_);
    ensureOpen();
    if (!ctx_.node.isDirectory()) throw NotADirectoryError(ctx_.path);

    const size_t want = limit > 0 ? static_cast<size_t>(limit) : SIZE_MAX;
    std::vector<FileInfo> out;

    while (out.size() < want) {
        if (listed_.empty()) {
            if (listingExhausted_) break;

            auto page = withRemoteContext("readdir", ctx_.path, [&] {
                return ctx_.client->listChildren(ctx_.node.id, pageToken_, ctx_.page_size);
            });
            for (auto& node : page.nodes) {
                ctx_.cache->storeIfAbsent(ctx_.node.id, node);
                listed_.push_back(std::move(node));
            }
            pageToken_ = std::move(page.next_page_token);
            listingExhausted_ = pageToken_.empty();
            continue;
        }

        const auto& node = listed_.front();
        out.emplace_back(node, util::joinPath(ctx_.path, node.name));
        listed_.pop_front();
    }

    log::Registry::fs()->trace("[File::readdir] {} returned {} entries", ctx_.path, out.size());
    return out;
}

std::vector<std::string> File::readdirnames(const int limit) {
    std::vector<std::string> names;
    for (const auto& info : readdir(limit)) names.push_back(info.name);
    return names;
}

void File::truncate(uintmax_t) {
    throw UnsupportedError();
}

void File::closeLocked() {
    closed_ = true;
    if (!writable() || ctx_.node.isDirectory()) return;

    std::optional<Node> updated;
    withRemoteContext("close", ctx_.path, [&] {
        if (writer_) {
            updated = buffer::close(*writer_);
        } else if (ctx_.flags & O_TRUNC) {
            // Nothing written but truncation was requested: commit empty content
            auto session = ctx_.client->beginUpload(ctx_.node.id);
            updated = session->finish();
        }
    });
    writer_.reset();
    pending_.clear();
    window_.clear();

    if (updated) {
        ctx_.node = *updated;
        if (!ctx_.parent_id.empty()) ctx_.cache->store(ctx_.parent_id, ctx_.node);
        log::Registry::fs()->debug("[File::close] {} committed, {} bytes", ctx_.path, ctx_.node.size);
    }
}

void File::close() {
    std::scoped_lock lock(mutex_);
    ensureOpen();
    closeLocked();
}
