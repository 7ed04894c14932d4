#include "fs/buffer/Writer.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

using namespace gdfs::fs::buffer;
using namespace gdfs::drive;

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}

// ---------------------------------------------------------------------------------------------------------------------
// DirectWriter
// ---------------------------------------------------------------------------------------------------------------------

DirectWriter::DirectWriter(std::unique_ptr<UploadSession> session) : session_(std::move(session)) {}

void DirectWriter::write(const uint8_t* data, const size_t len) {
    if (len == 0) return;
    session_->append(data, len);
}

Node DirectWriter::close() { return session_->finish(); }

void DirectWriter::abort() { session_->abort(); }

// ---------------------------------------------------------------------------------------------------------------------
// SimpleWriter
// ---------------------------------------------------------------------------------------------------------------------

SimpleWriter::SimpleWriter(std::unique_ptr<UploadSession> session, const size_t capacity)
    : session_(std::move(session)), capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("Write buffer size must be positive");
    buffer_.reserve(capacity_);
}

void SimpleWriter::write(const uint8_t* data, size_t len) {
    while (len > 0) {
        const auto n = std::min(len, capacity_ - buffer_.size());
        buffer_.insert(buffer_.end(), data, data + n);
        data += n;
        len -= n;
        if (buffer_.size() == capacity_) flush();
    }
}

void SimpleWriter::flush() {
    if (buffer_.empty()) return;
    session_->append(buffer_.data(), buffer_.size());
    buffer_.clear();
}

Node SimpleWriter::close() {
    flush();
    return session_->finish();
}

void SimpleWriter::abort() {
    buffer_.clear();
    session_->abort();
}

// ---------------------------------------------------------------------------------------------------------------------
// AsyncWriter
// ---------------------------------------------------------------------------------------------------------------------

AsyncWriter::AsyncWriter(std::unique_ptr<UploadSession> session, const size_t capacity)
    : session_(std::move(session)), capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("Write buffer size must be positive");
    buffer_.reserve(capacity_);
}

AsyncWriter::~AsyncWriter() {
    if (inFlight_.valid()) inFlight_.wait();
}

void AsyncWriter::awaitInFlight() {
    if (!inFlight_.valid()) return;
    inFlight_.get(); // rethrows a failed background upload
}

void AsyncWriter::handOff() {
    awaitInFlight();

    std::vector<uint8_t> full;
    full.reserve(capacity_);
    full.swap(buffer_);

    inFlight_ = std::async(std::launch::async, [session = session_.get(), chunk = std::move(full)] {
        session->append(chunk.data(), chunk.size());
    });
}

void AsyncWriter::write(const uint8_t* data, size_t len) {
    while (len > 0) {
        const auto n = std::min(len, capacity_ - buffer_.size());
        buffer_.insert(buffer_.end(), data, data + n);
        data += n;
        len -= n;
        if (buffer_.size() == capacity_) handOff();
    }
}

Node AsyncWriter::close() {
    awaitInFlight();
    if (!buffer_.empty()) session_->append(buffer_.data(), buffer_.size());
    buffer_.clear();
    return session_->finish();
}

void AsyncWriter::abort() {
    if (inFlight_.valid()) inFlight_.wait();
    buffer_.clear();
    session_->abort();
}

// ---------------------------------------------------------------------------------------------------------------------
// QueueWriter
// ---------------------------------------------------------------------------------------------------------------------

QueueWriter::QueueWriter(std::shared_ptr<NodeClient> client, std::string nodeId, const size_t chunkSize, const size_t depth)
    : shared_(std::make_shared<Shared>(depth)), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) throw std::invalid_argument("Write buffer size must be positive");

    uploader_ = std::thread([shared = shared_, client = std::move(client), id = std::move(nodeId)] {
        std::vector<uint8_t> current;
        size_t offset = 0;

        const ContentSource source = [&](uint8_t* out, const size_t max) -> size_t {
            while (offset == current.size()) {
                auto next = shared->queue.pop();
                if (!next) {
                    if (shared->aborted) throw std::runtime_error("upload of " + id + " aborted");
                    return 0;
                }
                current = std::move(*next);
                offset = 0;
            }
            const auto n = std::min(max, current.size() - offset);
            std::memcpy(out, current.data() + offset, n);
            offset += n;
            return n;
        };

        try {
            auto node = client->uploadStream(id, source);
            std::scoped_lock lock(shared->mutex);
            shared->result = std::move(node);
        } catch (const std::exception& e) {
            if (!shared->aborted) log::Registry::buffer()->error("[QueueWriter] Streamed upload of {} failed: {}", id, e.what());
            std::scoped_lock lock(shared->mutex);
            shared->error = std::current_exception();
        }

        // Unblocks a writer waiting on a full queue after a failure
        shared->queue.close();
    });
}

QueueWriter::~QueueWriter() {
    if (uploader_.joinable()) abort();
}

void QueueWriter::rethrowIfFailed() const {
    std::scoped_lock lock(shared_->mutex);
    if (shared_->error) std::rethrow_exception(shared_->error);
}

void QueueWriter::push(std::vector<uint8_t> chunk) {
    if (shared_->queue.push(std::move(chunk))) return;
    rethrowIfFailed();
    throw std::runtime_error("Upload queue closed unexpectedly");
}

void QueueWriter::write(const uint8_t* data, size_t len) {
    rethrowIfFailed();
    while (len > 0) {
        const auto n = std::min(len, chunkSize_ - pending_.size());
        pending_.insert(pending_.end(), data, data + n);
        data += n;
        len -= n;
        if (pending_.size() == chunkSize_) {
            std::vector<uint8_t> full;
            full.swap(pending_);
            push(std::move(full));
        }
    }
}

void QueueWriter::join() {
    if (uploader_.joinable()) uploader_.join();
}

Node QueueWriter::close() {
    if (!pending_.empty()) {
        std::vector<uint8_t> rest;
        rest.swap(pending_);
        if (!shared_->queue.push(std::move(rest))) {
            join();
            rethrowIfFailed();
            throw std::runtime_error("Upload queue closed unexpectedly");
        }
    }

    shared_->queue.close();
    join();
    rethrowIfFailed();

    std::scoped_lock lock(shared_->mutex);
    if (!shared_->result) throw std::runtime_error("Streamed upload finished without a result");
    return *shared_->result;
}

void QueueWriter::abort() {
    shared_->aborted = true;
    shared_->queue.close();
    join();
    pending_.clear();
}

// ---------------------------------------------------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------------------------------------------------

Writer gdfs::fs::buffer::makeWriter(const std::shared_ptr<NodeClient>& client, const std::string& nodeId, const Options& options) {
    log::Registry::buffer()->debug("[makeWriter] Opening {} writer for {} (buffer {} bytes, depth {})",
                                   to_string(options.strategy), nodeId, options.size_bytes, options.queue_depth);

    switch (options.strategy) {
        case Strategy::None:
            return Writer(std::in_place_type<DirectWriter>, client->beginUpload(nodeId));
        case Strategy::Simple:
            return Writer(std::in_place_type<SimpleWriter>, client->beginUpload(nodeId), options.size_bytes);
        case Strategy::Async:
            return Writer(std::in_place_type<AsyncWriter>, client->beginUpload(nodeId), options.size_bytes);
        case Strategy::BoundedQueue:
            return Writer(std::in_place_type<QueueWriter>, client, nodeId, options.size_bytes, options.queue_depth);
    }
    throw std::invalid_argument("Unknown write buffer strategy");
}

void gdfs::fs::buffer::write(Writer& writer, const uint8_t* data, const size_t len) {
    std::visit([&](auto& w) { w.write(data, len); }, writer);
}

Node gdfs::fs::buffer::close(Writer& writer) {
    return std::visit(Overloaded{
        [](DirectWriter& w) { return w.close(); },
        [](SimpleWriter& w) { return w.close(); },
        [](AsyncWriter& w) { return w.close(); },
        [](QueueWriter& w) { return w.close(); }
    }, writer);
}

void gdfs::fs::buffer::abort(Writer& writer) {
    std::visit([](auto& w) { w.abort(); }, writer);
}
