#pragma once

#include "fs/buffer/Strategy.hpp"
#include "concurrency/BoundedQueue.hpp"
#include "drive/NodeClient.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

namespace gdfs::fs::buffer {

// Every write goes straight out as one upload chunk.
class DirectWriter {
public:
    explicit DirectWriter(std::unique_ptr<drive::UploadSession> session);

    void write(const uint8_t* data, size_t len);
    drive::Node close();
    void abort();

private:
    std::unique_ptr<drive::UploadSession> session_;
};

// One buffer; a full buffer is flushed synchronously on the writer's thread.
class SimpleWriter {
public:
    SimpleWriter(std::unique_ptr<drive::UploadSession> session, size_t capacity);

    void write(const uint8_t* data, size_t len);
    drive::Node close();
    void abort();

    [[nodiscard]] size_t buffered() const { return buffer_.size(); }

private:
    std::unique_ptr<drive::UploadSession> session_;
    std::vector<uint8_t> buffer_;
    size_t capacity_;

    void flush();
};

// A full buffer is handed to a background upload while the writer fills a fresh one.
// At most one upload is in flight; the next hand-off waits for it.
class AsyncWriter {
public:
    AsyncWriter(std::unique_ptr<drive::UploadSession> session, size_t capacity);
    ~AsyncWriter();

    AsyncWriter(AsyncWriter&&) noexcept = default;
    AsyncWriter& operator=(AsyncWriter&&) = delete;

    void write(const uint8_t* data, size_t len);
    drive::Node close();
    void abort();

private:
    std::unique_ptr<drive::UploadSession> session_;
    std::vector<uint8_t> buffer_;
    size_t capacity_;
    std::future<void> inFlight_;

    void handOff();
    void awaitInFlight();
};

// Writes are pushed into a bounded queue drained by one uploader thread running a single streamed upload.
// A full queue blocks the writer.
class QueueWriter {
public:
    QueueWriter(std::shared_ptr<drive::NodeClient> client, std::string nodeId, size_t chunkSize, size_t depth);
    ~QueueWriter();

    QueueWriter(QueueWriter&&) noexcept = default;
    QueueWriter& operator=(QueueWriter&&) = delete;

    void write(const uint8_t* data, size_t len);
    drive::Node close();
    void abort();

private:
    struct Shared {
        explicit Shared(const size_t depth) : queue(depth) {}

        concurrency::BoundedQueue<std::vector<uint8_t>> queue;
        std::mutex mutex;
        std::exception_ptr error;
        std::optional<drive::Node> result;
        std::atomic<bool> aborted{false};
    };

    std::shared_ptr<Shared> shared_;
    std::vector<uint8_t> pending_;
    size_t chunkSize_;
    std::thread uploader_;

    void push(std::vector<uint8_t> chunk);
    void rethrowIfFailed() const;
    void join();
};

using Writer = std::variant<DirectWriter, SimpleWriter, AsyncWriter, QueueWriter>;

// Opens the upload for `nodeId` in the shape the options ask for.
Writer makeWriter(const std::shared_ptr<drive::NodeClient>& client, const std::string& nodeId, const Options& options);

void write(Writer& writer, const uint8_t* data, size_t len);
drive::Node close(Writer& writer);
void abort(Writer& writer);

}
