#pragma once

#include "drive/NodeClient.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gdfs::drive {

// In-process node graph with the backend's permissive semantics: duplicate names, multiple parents, trash flag.
// Used by the test-suite and by offline mode.
class MemoryClient final : public NodeClient {
public:
    enum class Operation {
        TopNode, GetNode, FindChildren, ListChildren, ListTrashed,
        CreateNode, PatchNode, DeleteNode,
        BeginUpload, UploadChunk, FinishUpload, UploadStream, Download
    };

    MemoryClient();

    [[nodiscard]] Node topNode() override;
    [[nodiscard]] std::optional<Node> getNode(const std::string& id) override;
    [[nodiscard]] std::vector<Node> findChildren(const std::string& parentId, const std::string& name) override;
    [[nodiscard]] NodePage listChildren(const std::string& parentId, const std::string& pageToken, unsigned int pageSize) override;
    [[nodiscard]] NodePage listTrashed(const std::string& pageToken, unsigned int pageSize) override;
    Node createNode(const NewNode& newNode) override;
    Node patchNode(const std::string& id, const NodePatch& patch) override;
    void deleteNode(const std::string& id) override;
    [[nodiscard]] std::unique_ptr<UploadSession> beginUpload(const std::string& id) override;
    Node uploadStream(const std::string& id, const ContentSource& source) override;
    [[nodiscard]] std::vector<uint8_t> download(const std::string& id, uintmax_t offset, uintmax_t length) override;

    // Test hooks
    void linkParent(const std::string& id, const std::string& parentId);
    [[nodiscard]] std::vector<uint8_t> content(const std::string& id) const;
    [[nodiscard]] size_t calls(Operation op) const;
    [[nodiscard]] size_t totalCalls() const;
    void resetCounters();
    void failNext(Operation op, long status, const std::string& message);
    // Runs `action` right before the next `op` takes effect, standing in for another client.
    void raceNext(Operation op, std::function<void()> action);
    void setUploadLatency(std::chrono::milliseconds latency);
    [[nodiscard]] unsigned int maxConcurrentUploads() const { return maxActiveUploads_.load(); }
    [[nodiscard]] size_t nodeCount() const;

private:
    friend class MemoryUploadSession;

    struct Entry {
        Node node;
        std::vector<uint8_t> content{};
        uint64_t seq{0};
    };

    struct Failure {
        long status;
        std::string message;
    };

    mutable std::mutex mutex_;
    std::string topId_;
    std::unordered_map<std::string, Entry> nodes_;
    uint64_t nextSeq_{0};

    mutable std::mutex statsMutex_;
    std::map<Operation, size_t> calls_;
    std::map<Operation, std::deque<Failure>> failures_;
    std::map<Operation, std::deque<std::function<void()>>> races_;
    std::chrono::milliseconds uploadLatency_{0};

    std::atomic<unsigned int> activeUploads_{0}, maxActiveUploads_{0};

    void record(Operation op);
    void simulateTransfer();

    Entry& entryOrThrow(const std::string& id);
    [[nodiscard]] std::vector<const Entry*> childrenOf(const std::string& parentId) const;
    void setTrashedBelow(const std::string& id, bool trashed);
    void dropOrphans(const std::string& removedId);
    Node storeContent(const std::string& id, std::vector<uint8_t> data);

    [[nodiscard]] static std::string newId();
    [[nodiscard]] static NodePage page(const std::vector<const Entry*>& entries, const std::string& pageToken, unsigned int pageSize);
};

std::string to_string(MemoryClient::Operation op);

}
