#include "drive/MemoryClient.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace gdfs::drive;

namespace gdfs::drive {

class MemoryUploadSession final : public UploadSession {
public:
    MemoryUploadSession(MemoryClient& client, std::string id) : client_(client), id_(std::move(id)) {}

    void append(const uint8_t* data, const size_t len) override {
        if (done_) throw RemoteError("append on a finished upload session for " + id_);
        client_.record(MemoryClient::Operation::UploadChunk);
        client_.simulateTransfer();
        staged_.insert(staged_.end(), data, data + len);
    }

    Node finish() override {
        if (done_) throw RemoteError("finish on a finished upload session for " + id_);
        done_ = true;
        client_.record(MemoryClient::Operation::FinishUpload);
        return client_.storeContent(id_, std::move(staged_));
    }

    void abort() override {
        done_ = true;
        staged_.clear();
    }

private:
    MemoryClient& client_;
    std::string id_;
    std::vector<uint8_t> staged_{};
    bool done_{false};
};

}

std::string gdfs::drive::to_string(const MemoryClient::Operation op) {
    switch (op) {
        case MemoryClient::Operation::TopNode: return "topNode";
        case MemoryClient::Operation::GetNode: return "getNode";
        case MemoryClient::Operation::FindChildren: return "findChildren";
        case MemoryClient::Operation::ListChildren: return "listChildren";
        case MemoryClient::Operation::ListTrashed: return "listTrashed";
        case MemoryClient::Operation::CreateNode: return "createNode";
        case MemoryClient::Operation::PatchNode: return "patchNode";
        case MemoryClient::Operation::DeleteNode: return "deleteNode";
        case MemoryClient::Operation::BeginUpload: return "beginUpload";
        case MemoryClient::Operation::UploadChunk: return "uploadChunk";
        case MemoryClient::Operation::FinishUpload: return "finishUpload";
        case MemoryClient::Operation::UploadStream: return "uploadStream";
        case MemoryClient::Operation::Download: return "download";
    }
    return "unknown";
}

MemoryClient::MemoryClient() {
    Entry top;
    top.node.id = topId_ = newId();
    top.node.name = "My Drive";
    top.node.kind = NodeKind::Directory;
    top.node.mime_type = FOLDER_MIME_TYPE;
    top.node.created_at = top.node.modified_at = util::now();
    top.seq = nextSeq_++;
    nodes_.emplace(topId_, std::move(top));
}

std::string MemoryClient::newId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

void MemoryClient::record(const Operation op) {
    std::function<void()> race;
    std::optional<Failure> failure;
    {
        std::scoped_lock lock(statsMutex_);
        ++calls_[op];

        if (const auto it = races_.find(op); it != races_.end() && !it->second.empty()) {
            race = std::move(it->second.front());
            it->second.pop_front();
        }
        if (const auto it = failures_.find(op); it != failures_.end() && !it->second.empty()) {
            failure = it->second.front();
            it->second.pop_front();
        }
    }

    // Outside the stats lock: the action may call back into this client
    if (race) race();
    if (!failure) return;

    log::Registry::drive()->debug("[MemoryClient] Injected failure for {}: {} {}", to_string(op), failure->status, failure->message);
    throw RemoteError(failure->message, failure->status);
}

void MemoryClient::simulateTransfer() {
    const auto active = ++activeUploads_;
    auto seen = maxActiveUploads_.load();
    while (active > seen && !maxActiveUploads_.compare_exchange_weak(seen, active)) {}

    std::chrono::milliseconds latency;
    {
        std::scoped_lock lock(statsMutex_);
        latency = uploadLatency_;
    }
    if (latency.count() > 0) std::this_thread::sleep_for(latency);
    --activeUploads_;
}

MemoryClient::Entry& MemoryClient::entryOrThrow(const std::string& id) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw RemoteError("File not found: " + id, 404);
    return it->second;
}

std::vector<const MemoryClient::Entry*> MemoryClient::childrenOf(const std::string& parentId) const {
    std::vector<const Entry*> out;
    for (const auto& [id, entry] : nodes_)
        if (entry.node.hasParent(parentId)) out.push_back(&entry);
    return out;
}

NodePage MemoryClient::page(const std::vector<const Entry*>& entries, const std::string& pageToken, const unsigned int pageSize) {
    size_t offset = 0;
    if (!pageToken.empty()) {
        try {
            offset = std::stoul(pageToken);
        } catch (const std::exception&) {
            throw RemoteError("Invalid page token: " + pageToken, 400);
        }
    }

    NodePage out;
    const size_t limit = pageSize == 0 ? entries.size() : pageSize;
    for (size_t i = offset; i < entries.size() && out.nodes.size() < limit; ++i)
        out.nodes.push_back(entries[i]->node);

    if (const auto next = offset + out.nodes.size(); next < entries.size())
        out.next_page_token = std::to_string(next);
    return out;
}

Node MemoryClient::topNode() {
    record(Operation::TopNode);
    std::scoped_lock lock(mutex_);
    return nodes_.at(topId_).node;
}

std::optional<Node> MemoryClient::getNode(const std::string& id) {
    record(Operation::GetNode);
    std::scoped_lock lock(mutex_);
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second.node;
}

std::vector<Node> MemoryClient::findChildren(const std::string& parentId, const std::string& name) {
    record(Operation::FindChildren);
    std::scoped_lock lock(mutex_);

    auto children = childrenOf(parentId);
    std::erase_if(children, [&](const Entry* e) { return e->node.trashed || e->node.name != name; });
    std::ranges::sort(children, {}, &Entry::seq);

    std::vector<Node> out;
    out.reserve(children.size());
    for (const auto* e : children) out.push_back(e->node);
    return out;
}

NodePage MemoryClient::listChildren(const std::string& parentId, const std::string& pageToken, const unsigned int pageSize) {
    record(Operation::ListChildren);
    std::scoped_lock lock(mutex_);

    auto children = childrenOf(parentId);
    std::erase_if(children, [](const Entry* e) { return e->node.trashed; });
    std::ranges::sort(children, [](const Entry* a, const Entry* b) {
        return a->node.name != b->node.name ? a->node.name < b->node.name : a->seq < b->seq;
    });
    return page(children, pageToken, pageSize);
}

NodePage MemoryClient::listTrashed(const std::string& pageToken, const unsigned int pageSize) {
    record(Operation::ListTrashed);
    std::scoped_lock lock(mutex_);

    std::vector<const Entry*> trashed;
    for (const auto& [id, entry] : nodes_)
        if (entry.node.trashed) trashed.push_back(&entry);
    std::ranges::sort(trashed, [](const Entry* a, const Entry* b) {
        return a->node.name != b->node.name ? a->node.name < b->node.name : a->seq < b->seq;
    });
    return page(trashed, pageToken, pageSize);
}

Node MemoryClient::createNode(const NewNode& newNode) {
    record(Operation::CreateNode);
    std::scoped_lock lock(mutex_);

    const auto& parent = entryOrThrow(newNode.parent_id);
    if (!parent.node.isDirectory()) throw RemoteError("Parent is not a folder: " + newNode.parent_id, 400);

    Entry entry;
    entry.node.id = newId();
    entry.node.name = newNode.name;
    entry.node.kind = newNode.kind;
    entry.node.mime_type = newNode.kind == NodeKind::Directory ? FOLDER_MIME_TYPE : "application/octet-stream";
    entry.node.parents = {newNode.parent_id};
    entry.node.created_at = entry.node.modified_at = util::now();
    entry.seq = nextSeq_++;

    auto node = entry.node;
    nodes_.emplace(node.id, std::move(entry));
    return node;
}

void MemoryClient::setTrashedBelow(const std::string& id, const bool trashed) {
    for (const auto* child : childrenOf(id)) {
        auto& e = nodes_.at(child->node.id);
        if (e.node.explicitly_trashed || e.node.trashed == trashed) continue;
        e.node.trashed = trashed;
        setTrashedBelow(e.node.id, trashed);
    }
}

Node MemoryClient::patchNode(const std::string& id, const NodePatch& patch) {
    record(Operation::PatchNode);
    std::scoped_lock lock(mutex_);

    auto& entry = entryOrThrow(id);
    if (patch.add_parent) {
        const auto& parent = entryOrThrow(*patch.add_parent);
        if (!parent.node.isDirectory()) throw RemoteError("Parent is not a folder: " + *patch.add_parent, 400);
    }

    auto& node = entry.node;
    if (patch.name) node.name = *patch.name;
    if (patch.remove_parent) std::erase(node.parents, *patch.remove_parent);
    if (patch.add_parent && !node.hasParent(*patch.add_parent)) node.parents.push_back(*patch.add_parent);
    if (patch.modified_at) node.modified_at = *patch.modified_at;
    if (patch.accessed_at) node.accessed_at = *patch.accessed_at;
    if (patch.trashed) {
        node.trashed = node.explicitly_trashed = *patch.trashed;
        setTrashedBelow(id, *patch.trashed);
    }
    return node;
}

void MemoryClient::dropOrphans(const std::string& removedId) {
    std::vector<std::string> orphans;
    for (auto& [id, entry] : nodes_) {
        if (!entry.node.hasParent(removedId)) continue;
        std::erase(entry.node.parents, removedId);
        if (entry.node.parents.empty()) orphans.push_back(id);
    }
    for (const auto& id : orphans) {
        nodes_.erase(id);
        dropOrphans(id);
    }
}

void MemoryClient::deleteNode(const std::string& id) {
    record(Operation::DeleteNode);
    std::scoped_lock lock(mutex_);

    if (id == topId_) throw RemoteError("The root folder cannot be deleted", 403);
    entryOrThrow(id);
    nodes_.erase(id);
    dropOrphans(id);
}

void MemoryClient::linkParent(const std::string& id, const std::string& parentId) {
    std::scoped_lock lock(mutex_);
    entryOrThrow(parentId);
    auto& node = entryOrThrow(id).node;
    if (!node.hasParent(parentId)) node.parents.push_back(parentId);
}

Node MemoryClient::storeContent(const std::string& id, std::vector<uint8_t> data) {
    std::scoped_lock lock(mutex_);
    auto& entry = entryOrThrow(id);
    if (entry.node.isDirectory()) throw RemoteError("Cannot upload content to a folder: " + id, 400);
    entry.content = std::move(data);
    entry.node.size = entry.content.size();
    entry.node.modified_at = util::now();
    return entry.node;
}

std::unique_ptr<UploadSession> MemoryClient::beginUpload(const std::string& id) {
    record(Operation::BeginUpload);
    {
        std::scoped_lock lock(mutex_);
        entryOrThrow(id);
    }
    return std::make_unique<MemoryUploadSession>(*this, id);
}

Node MemoryClient::uploadStream(const std::string& id, const ContentSource& source) {
    record(Operation::UploadStream);

    std::vector<uint8_t> data;
    std::vector<uint8_t> chunk(64 * 1024);
    while (const auto n = source(chunk.data(), chunk.size())) {
        simulateTransfer();
        data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return storeContent(id, std::move(data));
}

std::vector<uint8_t> MemoryClient::download(const std::string& id, const uintmax_t offset, const uintmax_t length) {
    record(Operation::Download);
    std::scoped_lock lock(mutex_);

    const auto& content = entryOrThrow(id).content;
    if (offset >= content.size()) return {};
    const auto end = offset + std::min<uintmax_t>(length, content.size() - offset);
    return {content.begin() + static_cast<std::ptrdiff_t>(offset), content.begin() + static_cast<std::ptrdiff_t>(end)};
}

std::vector<uint8_t> MemoryClient::content(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw RemoteError("File not found: " + id, 404);
    return it->second.content;
}

size_t MemoryClient::calls(const Operation op) const {
    std::scoped_lock lock(statsMutex_);
    const auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

size_t MemoryClient::totalCalls() const {
    std::scoped_lock lock(statsMutex_);
    size_t total = 0;
    for (const auto& [op, n] : calls_) total += n;
    return total;
}

void MemoryClient::resetCounters() {
    std::scoped_lock lock(statsMutex_);
    calls_.clear();
    maxActiveUploads_ = 0;
}

void MemoryClient::failNext(const Operation op, const long status, const std::string& message) {
    std::scoped_lock lock(statsMutex_);
    failures_[op].push_back({status, message});
}

void MemoryClient::raceNext(const Operation op, std::function<void()> action) {
    std::scoped_lock lock(statsMutex_);
    races_[op].push_back(std::move(action));
}

void MemoryClient::setUploadLatency(const std::chrono::milliseconds latency) {
    std::scoped_lock lock(statsMutex_);
    uploadLatency_ = latency;
}

size_t MemoryClient::nodeCount() const {
    std::scoped_lock lock(mutex_);
    return nodes_.size();
}
