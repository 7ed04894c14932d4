#pragma once

#include "drive/Node.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gdfs::drive {

// Failure reported by the remote store or the transport. `status` is the HTTP status, 0 for transport errors.
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& msg, const long status = 0)
        : std::runtime_error(msg), status_(status) {}

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] bool notFound() const noexcept { return status_ == 404; }
    [[nodiscard]] bool conflict() const noexcept { return status_ == 409; }

private:
    long status_;
};

struct NewNode {
    std::string name;
    std::string parent_id;
    NodeKind kind{NodeKind::File};
};

// Fields left empty are not sent. Moving is expressed as add_parent + remove_parent in the same patch.
struct NodePatch {
    std::optional<std::string> name{};
    std::optional<std::string> add_parent{}, remove_parent{};
    std::optional<bool> trashed{};
    std::optional<std::time_t> modified_at{}, accessed_at{};

    [[nodiscard]] bool empty() const {
        return !name && !add_parent && !remove_parent && !trashed && !modified_at && !accessed_at;
    }
};

struct NodePage {
    std::vector<Node> nodes;
    std::string next_page_token; // empty when exhausted
};

// Pull-style content source: fill at most `max` bytes, return 0 at end of input.
using ContentSource = std::function<size_t(uint8_t* out, size_t max)>;

// One content replacement in progress. Content becomes visible only after finish().
class UploadSession {
public:
    virtual ~UploadSession() = default;

    virtual void append(const uint8_t* data, size_t len) = 0;
    virtual Node finish() = 0;
    virtual void abort() = 0;
};

class NodeClient {
public:
    virtual ~NodeClient() = default;

    // The backend's absolute top ("My Drive").
    [[nodiscard]] virtual Node topNode() = 0;

    [[nodiscard]] virtual std::optional<Node> getNode(const std::string& id) = 0;

    // Non-trashed children of `parentId` named `name`, oldest first. The backend permits duplicates.
    [[nodiscard]] virtual std::vector<Node> findChildren(const std::string& parentId, const std::string& name) = 0;

    // Non-trashed children ordered by name.
    [[nodiscard]] virtual NodePage listChildren(const std::string& parentId, const std::string& pageToken, unsigned int pageSize) = 0;

    [[nodiscard]] virtual NodePage listTrashed(const std::string& pageToken, unsigned int pageSize) = 0;

    virtual Node createNode(const NewNode& newNode) = 0;
    virtual Node patchNode(const std::string& id, const NodePatch& patch) = 0;

    // Permanent; the backend cascades to descendants.
    virtual void deleteNode(const std::string& id) = 0;

    [[nodiscard]] virtual std::unique_ptr<UploadSession> beginUpload(const std::string& id) = 0;

    // Replaces the content with everything `source` yields, as one continuous request.
    virtual Node uploadStream(const std::string& id, const ContentSource& source) = 0;

    // Up to `length` bytes starting at `offset`; empty at or past the end.
    [[nodiscard]] virtual std::vector<uint8_t> download(const std::string& id, uintmax_t offset, uintmax_t length) = 0;
};

}
