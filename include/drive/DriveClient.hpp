#pragma once

#include "drive/NodeClient.hpp"

#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gdfs::http {
class Transport;
struct Request;
}

namespace gdfs::util {
struct HttpResponse;
}

namespace gdfs::drive {

struct DriveClientOptions {
    std::string api_base = "https://www.googleapis.com";
    std::string upload_base = "https://www.googleapis.com/upload";
};

// Google Drive v3 REST binding.
class DriveClient final : public NodeClient {
public:
    static constexpr const char* FILE_FIELDS =
        "id,name,mimeType,parents,size,modifiedTime,viewedByMeTime,createdTime,trashed,explicitlyTrashed";

    // Ties between duplicate names break on creation time, so pages partition the listing.
    static constexpr const char* LISTING_ORDER = "name,createdTime";

    // Non-final resumable chunks must be a multiple of this.
    static constexpr size_t UPLOAD_CHUNK_ALIGN = 256 * 1024;

    explicit DriveClient(std::shared_ptr<http::Transport> transport, DriveClientOptions options = {});

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

    // Drive query string literal: wrapped in single quotes, with \ and ' escaped.
    [[nodiscard]] static std::string quoteQueryValue(const std::string& value);

    // Builds "k1=v1&k2=v2" with values percent-encoded.
    [[nodiscard]] static std::string encodeQuery(const std::vector<std::pair<std::string, std::string>>& params);

    // files.list query string; empty orderBy and pageToken are left out.
    [[nodiscard]] static std::string listQuery(const std::string& q, const std::string& orderBy,
                                               const std::string& pageToken, unsigned int pageSize);

    [[nodiscard]] static nlohmann::json patchBody(const NodePatch& patch);

    // Turns a failed response into a RemoteError carrying Drive's error message when present.
    [[noreturn]] static void throwRemoteError(const std::string& op, const util::HttpResponse& resp);

private:
    std::shared_ptr<http::Transport> transport_;
    DriveClientOptions options_;

    [[nodiscard]] std::string filesUrl(const std::string& suffix = {}) const;
    [[nodiscard]] NodePage queryFiles(const std::string& q, const std::string& orderBy,
                                      const std::string& pageToken, unsigned int pageSize) const;
    [[nodiscard]] util::HttpResponse send(const http::Request& req) const;
};

}
