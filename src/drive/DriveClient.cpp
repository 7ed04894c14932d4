#include "drive/DriveClient.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <iterator>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace gdfs::drive;
using namespace gdfs::http;
using namespace gdfs::util;
using json = nlohmann::json;

namespace gdfs::drive {

// Resumable upload session. Non-final chunks are sent in UPLOAD_CHUNK_ALIGN multiples; the unaligned tail is held back.
class DriveUploadSession final : public UploadSession {
public:
    DriveUploadSession(std::shared_ptr<Transport> transport, std::string fileId, std::string sessionUrl)
        : transport_(std::move(transport)), fileId_(std::move(fileId)), sessionUrl_(std::move(sessionUrl)) {}

    ~DriveUploadSession() override {
        if (done_) return;
        try {
            abort();
        } catch (const std::exception& e) {
            log::Registry::drive()->warn("[DriveUploadSession] Failed to cancel session for {}: {}", fileId_, e.what());
        }
    }

    void append(const uint8_t* data, const size_t len) override {
        if (done_) throw RemoteError("append on a finished upload session for " + fileId_);
        pending_.insert(pending_.end(), data, data + len);

        const size_t aligned = pending_.size() / DriveClient::UPLOAD_CHUNK_ALIGN * DriveClient::UPLOAD_CHUNK_ALIGN;
        if (aligned == 0) return;

        const auto resp = putChunk(aligned, false);
        if (resp.http != 308) DriveClient::throwRemoteError("upload chunk " + fileId_, resp);
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(aligned));
        offset_ += aligned;
    }

    Node finish() override {
        if (done_) throw RemoteError("finish on a finished upload session for " + fileId_);
        const auto resp = putChunk(pending_.size(), true);
        done_ = true;
        if (!resp.ok()) DriveClient::throwRemoteError("upload finish " + fileId_, resp);

        log::Registry::drive()->debug("[DriveUploadSession] Finished upload of {} ({} bytes)",
                                      fileId_, offset_ + pending_.size());
        return json::parse(resp.body).get<Node>();
    }

    void abort() override {
        if (done_) return;
        done_ = true;

        Request req;
        req.method = "DELETE";
        req.url = sessionUrl_;
        const auto resp = transport_->perform(req);
        // Drive answers a cancelled session with 499
        if (resp.curl != CURLE_OK || (resp.http != 499 && !resp.ok()))
            log::Registry::drive()->warn("[DriveUploadSession] Cancelling session for {} returned HTTP {}", fileId_, resp.http);
    }

private:
    std::shared_ptr<Transport> transport_;
    std::string fileId_, sessionUrl_;
    std::vector<uint8_t> pending_{};
    uintmax_t offset_{0};
    bool done_{false};

    [[nodiscard]] HttpResponse putChunk(const size_t len, const bool last) const {
        Request req;
        req.method = "PUT";
        req.url = sessionUrl_;
        req.body.assign(reinterpret_cast<const char*>(pending_.data()), len);

        if (len == 0) req.headers.push_back(fmt::format("Content-Range: bytes */{}", offset_));
        else if (last) req.headers.push_back(fmt::format("Content-Range: bytes {}-{}/{}", offset_, offset_ + len - 1, offset_ + len));
        else req.headers.push_back(fmt::format("Content-Range: bytes {}-{}/*", offset_, offset_ + len - 1));

        return transport_->perform(req);
    }
};

}

DriveClient::DriveClient(std::shared_ptr<Transport> transport, DriveClientOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    if (!transport_) throw std::invalid_argument("DriveClient requires a transport");
}

std::string DriveClient::quoteQueryValue(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string DriveClient::encodeQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [k, v] : params) {
        if (!out.empty()) out += '&';
        out += k + '=' + Transport::escape(v);
    }
    return out;
}

json DriveClient::patchBody(const NodePatch& patch) {
    json body = json::object();
    if (patch.name) body["name"] = *patch.name;
    if (patch.trashed) body["trashed"] = *patch.trashed;
    if (patch.modified_at) body["modifiedTime"] = formatRfc3339(*patch.modified_at);
    if (patch.accessed_at) body["viewedByMeTime"] = formatRfc3339(*patch.accessed_at);
    return body;
}

void DriveClient::throwRemoteError(const std::string& op, const HttpResponse& resp) {
    if (resp.curl != CURLE_OK) throw RemoteError(op + ": " + resp.error, 0);

    std::string msg = resp.body;
    if (const auto j = json::parse(resp.body, nullptr, false); !j.is_discarded() && j.contains("error")) {
        const auto& err = j["error"];
        if (err.is_object()) msg = err.value("message", msg);
        else if (err.is_string()) msg = err.get<std::string>();
    }
    throw RemoteError(fmt::format("{}: HTTP {}: {}", op, resp.http, msg), resp.http);
}

std::string DriveClient::filesUrl(const std::string& suffix) const {
    return options_.api_base + "/drive/v3/files" + suffix;
}

HttpResponse DriveClient::send(const Request& req) const {
    log::Registry::drive()->trace("[DriveClient] {} {}", req.method, req.url);
    return transport_->perform(req);
}

Node DriveClient::topNode() {
    Request req;
    req.url = filesUrl("/root?" + encodeQuery({{"fields", FILE_FIELDS}}));
    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("get root", resp);
    return json::parse(resp.body).get<Node>();
}

std::optional<Node> DriveClient::getNode(const std::string& id) {
    Request req;
    req.url = filesUrl("/" + Transport::escape(id) + "?" + encodeQuery({{"fields", FILE_FIELDS}}));
    const auto resp = send(req);
    if (resp.http == 404) return std::nullopt;
    if (!resp.ok()) throwRemoteError("get " + id, resp);
    return json::parse(resp.body).get<Node>();
}

std::string DriveClient::listQuery(const std::string& q, const std::string& orderBy,
                                   const std::string& pageToken, const unsigned int pageSize) {
    std::vector<std::pair<std::string, std::string>> params{
        {"q", q},
        {"fields", std::string("nextPageToken,files(") + FILE_FIELDS + ")"},
        {"pageSize", std::to_string(pageSize)},
        {"spaces", "drive"},
    };
    if (!orderBy.empty()) params.emplace_back("orderBy", orderBy);
    if (!pageToken.empty()) params.emplace_back("pageToken", pageToken);
    return encodeQuery(params);
}

NodePage DriveClient::queryFiles(const std::string& q, const std::string& orderBy,
                                 const std::string& pageToken, const unsigned int pageSize) const {
    Request req;
    req.url = filesUrl("?" + listQuery(q, orderBy, pageToken, pageSize));
    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("list files", resp);

    const auto j = json::parse(resp.body);
    NodePage page;
    page.nodes = j.value("files", std::vector<Node>{});
    page.next_page_token = j.value("nextPageToken", std::string());
    return page;
}

std::vector<Node> DriveClient::findChildren(const std::string& parentId, const std::string& name) {
    const auto q = fmt::format("{} in parents and name = {} and trashed = false",
                               quoteQueryValue(parentId), quoteQueryValue(name));
    std::vector<Node> out;
    std::string token;
    do {
        auto page = queryFiles(q, "createdTime", token, 100);
        std::ranges::move(page.nodes, std::back_inserter(out));
        token = std::move(page.next_page_token);
    } while (!token.empty());
    return out;
}

NodePage DriveClient::listChildren(const std::string& parentId, const std::string& pageToken, const unsigned int pageSize) {
    const auto q = fmt::format("{} in parents and trashed = false", quoteQueryValue(parentId));
    return queryFiles(q, LISTING_ORDER, pageToken, pageSize);
}

NodePage DriveClient::listTrashed(const std::string& pageToken, const unsigned int pageSize) {
    return queryFiles("trashed = true", LISTING_ORDER, pageToken, pageSize);
}

Node DriveClient::createNode(const NewNode& newNode) {
    json body = {{"name", newNode.name}, {"parents", {newNode.parent_id}}};
    if (newNode.kind == NodeKind::Directory) body["mimeType"] = FOLDER_MIME_TYPE;

    Request req;
    req.method = "POST";
    req.url = filesUrl("?" + encodeQuery({{"fields", FILE_FIELDS}}));
    req.headers.emplace_back("Content-Type: application/json; charset=UTF-8");
    req.body = body.dump();

    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("create " + newNode.name, resp);

    auto node = json::parse(resp.body).get<Node>();
    log::Registry::drive()->debug("[DriveClient] Created {} '{}' as {}",
                                  node.isDirectory() ? "folder" : "file", node.name, node.id);
    return node;
}

Node DriveClient::patchNode(const std::string& id, const NodePatch& patch) {
    std::vector<std::pair<std::string, std::string>> params{{"fields", FILE_FIELDS}};
    if (patch.add_parent) params.emplace_back("addParents", *patch.add_parent);
    if (patch.remove_parent) params.emplace_back("removeParents", *patch.remove_parent);

    Request req;
    req.method = "PATCH";
    req.url = filesUrl("/" + Transport::escape(id) + "?" + encodeQuery(params));
    req.headers.emplace_back("Content-Type: application/json; charset=UTF-8");
    req.body = patchBody(patch).dump();

    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("update " + id, resp);
    return json::parse(resp.body).get<Node>();
}

void DriveClient::deleteNode(const std::string& id) {
    Request req;
    req.method = "DELETE";
    req.url = filesUrl("/" + Transport::escape(id));
    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("delete " + id, resp);
    log::Registry::drive()->debug("[DriveClient] Deleted {}", id);
}

std::unique_ptr<UploadSession> DriveClient::beginUpload(const std::string& id) {
    Request req;
    req.method = "PATCH";
    req.url = options_.upload_base + "/drive/v3/files/" + Transport::escape(id) + "?" +
              encodeQuery({{"uploadType", "resumable"}, {"fields", FILE_FIELDS}});
    req.headers.emplace_back("Content-Type: application/json; charset=UTF-8");
    req.body = "{}";

    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("start upload " + id, resp);

    auto location = resp.header("Location");
    if (location.empty()) throw RemoteError("start upload " + id + ": response carried no session location", resp.http);
    return std::make_unique<DriveUploadSession>(transport_, id, std::move(location));
}

Node DriveClient::uploadStream(const std::string& id, const ContentSource& source) {
    Request req;
    req.method = "PATCH";
    req.url = options_.upload_base + "/drive/v3/files/" + Transport::escape(id) + "?" +
              encodeQuery({{"uploadType", "media"}, {"fields", FILE_FIELDS}});
    req.headers.emplace_back("Content-Type: application/octet-stream");
    req.reader = [&source](char* out, const size_t max) {
        return source(reinterpret_cast<uint8_t*>(out), max);
    };

    const auto resp = send(req);
    if (!resp.ok()) throwRemoteError("upload " + id, resp);
    return json::parse(resp.body).get<Node>();
}

std::vector<uint8_t> DriveClient::download(const std::string& id, const uintmax_t offset, const uintmax_t length) {
    if (length == 0) return {};

    Request req;
    req.url = filesUrl("/" + Transport::escape(id) + "?alt=media");
    req.headers.push_back(fmt::format("Range: bytes={}-{}", offset, offset + length - 1));

    const auto resp = send(req);
    if (resp.http == 416) return {};
    if (!resp.ok()) throwRemoteError("download " + id, resp);

    // A plain 200 means the range was ignored and the whole body came back
    std::string_view body(resp.body);
    if (resp.http == 200) {
        if (offset >= body.size()) return {};
        body = body.substr(offset, length);
    }
    return {body.begin(), body.end()};
}
