#include <gtest/gtest.h>
#include "auth/Token.hpp"
#include "drive/DriveClient.hpp"
#include "fs/Drive.hpp"
#include "fs/Error.hpp"
#include "fs/File.hpp"
#include "http/Transport.hpp"
#include "util/curlWrappers.hpp"

#include <cstdlib>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace gdfs;
using namespace gdfs::drive;

// ---------------------------------------------------------------------------------------------------------------------
// Request shaping, no network
// ---------------------------------------------------------------------------------------------------------------------

TEST(DriveClientRequestTest, QuoteQueryValueEscapes) {
    EXPECT_EQ(DriveClient::quoteQueryValue("plain"), "'plain'");
    EXPECT_EQ(DriveClient::quoteQueryValue("it's"), "'it\\'s'");
    EXPECT_EQ(DriveClient::quoteQueryValue("a\\b"), "'a\\\\b'");
}

TEST(DriveClientRequestTest, EncodeQueryPercentEncodesValues) {
    EXPECT_EQ(DriveClient::encodeQuery({{"q", "name = 'a b'"}, {"pageSize", "100"}}),
              "q=name%20%3D%20%27a%20b%27&pageSize=100");
    EXPECT_EQ(DriveClient::encodeQuery({}), "");
}

TEST(DriveClientRequestTest, ListingOrdersByNameThenCreation) {
    EXPECT_STREQ(DriveClient::LISTING_ORDER, "name,createdTime");

    const auto query = DriveClient::listQuery("trashed = true", DriveClient::LISTING_ORDER, "tok", 10);
    EXPECT_NE(query.find("&orderBy=name%2CcreatedTime"), std::string::npos);
    EXPECT_NE(query.find("&pageSize=10&"), std::string::npos);
    EXPECT_NE(query.find("&pageToken=tok"), std::string::npos);

    const auto first = DriveClient::listQuery("q", "", "", 5);
    EXPECT_EQ(first.find("orderBy"), std::string::npos);
    EXPECT_EQ(first.find("pageToken"), std::string::npos);
}

TEST(DriveClientRequestTest, PatchBodyOnlyCarriesSetFields) {
    NodePatch patch;
    EXPECT_TRUE(patch.empty());
    EXPECT_TRUE(DriveClient::patchBody(patch).empty());

    patch.name = "renamed";
    patch.trashed = true;
    patch.add_parent = "newParent"; // travels as a query parameter, not in the body
    const auto body = DriveClient::patchBody(patch);
    EXPECT_EQ(body.size(), 2u);
    EXPECT_EQ(body.at("name"), "renamed");
    EXPECT_TRUE(body.at("trashed").get<bool>());
}

TEST(DriveClientRequestTest, RemoteErrorCarriesDriveMessage) {
    util::HttpResponse resp;
    resp.http = 404;
    resp.body = R"({"error":{"code":404,"message":"File not found: abc."}})";

    try {
        DriveClient::throwRemoteError("get abc", resp);
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_TRUE(e.notFound());
        EXPECT_NE(std::string(e.what()).find("File not found: abc."), std::string::npos);
    }

    resp.http = 409;
    resp.body = "not json";
    try {
        DriveClient::throwRemoteError("create", resp);
    } catch (const RemoteError& e) {
        EXPECT_TRUE(e.conflict());
        EXPECT_NE(std::string(e.what()).find("not json"), std::string::npos);
    }
}

// ---------------------------------------------------------------------------------------------------------------------
// Live Drive, skipped unless GDFS_TEST_TOKEN holds a base64 token
// ---------------------------------------------------------------------------------------------------------------------

class DriveClientIntegrationTest : public ::testing::Test {
protected:
    std::shared_ptr<DriveClient> client_;
    std::unique_ptr<fs::Drive> drive_;
    std::string scratchId_;

    void SetUp() override {
        const char* raw = std::getenv("GDFS_TEST_TOKEN");
        if (!raw || !*raw) GTEST_SKIP() << "GDFS_TEST_TOKEN not set";

        const auto token = std::make_shared<const auth::Token>(auth::fromBase64(raw));
        client_ = std::make_shared<DriveClient>(std::make_shared<http::Transport>(token));
        drive_ = std::make_unique<fs::Drive>(client_);

        // Every run works inside its own folder so parallel runs never collide
        const auto name = "gdfs-test-" + boost::uuids::to_string(boost::uuids::random_generator()());
        drive_->mkdir(name);
        scratchId_ = drive_->setRootDirectory(name).id;
    }

    void TearDown() override {
        if (scratchId_.empty()) return;
        try {
            client_->deleteNode(scratchId_);
        } catch (const RemoteError& e) {
            ADD_FAILURE() << "cleanup of " << scratchId_ << " failed: " << e.what();
        }
    }

    void writeFile(const std::string& path, const std::string& content) const {
        const auto file = drive_->openFile(path, O_WRONLY | O_CREAT | O_TRUNC);
        file->write(content);
        file->close();
    }

    std::string readFile(const std::string& path) const {
        const auto file = drive_->open(path);
        const auto data = file->readAll();
        return {data.begin(), data.end()};
    }
};

TEST_F(DriveClientIntegrationTest, WriteReadRoundTrip) {
    writeFile("Folder1/File1", "hello drive");
    EXPECT_EQ(readFile("Folder1/File1"), "hello drive");
    EXPECT_EQ(drive_->stat("Folder1/File1").size, 11u);
    EXPECT_TRUE(drive_->stat("Folder1").is_directory);
}

TEST_F(DriveClientIntegrationTest, ResumableUploadAcrossAlignedChunks) {
    fs::buffer::Options opts;
    opts.strategy = fs::buffer::Strategy::Simple;
    opts.size_bytes = DriveClient::UPLOAD_CHUNK_ALIGN + 1000;
    drive_->setWriteBuffer(opts);

    std::string content(DriveClient::UPLOAD_CHUNK_ALIGN * 2 + 123, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i % 251);

    writeFile("big.bin", content);
    EXPECT_EQ(drive_->stat("big.bin").size, content.size());
    EXPECT_EQ(readFile("big.bin"), content);
}

TEST_F(DriveClientIntegrationTest, StreamedUpload) {
    fs::buffer::Options opts;
    opts.strategy = fs::buffer::Strategy::BoundedQueue;
    opts.size_bytes = 64 * 1024;
    opts.queue_depth = 2;
    drive_->setWriteBuffer(opts);

    const std::string content(300 * 1024, 'q');
    writeFile("streamed.bin", content);
    EXPECT_EQ(readFile("streamed.bin"), content);
}

TEST_F(DriveClientIntegrationTest, RangedRead) {
    writeFile("File1", "0123456789");
    const auto file = drive_->open("File1");
    std::vector<uint8_t> buf(4);
    EXPECT_EQ(file->readAt(buf.data(), buf.size(), 3), 4u);
    EXPECT_EQ(std::string(buf.begin(), buf.end()), "3456");
    EXPECT_EQ(file->readAt(buf.data(), buf.size(), 100), 0u);
}

TEST_F(DriveClientIntegrationTest, ListingPagesAndRename) {
    for (const auto* name : {"c", "a", "b"}) writeFile(std::string("Dir/") + name, name);

    const auto dir = drive_->open("Dir");
    EXPECT_EQ(dir->readdirnames(0), (std::vector<std::string>{"a", "b", "c"}));

    drive_->rename("Dir/a", "Dir/z");
    EXPECT_EQ(readFile("Dir/z"), "a");
    EXPECT_THROW((void)drive_->stat("Dir/a"), fs::NotExistError);
}

TEST_F(DriveClientIntegrationTest, TrashAndRestore) {
    writeFile("Folder1/File1", "trash me");
    drive_->trashPath("Folder1/File1");
    EXPECT_THROW((void)drive_->stat("Folder1/File1"), fs::NotExistError);

    const auto trashed = drive_->listTrash("Folder1");
    ASSERT_EQ(trashed.size(), 1u);
    EXPECT_EQ(trashed.front().path, "Folder1/File1");

    drive_->restore(trashed.front());
    EXPECT_EQ(readFile("Folder1/File1"), "trash me");
}
