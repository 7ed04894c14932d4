#include "DriveFixture.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace gdfs::fs;
using gdfs::drive::MemoryClient;
using gdfs::drive::NewNode;
using gdfs::drive::NodeKind;
using Op = MemoryClient::Operation;

class DriveTest : public DriveFixture {};

// ---------------------------------------------------------------------------------------------------------------------
// stat / mkdir / mkdirAll
// ---------------------------------------------------------------------------------------------------------------------

TEST_F(DriveTest, StatRootIsDirectory) {
    const auto info = drive_->stat("");
    EXPECT_TRUE(info.is_directory);
    EXPECT_EQ(info.node.id, drive_->rootNode().id);
    EXPECT_EQ(drive_->stat("/").node.id, info.node.id);
}

TEST_F(DriveTest, MkdirAllThenStat) {
    drive_->mkdirAll("Folder1/Folder2");
    const auto info = drive_->stat("/Folder1/Folder2/");
    EXPECT_TRUE(info.is_directory);
    EXPECT_EQ(info.name, "Folder2");
    EXPECT_EQ(info.path, "Folder1/Folder2");

    // Idempotent
    backend_->resetCounters();
    drive_->mkdirAll("Folder1/Folder2");
    EXPECT_EQ(backend_->calls(Op::CreateNode), 0u);
}

TEST_F(DriveTest, MkdirAllThroughFileNamesTheFile) {
    writeFile("Folder1/File1", "data");
    const auto [code, msg] = errorOf([&] { drive_->mkdirAll("Folder1/File1/Folder2"); });
    EXPECT_EQ(code, ErrorCode::NotADirectory);
    EXPECT_EQ(msg, "file Folder1/File1 is not a directory");
}

TEST_F(DriveTest, StatNamesFirstMissingPrefix) {
    drive_->mkdirAll("Folder1");
    const auto [code, msg] = errorOf([&] { (void)drive_->stat("Folder1/Missing/File1"); });
    EXPECT_EQ(code, ErrorCode::NotExist);
    EXPECT_EQ(msg, "`Folder1/Missing' does not exist");
}

TEST_F(DriveTest, StatThroughFile) {
    writeFile("Folder1/File1", "data");
    const auto [code, msg] = errorOf([&] { (void)drive_->stat("Folder1/File1/File2"); });
    EXPECT_EQ(code, ErrorCode::NotADirectory);
    EXPECT_EQ(msg, "file Folder1/File1 is not a directory");
}

TEST_F(DriveTest, MkdirEmptyPathIsNoOp) {
    backend_->resetCounters();
    EXPECT_NO_THROW(drive_->mkdir(""));
    EXPECT_EQ(backend_->totalCalls(), 0u);
}

TEST_F(DriveTest, MkdirMissingParent) {
    const auto [code, msg] = errorOf([&] { drive_->mkdir("Folder1/Folder2"); });
    EXPECT_EQ(code, ErrorCode::NotExist);
    EXPECT_EQ(msg, "`Folder1' does not exist");
}

TEST_F(DriveTest, MkdirOverFile) {
    writeFile("File1", "x");
    const auto [code, msg] = errorOf([&] { drive_->mkdir("File1"); });
    EXPECT_EQ(code, ErrorCode::AlreadyExists);
    EXPECT_EQ(msg, "`File1' already exists");
}

TEST_F(DriveTest, MkdirExistingDirectoryCreatesNothing) {
    drive_->mkdir("Folder1");
    backend_->resetCounters();
    drive_->mkdir("Folder1");
    EXPECT_EQ(backend_->calls(Op::CreateNode), 0u);
}

TEST_F(DriveTest, RemoteFailureCarriesOperationAndPath) {
    backend_->failNext(Op::CreateNode, 500, "backend exploded");
    try {
        drive_->mkdir("Folder1");
        FAIL() << "expected RemoteOperationError";
    } catch (const RemoteOperationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Remote);
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.operation(), "mkdir");
        EXPECT_EQ(e.path(), "Folder1");
        EXPECT_NE(std::string(e.what()).find("backend exploded"), std::string::npos);
    }
}

TEST_F(DriveTest, MkdirAllAdoptsDirectoryCreatedConcurrently) {
    const auto top = drive_->rootNode();
    gdfs::drive::Node other;
    backend_->raceNext(Op::CreateNode, [&] { other = backend_->createNode(NewNode{"Folder1", top.id, NodeKind::Directory}); });
    backend_->failNext(Op::CreateNode, 409, "already exists");

    EXPECT_NO_THROW(drive_->mkdirAll("Folder1/Folder2"));
    EXPECT_EQ(drive_->stat("Folder1").node.id, other.id);
    EXPECT_TRUE(drive_->stat("Folder1/Folder2").is_directory);
}

TEST_F(DriveTest, MkdirAdoptsDirectoryCreatedConcurrently) {
    const auto top = drive_->rootNode();
    gdfs::drive::Node other;
    backend_->raceNext(Op::CreateNode, [&] { other = backend_->createNode(NewNode{"Folder1", top.id, NodeKind::Directory}); });
    backend_->failNext(Op::CreateNode, 409, "already exists");

    EXPECT_NO_THROW(drive_->mkdir("Folder1"));
    EXPECT_EQ(drive_->stat("Folder1").node.id, other.id);
}

TEST_F(DriveTest, MkdirAllConflictWithNothingThereFails) {
    backend_->failNext(Op::CreateNode, 409, "already exists");
    try {
        drive_->mkdirAll("Folder1");
        FAIL() << "expected RemoteOperationError";
    } catch (const RemoteOperationError& e) {
        EXPECT_EQ(e.status(), 409);
        EXPECT_EQ(e.operation(), "mkdirAll");
    }
}

TEST_F(DriveTest, ConcurrentMkdirAllAndStatShareTheCache) {
    drive_->mkdir("Shared");
    constexpr int threads = 8;
    std::atomic<int> failures{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i)
        workers.emplace_back([&, i] {
            const auto path = "Shared/t" + std::to_string(i) + "/a/b";
            try {
                for (int round = 0; round < 5; ++round) {
                    drive_->mkdirAll(path);
                    if (!drive_->stat(path).is_directory) ++failures;
                    if (!drive_->stat("Shared").is_directory) ++failures;
                }
            } catch (const Error&) {
                ++failures;
            }
        });
    for (auto& t : workers) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(drive_->open("Shared")->readdirnames(0).size(), static_cast<size_t>(threads));
    // Disjoint subtrees: each directory was created exactly once
    EXPECT_EQ(backend_->nodeCount(), 2u + threads * 3u);
}

// ---------------------------------------------------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------------------------------------------------

TEST_F(DriveTest, UnsupportedOperationsMutateNothing) {
    writeFile("File1", "x");
    backend_->resetCounters();

    EXPECT_EQ(errorOf([&] { drive_->chown("File1", 1000, 1000); }).first, ErrorCode::Unsupported);

    const auto file = drive_->openFile("File1", O_RDWR);
    EXPECT_EQ(errorOf([&] { file->truncate(0); }).second, "not supported");
    file->close();

    EXPECT_NO_THROW(drive_->chmod("File1", 0600));

    EXPECT_EQ(backend_->calls(Op::CreateNode), 0u);
    EXPECT_EQ(backend_->calls(Op::PatchNode), 0u);
    EXPECT_EQ(backend_->calls(Op::DeleteNode), 0u);
    EXPECT_EQ(backend_->calls(Op::BeginUpload), 0u);
}

TEST_F(DriveTest, ChmodMissingPathIsAccepted) {
    backend_->resetCounters();
    EXPECT_NO_THROW(drive_->chmod("Missing", 0600));
    EXPECT_EQ(backend_->calls(Op::PatchNode), 0u);
}

TEST_F(DriveTest, ChtimesUpdatesTimestamps) {
    writeFile("File1", "x");
    drive_->chtimes("File1", 1600000000, 1500000000);

    const auto info = drive_->stat("File1");
    EXPECT_EQ(info.modified_at, 1500000000);
    EXPECT_EQ(info.accessed_at, 1600000000);
}

TEST_F(DriveTest, ChtimesOnMissingPathIsNoOp) {
    writeFile("Chtimes", "Chtimes test");
    const auto before = drive_->stat("Chtimes");
    backend_->resetCounters();

    // Names are case sensitive, so "chtimes" does not exist
    EXPECT_NO_THROW(drive_->chtimes("chtimes", 1606435200, 1582675200));
    EXPECT_EQ(backend_->calls(Op::PatchNode), 0u);
    EXPECT_EQ(drive_->stat("Chtimes").modified_at, before.modified_at);
}

// ---------------------------------------------------------------------------------------------------------------------
// rename
// ---------------------------------------------------------------------------------------------------------------------

TEST_F(DriveTest, RenameRootForbidden) {
    const auto [code, msg] = errorOf([&] { drive_->rename("", "Folder1"); });
    EXPECT_EQ(code, ErrorCode::ForbiddenRootOperation);
    EXPECT_EQ(msg, "forbidden for root directory");
}

TEST_F(DriveTest, RenameToEmptyPath) {
    writeFile("File1", "x");
    const auto [code, msg] = errorOf([&] { drive_->rename("File1", "/"); });
    EXPECT_EQ(code, ErrorCode::EmptyPath);
    EXPECT_EQ(msg, "path cannot be empty");
}

TEST_F(DriveTest, RenameToSelfSendsNothing) {
    writeFile("File1", "x");
    backend_->resetCounters();
    drive_->rename("File1", "/File1");
    EXPECT_EQ(backend_->calls(Op::PatchNode), 0u);
}

TEST_F(DriveTest, RenameIntoOwnSubtree) {
    drive_->mkdirAll("Folder1/Folder2");
    EXPECT_EQ(errorOf([&] { drive_->rename("Folder1", "Folder1/Folder2/Folder1"); }).first, ErrorCode::InvalidMove);
}

TEST_F(DriveTest, RenameMovesAcrossDirectoriesInOnePatch) {
    writeFile("Folder1/File1", "payload");
    drive_->mkdir("Folder2");
    backend_->resetCounters();

    drive_->rename("Folder1/File1", "Folder2/Renamed");
    EXPECT_EQ(backend_->calls(Op::PatchNode), 1u);

    EXPECT_EQ(readFile("Folder2/Renamed"), "payload");
    EXPECT_EQ(errorOf([&] { (void)drive_->stat("Folder1/File1"); }).second, "`Folder1/File1' does not exist");
}

TEST_F(DriveTest, RenameKeepsIdentityAndSiblings) {
    writeFile("Folder1/a", "moved");
    writeFile("Folder1/sibling", "stays");
    const auto before = drive_->stat("Folder1/a").node.id;
    const auto sibling = drive_->stat("Folder1/sibling").node.id;

    drive_->rename("Folder1/a", "Folder1/b");

    EXPECT_EQ(drive_->stat("Folder1/b").node.id, before);
    EXPECT_EQ(drive_->stat("Folder1/sibling").node.id, sibling);
    EXPECT_EQ(readFile("Folder1/sibling"), "stays");
    EXPECT_EQ(errorOf([&] { (void)drive_->stat("Folder1/a"); }).first, ErrorCode::NotExist);
}

TEST_F(DriveTest, RenamedDirectoryKeepsDescendants) {
    writeFile("Folder1/Folder2/File1", "deep");
    const auto file = drive_->stat("Folder1/Folder2/File1").node.id;

    drive_->rename("Folder1", "Moved");
    EXPECT_EQ(drive_->stat("Moved/Folder2/File1").node.id, file);
}

TEST_F(DriveTest, RenameReplacesExistingFile) {
    writeFile("File1", "new");
    writeFile("File2", "old");
    drive_->rename("File1", "File2");

    EXPECT_EQ(readFile("File2"), "new");
    EXPECT_EQ(errorOf([&] { (void)drive_->stat("File1"); }).first, ErrorCode::NotExist);
}

TEST_F(DriveTest, RenameOntoDirectoryConflicts) {
    writeFile("File1", "x");
    drive_->mkdir("Folder1");
    const auto [code, msg] = errorOf([&] { drive_->rename("File1", "Folder1"); });
    EXPECT_EQ(code, ErrorCode::AlreadyExists);
    EXPECT_EQ(msg, "`Folder1' already exists");
}

TEST_F(DriveTest, RenameIntoMissingParent) {
    writeFile("File1", "x");
    const auto [code, msg] = errorOf([&] { drive_->rename("File1", "Missing/File1"); });
    EXPECT_EQ(code, ErrorCode::NotExist);
    EXPECT_EQ(msg, "`Missing' does not exist");
}

TEST_F(DriveTest, RenameMissingSource) {
    EXPECT_EQ(errorOf([&] { drive_->rename("Missing", "Other"); }).second, "`Missing' does not exist");
}

// ---------------------------------------------------------------------------------------------------------------------
// remove
// ---------------------------------------------------------------------------------------------------------------------

TEST_F(DriveTest, RemoveRootForbidden) {
    EXPECT_EQ(errorOf([&] { drive_->remove(""); }).first, ErrorCode::ForbiddenRootOperation);
    EXPECT_EQ(errorOf([&] { drive_->removeAll("/"); }).first, ErrorCode::ForbiddenRootOperation);
    EXPECT_EQ(errorOf([&] { drive_->deleteDirectory(""); }).first, ErrorCode::ForbiddenRootOperation);
}

TEST_F(DriveTest, RemoveMissing) {
    EXPECT_EQ(errorOf([&] { drive_->remove("Missing"); }).second, "`Missing' does not exist");
    EXPECT_NO_THROW(drive_->removeAll("Missing/Deeper"));
}

TEST_F(DriveTest, RemoveDirectoryDropsSubtree) {
    writeFile("Folder1/Folder2/File1", "x");
    writeFile("Keep", "y");
    const auto before = backend_->nodeCount();

    drive_->removeAll("Folder1");
    EXPECT_EQ(backend_->nodeCount(), before - 3);
    EXPECT_EQ(errorOf([&] { (void)drive_->stat("Folder1/Folder2/File1"); }).second, "`Folder1' does not exist");
    EXPECT_EQ(readFile("Keep"), "y");
}

TEST_F(DriveTest, DeleteDirectoryRejectsFiles) {
    writeFile("File1", "x");
    EXPECT_EQ(errorOf([&] { drive_->deleteDirectory("File1"); }).first, ErrorCode::NotADirectory);

    drive_->mkdir("Folder1");
    EXPECT_NO_THROW(drive_->deleteDirectory("Folder1"));
    EXPECT_EQ(errorOf([&] { (void)drive_->stat("Folder1"); }).first, ErrorCode::NotExist);
}

// ---------------------------------------------------------------------------------------------------------------------
// openFile
// ---------------------------------------------------------------------------------------------------------------------

TEST_F(DriveTest, OpenMissingCreatesNothing) {
    const auto before = backend_->nodeCount();
    EXPECT_EQ(errorOf([&] { (void)drive_->open("Folder1/File1"); }).second, "`Folder1/File1' does not exist");
    EXPECT_EQ(errorOf([&] { (void)drive_->openFile("File1", O_RDONLY | O_CREAT); }).first, ErrorCode::NotExist);
    EXPECT_EQ(backend_->nodeCount(), before);
}

TEST_F(DriveTest, CreateMakesMissingParents) {
    {
        const auto file = drive_->create("Folder1/Folder2/File1");
        file->write("hello");
        file->close();
    }
    EXPECT_TRUE(drive_->stat("Folder1/Folder2").is_directory);
    EXPECT_EQ(drive_->stat("Folder1/Folder2/File1").size, 5u);
    EXPECT_EQ(readFile("Folder1/Folder2/File1"), "hello");
}

TEST_F(DriveTest, CreateTruncatesExisting) {
    writeFile("File1", "long content");
    {
        const auto file = drive_->create("File1");
        file->close();
    }
    EXPECT_EQ(readFile("File1"), "");
}

TEST_F(DriveTest, OpenRootForWriting) {
    EXPECT_EQ(errorOf([&] { (void)drive_->openFile("", O_WRONLY | O_CREAT); }).first, ErrorCode::EmptyPath);
    EXPECT_EQ(errorOf([&] { (void)drive_->openFile("/", O_RDWR); }).first, ErrorCode::IsADirectory);
    EXPECT_NO_THROW((void)drive_->open(""));
}

TEST_F(DriveTest, OpenExclusiveOnExisting) {
    writeFile("File1", "x");
    const auto [code, msg] = errorOf([&] { (void)drive_->openFile("File1", O_WRONLY | O_CREAT | O_EXCL); });
    EXPECT_EQ(code, ErrorCode::AlreadyExists);
    EXPECT_EQ(msg, "`File1' already exists");
}

TEST_F(DriveTest, OpenAppendUnsupported) {
    writeFile("File1", "x");
    EXPECT_EQ(errorOf([&] { (void)drive_->openFile("File1", O_WRONLY | O_APPEND); }).first, ErrorCode::Unsupported);
}

TEST_F(DriveTest, OpenDirectoryForWriting) {
    drive_->mkdir("Folder1");
    const auto [code, msg] = errorOf([&] { (void)drive_->openFile("Folder1", O_WRONLY); });
    EXPECT_EQ(code, ErrorCode::IsADirectory);
    EXPECT_EQ(msg, "Folder1 is a directory");
}

TEST_F(DriveTest, OpenThroughFile) {
    writeFile("File1", "x");
    const auto [code, msg] = errorOf([&] { (void)drive_->openFile("File1/File2", O_WRONLY | O_CREAT); });
    EXPECT_EQ(code, ErrorCode::NotADirectory);
    EXPECT_EQ(msg, "file File1 is not a directory");
}

TEST_F(DriveTest, DuplicateNamesResolveToOldest) {
    const auto top = drive_->rootNode();
    const auto first = backend_->createNode(NewNode{"dup", top.id, NodeKind::File});
    backend_->createNode(NewNode{"dup", top.id, NodeKind::File});

    EXPECT_EQ(drive_->stat("dup").node.id, first.id);
}

TEST_F(DriveTest, ListingDoesNotChangeWhichDuplicateResolves) {
    drive_->mkdir("D");
    drive_->mkdir("E");
    const auto d = drive_->stat("D").node;
    const auto e = drive_->stat("E").node;
    const auto firstD = backend_->createNode(NewNode{"dup", d.id, NodeKind::File});
    backend_->createNode(NewNode{"dup", d.id, NodeKind::File});
    const auto firstE = backend_->createNode(NewNode{"dup", e.id, NodeKind::File});
    backend_->createNode(NewNode{"dup", e.id, NodeKind::File});

    // Resolved before listing
    EXPECT_EQ(drive_->stat("D/dup").node.id, firstD.id);
    EXPECT_EQ(drive_->open("D")->readdir(0).size(), 2u);
    EXPECT_EQ(drive_->stat("D/dup").node.id, firstD.id);

    // Listed before ever being resolved
    EXPECT_EQ(drive_->open("E")->readdir(0).size(), 2u);
    EXPECT_EQ(drive_->stat("E/dup").node.id, firstE.id);
}

// ---------------------------------------------------------------------------------------------------------------------
// readdir paging
// ---------------------------------------------------------------------------------------------------------------------

class DrivePagingTest : public DriveFixture {
protected:
    DriveOptions options() const override {
        DriveOptions opts;
        opts.page_size = 2;
        return opts;
    }
};

TEST_F(DrivePagingTest, ReaddirPagesPartitionTheListing) {
    for (const auto* name : {"e", "c", "a", "d", "b"}) writeFile(std::string("Folder1/") + name, name);

    const auto dir = drive_->open("Folder1");
    std::vector<std::string> seen;
    for (const size_t expected : {2u, 2u, 1u}) {
        const auto batch = dir->readdirnames(2);
        EXPECT_EQ(batch.size(), expected);
        seen.insert(seen.end(), batch.begin(), batch.end());
    }
    EXPECT_TRUE(dir->readdir(2).empty());
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST_F(DrivePagingTest, HandlesListIndependently) {
    for (const auto* name : {"c", "a", "b"}) writeFile(std::string("Folder1/") + name, name);

    const auto one = drive_->open("Folder1");
    const auto two = drive_->open("Folder1");

    EXPECT_EQ(one->readdirnames(2), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(two->readdirnames(1), (std::vector<std::string>{"a"}));
    EXPECT_EQ(one->readdirnames(2), (std::vector<std::string>{"c"}));
    EXPECT_EQ(two->readdirnames(0), (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(one->readdirnames(0).empty());
}

TEST_F(DrivePagingTest, ConcurrentListingsOfOneDirectory) {
    for (const auto* name : {"e", "c", "a", "d", "b"}) writeFile(std::string("Folder1/") + name, name);
    const std::vector<std::string> expected{"a", "b", "c", "d", "e"};

    std::vector<std::vector<std::string>> results(4);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i)
        workers.emplace_back([&, i] {
            const auto dir = drive_->open("Folder1");
            while (true) {
                const auto batch = dir->readdirnames(2);
                if (batch.empty()) break;
                results[i].insert(results[i].end(), batch.begin(), batch.end());
            }
        });
    for (auto& t : workers) t.join();

    for (const auto& names : results) EXPECT_EQ(names, expected);
}

TEST_F(DrivePagingTest, ReaddirWithoutLimitReturnsEverything) {
    for (const auto* name : {"x", "y", "z"}) writeFile(std::string("Folder1/") + name, name);

    const auto dir = drive_->open("Folder1");
    const auto all = dir->readdir(0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].path, "Folder1/x");
    EXPECT_FALSE(all[0].is_directory);
    EXPECT_EQ(all[2].size, 1u);
    EXPECT_GE(backend_->calls(Op::ListChildren), 2u);
}
