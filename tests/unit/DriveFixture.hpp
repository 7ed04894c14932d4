#pragma once

#include "drive/MemoryClient.hpp"
#include "fs/Drive.hpp"
#include "fs/Error.hpp"
#include "fs/File.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <memory>
#include <string>

class DriveFixture : public ::testing::Test {
protected:
    std::shared_ptr<gdfs::drive::MemoryClient> backend_;
    std::unique_ptr<gdfs::fs::Drive> drive_;

    void SetUp() override {
        backend_ = std::make_shared<gdfs::drive::MemoryClient>();
        drive_ = std::make_unique<gdfs::fs::Drive>(backend_, options());
    }

    virtual gdfs::fs::DriveOptions options() const { return {}; }

    void writeFile(const std::string& path, const std::string& content) const {
        const auto file = drive_->openFile(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        file->write(content);
        file->close();
    }

    std::string readFile(const std::string& path) const {
        const auto file = drive_->open(path);
        const auto data = file->readAll();
        file->close();
        return {data.begin(), data.end()};
    }

    // Error code and message of whatever `fn` throws as a gdfs::fs::Error
    template <typename Fn>
    static std::pair<gdfs::fs::ErrorCode, std::string> errorOf(Fn&& fn) {
        try {
            fn();
        } catch (const gdfs::fs::Error& e) {
            return {e.code(), e.what()};
        }
        ADD_FAILURE() << "expected a gdfs::fs::Error";
        return {gdfs::fs::ErrorCode::Remote, {}};
    }
};
