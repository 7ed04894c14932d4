#pragma once

#include "drive/NodeClient.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace gdfs::fs {

enum class ErrorCode {
    NotExist,
    NotADirectory,
    IsADirectory,
    AlreadyExists,
    EmptyPath,
    ForbiddenRootOperation,
    Unsupported,
    InvalidMove,
    Closed,
    Remote
};

std::string to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(const ErrorCode code, const std::string& msg, std::string path = {})
        : std::runtime_error(msg), code_(code), path_(std::move(path)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    ErrorCode code_;
    std::string path_;
};

// "`<path>' does not exist"
class NotExistError : public Error {
public:
    explicit NotExistError(const std::string& path);
};

// "file <path> is not a directory"
class NotADirectoryError : public Error {
public:
    explicit NotADirectoryError(const std::string& path);
};

class IsADirectoryError : public Error {
public:
    explicit IsADirectoryError(const std::string& path);
};

class AlreadyExistsError : public Error {
public:
    explicit AlreadyExistsError(const std::string& path);
};

class EmptyPathError : public Error {
public:
    EmptyPathError();
};

class ForbiddenRootError : public Error {
public:
    ForbiddenRootError();
};

class UnsupportedError : public Error {
public:
    UnsupportedError();
};

class InvalidMoveError : public Error {
public:
    InvalidMoveError(const std::string& from, const std::string& to);
};

class ClosedError : public Error {
public:
    explicit ClosedError(const std::string& path);
};

// A backend or transport failure with the operation and path that triggered it.
class RemoteOperationError : public Error {
public:
    RemoteOperationError(const std::string& op, const std::string& path, const std::string& cause, long status);

    [[nodiscard]] const std::string& operation() const noexcept { return op_; }
    [[nodiscard]] long status() const noexcept { return status_; }

private:
    std::string op_;
    long status_;
};

void logRemoteFailure(const std::string& op, const std::string& path, const drive::RemoteError& e);

// Runs `fn`, re-raising backend failures with the operation and path attached.
template <typename Fn>
decltype(auto) withRemoteContext(const std::string& op, const std::string& path, Fn&& fn) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const drive::RemoteError& e) {
        logRemoteFailure(op, path, e);
        throw RemoteOperationError(op, path, e.what(), e.status());
    }
}

}
