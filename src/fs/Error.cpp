#include "fs/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace gdfs::fs;

std::string gdfs::fs::to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotExist: return "not_exist";
        case ErrorCode::NotADirectory: return "not_a_directory";
        case ErrorCode::IsADirectory: return "is_a_directory";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::EmptyPath: return "empty_path";
        case ErrorCode::ForbiddenRootOperation: return "forbidden_root_operation";
        case ErrorCode::Unsupported: return "unsupported";
        case ErrorCode::InvalidMove: return "invalid_move";
        case ErrorCode::Closed: return "closed";
        case ErrorCode::Remote: return "remote";
    }
    return "unknown";
}

NotExistError::NotExistError(const std::string& path)
    : Error(ErrorCode::NotExist, fmt::format("`{}' does not exist", path), path) {}

NotADirectoryError::NotADirectoryError(const std::string& path)
    : Error(ErrorCode::NotADirectory, fmt::format("file {} is not a directory", path), path) {}

IsADirectoryError::IsADirectoryError(const std::string& path)
    : Error(ErrorCode::IsADirectory, fmt::format("{} is a directory", path), path) {}

AlreadyExistsError::AlreadyExistsError(const std::string& path)
    : Error(ErrorCode::AlreadyExists, fmt::format("`{}' already exists", path), path) {}

EmptyPathError::EmptyPathError()
    : Error(ErrorCode::EmptyPath, "path cannot be empty") {}

ForbiddenRootError::ForbiddenRootError()
    : Error(ErrorCode::ForbiddenRootOperation, "forbidden for root directory") {}

UnsupportedError::UnsupportedError()
    : Error(ErrorCode::Unsupported, "not supported") {}

InvalidMoveError::InvalidMoveError(const std::string& from, const std::string& to)
    : Error(ErrorCode::InvalidMove, fmt::format("cannot move {} into its own subtree {}", from, to), from) {}

ClosedError::ClosedError(const std::string& path)
    : Error(ErrorCode::Closed, fmt::format("file {} already closed", path), path) {}

RemoteOperationError::RemoteOperationError(const std::string& op, const std::string& path,
                                           const std::string& cause, const long status)
    : Error(ErrorCode::Remote, fmt::format("{} {}: {}", op, path.empty() ? "/" : path, cause), path),
      op_(op), status_(status) {}

void gdfs::fs::logRemoteFailure(const std::string& op, const std::string& path, const drive::RemoteError& e) {
    log::Registry::fs()->error("[{}] Remote call failed for '{}' (HTTP {}): {}", op, path, e.status(), e.what());
}
