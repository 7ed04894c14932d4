#pragma once

#include "drive/Node.hpp"

#include <string>

namespace gdfs::fs {

// stat() result. `path` is filled by listings that reconstruct it (trash), otherwise it is the requested path.
struct FileInfo {
    std::string name{}, path{};
    uintmax_t size{0};
    bool is_directory{false};
    std::time_t modified_at{}, accessed_at{};
    drive::Node node{};

    FileInfo() = default;
    FileInfo(const drive::Node& n, std::string p)
        : name(n.name), path(std::move(p)), size(n.size), is_directory(n.isDirectory()),
          modified_at(n.modified_at), accessed_at(n.accessed_at), node(n) {}
};

}
