// Config and logging
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Backend
#include "auth/Token.hpp"
#include "http/Transport.hpp"
#include "drive/DriveClient.hpp"
#include "drive/MemoryClient.hpp"

// Filesystem
#include "fs/Drive.hpp"
#include "fs/File.hpp"
#include "fs/Error.hpp"
#include "util/timestamp.hpp"

// Libraries
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <fcntl.h>
#include <fmt/core.h>

using namespace gdfs;
using namespace gdfs::config;

namespace {

struct CliOptions {
    std::optional<std::string> config_path{}, root_path{}, root_id{}, strategy{};
    bool offline = false;
    bool trash = false;
    std::vector<std::string> args{};
};

void printUsage() {
    std::cerr <<
        "usage: gdfs [--config <file>] [--offline] [--root <path>] [--root-id <id>]\n"
        "            [--strategy none|simple|async|queue] [--trash] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  ls [path]                 list a directory\n"
        "  stat <path>               show metadata\n"
        "  mkdir [-p] <path>         create a directory\n"
        "  put <local> <remote>      upload a local file\n"
        "  get <remote> [local]      download to a file or stdout\n"
        "  mv <from> <to>            rename or move\n"
        "  rm [-r] <path>            delete (or trash with --trash)\n"
        "  trash <path>              move to trash\n"
        "  lstrash [scope]           list trashed entries\n"
        "  restore <path>            restore a trashed entry\n";
}

std::optional<CliOptions> parseArgs(const int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto needsValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (!opts.args.empty()) opts.args.push_back(arg);
        else if (arg == "--config") { if (!(opts.config_path = needsValue())) return std::nullopt; }
        else if (arg == "--root") { if (!(opts.root_path = needsValue())) return std::nullopt; }
        else if (arg == "--root-id") { if (!(opts.root_id = needsValue())) return std::nullopt; }
        else if (arg == "--strategy") { if (!(opts.strategy = needsValue())) return std::nullopt; }
        else if (arg == "--offline") opts.offline = true;
        else if (arg == "--trash") opts.trash = true;
        else if (arg == "-h" || arg == "--help") return std::nullopt;
        else if (arg.starts_with("--")) {
            std::cerr << "unknown option " << arg << "\n";
            return std::nullopt;
        }
        else opts.args.push_back(arg);
    }
    if (opts.args.empty()) return std::nullopt;
    return opts;
}

auth::Token loadToken(const Config& cfg) {
    if (const char* blob = std::getenv("GDFS_TOKEN"); blob && *blob) return auth::fromBase64(blob);
    if (!cfg.auth.token_file.empty()) return auth::loadTokenFromFile(cfg.auth.token_file);
    throw std::runtime_error("no credentials: set auth.token_file in the config or GDFS_TOKEN");
}

std::shared_ptr<drive::NodeClient> makeClient(const Config& cfg, const bool offline) {
    if (offline) {
        log::Registry::gdfs()->info("[main] Running against the in-memory backend");
        return std::make_shared<drive::MemoryClient>();
    }

    auto token = std::make_shared<const auth::Token>(loadToken(cfg));
    http::TransportOptions topts;
    topts.connect_timeout_sec = cfg.drive.connect_timeout_sec;
    topts.transfer_timeout_sec = cfg.drive.transfer_timeout_sec;

    auto transport = std::make_shared<http::Transport>(std::move(token), topts);
    return std::make_shared<drive::DriveClient>(std::move(transport),
                                                drive::DriveClientOptions{cfg.drive.api_base, cfg.drive.upload_base});
}

std::string describe(const fs::FileInfo& info) {
    return fmt::format("{} {:>12} {} {}", info.is_directory ? 'd' : '-', info.size,
                       util::formatRfc3339(info.modified_at), info.path.empty() ? info.name : info.path);
}

const std::string& argOr(const std::vector<std::string>& args, const size_t i, const std::string& fallback) {
    return i < args.size() ? args[i] : fallback;
}

int run(fs::Drive& drive, const std::vector<std::string>& args) {
    const auto& cmd = args[0];
    static const std::string root;

    if (cmd == "ls") {
        const auto dir = drive.open(argOr(args, 1, root));
        for (const auto& info : dir->readdir(0)) fmt::print("{}\n", describe(info));
        return 0;
    }

    if (cmd == "stat" && args.size() == 2) {
        const auto info = drive.stat(args[1]);
        fmt::print("{}\nid: {}\n", describe(info), info.node.id);
        return 0;
    }

    if (cmd == "mkdir" && args.size() >= 2) {
        if (args[1] == "-p" && args.size() == 3) drive.mkdirAll(args[2]);
        else drive.mkdir(args[1]);
        return 0;
    }

    if (cmd == "put" && args.size() == 3) {
        std::ifstream in(args[1], std::ios::binary);
        if (!in) throw std::runtime_error("couldn't open " + args[1]);

        const auto file = drive.openFile(args[2], O_WRONLY | O_CREAT | O_TRUNC, 0644);
        std::vector<char> buf(64 * 1024);
        while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) || in.gcount() > 0)
            file->write(reinterpret_cast<const uint8_t*>(buf.data()), static_cast<size_t>(in.gcount()));
        file->close();
        fmt::print("{}\n", describe(file->stat()));
        return 0;
    }

    if (cmd == "get" && args.size() >= 2) {
        const auto file = drive.open(args[1]);
        const auto data = file->readAll();
        if (args.size() == 3) {
            std::ofstream out(args[2], std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out) throw std::runtime_error("couldn't write " + args[2]);
        } else {
            std::cout.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        return 0;
    }

    if (cmd == "mv" && args.size() == 3) {
        drive.rename(args[1], args[2]);
        return 0;
    }

    if (cmd == "rm" && args.size() >= 2) {
        if (args[1] == "-r" && args.size() == 3) drive.removeAll(args[2]);
        else drive.remove(args[1]);
        return 0;
    }

    if (cmd == "trash" && args.size() == 2) {
        fmt::print("{}\n", describe(drive.trashPath(args[1])));
        return 0;
    }

    if (cmd == "lstrash") {
        for (const auto& info : drive.listTrash(argOr(args, 1, root))) fmt::print("{}\n", describe(info));
        return 0;
    }

    if (cmd == "restore" && args.size() == 2) {
        const auto wanted = args[1];
        for (const auto& info : drive.listTrash(root)) {
            if (info.path != wanted) continue;
            fmt::print("{}\n", describe(drive.restore(info)));
            return 0;
        }
        throw fs::NotExistError(wanted);
    }

    printUsage();
    return 2;
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage();
        return 2;
    }

    try {
        if (opts->config_path) ConfigRegistry::init(std::filesystem::path(*opts->config_path));
        else ConfigRegistry::init(Config{});
        log::Registry::init(ConfigRegistry::get().logging);

        const auto& cfg = ConfigRegistry::get();
        auto driveOptions = fs::DriveOptions::fromConfig(cfg);
        if (opts->strategy) driveOptions.write_buffer.strategy = fs::buffer::strategyFromString(*opts->strategy);
        if (opts->trash) driveOptions.trash_for_delete = true;

        fs::Drive drive(makeClient(cfg, opts->offline), driveOptions);

        const auto rootId = opts->root_id ? *opts->root_id : cfg.drive.root_id;
        const auto rootPath = opts->root_path ? *opts->root_path : cfg.drive.root_path;
        if (!rootId.empty()) drive.setRootNode(rootId);
        if (!rootPath.empty()) drive.setRootDirectory(rootPath);

        return run(drive, opts->args);
    } catch (const fs::Error& e) {
        std::cerr << "gdfs: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log::Registry::gdfs()->error("[main] {}", e.what());
        std::cerr << "gdfs: " << e.what() << "\n";
        return 1;
    }
}
