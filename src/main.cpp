#include "media_relay.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

void installSignalHandlers() {
#ifdef _WIN32
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
#else
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

void printUsage(const char* program) {
    fmt::print(stderr,
               "Usage: {0} [--config <path>] upload <file|-> <directory> [--name <name>] [--resume]\n"
               "       {0} [--config <path>] list <directory>\n"
               "       {0} [--config <path>] delete <path>\n"
               "       {0} [--config <path>] probe\n",
               program);
}

void printProgress(const ProgressSample& sample) {
    if (sample.totalBytes) {
        fmt::print("\rProgress: {}% ({} / {}) {:.2f} MB/s, ETA {:.0f}s   ", sample.percent, formatBytes(sample.bytesTransferred),
                   formatBytes(*sample.totalBytes), sample.bytesPerSecond / (1024 * 1024), sample.eta.count());
    } else {
        fmt::print("\rProgress: {} {:.2f} MB/s   ", formatBytes(sample.bytesTransferred), sample.bytesPerSecond / (1024 * 1024));
    }
    std::fflush(stdout);
}

std::string formatModified(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm localTime{};
    localtime_r(&timeT, &localTime);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &localTime);
    return timeBuf;
}

int runUpload(MediaRelay& relay, const std::string& file, const std::string& directory, std::string name, bool resume) {
    std::unique_ptr<ByteSource> source;
    if (file == "-") {
        if (name.empty()) {
            fmt::print(stderr, "Error: --name is required when uploading from standard input\n");
            return 1;
        }
        source = std::make_unique<StreamSource>(std::cin, std::nullopt, false);
    } else {
        source = std::make_unique<FileSource>(file);
        if (name.empty()) {
            name = fs::path(file).filename().string();
        }
    }

    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (gShutdownFlag) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    TransferResult result = relay.upload(*source, Destination{directory, name}, printProgress, cancel.get_token(),
                                         resume ? CollisionPolicy::Resume : CollisionPolicy::Rename);
    watcher.request_stop();
    fmt::print("\n");

    const std::string target = result.directory.empty() ? result.fileName : result.directory + "/" + result.fileName;
    if (!result.success) {
        fmt::print(stderr, "Upload of {} failed: {}\n", target, result.error ? describe(*result.error) : "unknown error");
        return 1;
    }
    if (result.skipped) {
        fmt::print("{} is already complete ({} bytes), nothing to upload\n", target, result.bytesTransferred);
    } else {
        fmt::print("Uploaded {} ({}) in {} ms at {:.2f} MB/s\n", target, formatBytes(result.bytesTransferred),
                   result.duration().count(), result.throughput() / (1024 * 1024));
    }
    return 0;
}

int runList(MediaRelay& relay, const std::string& directory) {
    auto entries = relay.listDirectory(directory);
    if (!entries) {
        fmt::print(stderr, "Error: {}\n", describe(entries.error()));
        return 1;
    }
    for (const auto& entry : *entries) {
        fmt::print("{} {:>14} {} {}\n", entry.isDirectory ? 'd' : '-', entry.size, formatModified(entry.modified), entry.name);
    }
    return 0;
}

int runDelete(MediaRelay& relay, const std::string& path) {
    auto removed = relay.deleteFile(path);
    if (!removed) {
        fmt::print(stderr, "Error: {}\n", describe(removed.error()));
        return 1;
    }
    if (!*removed) {
        fmt::print(stderr, "No such file: {}\n", path);
        return 1;
    }
    fmt::print("Deleted {}\n", path);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "relay_config.json";
    std::string name;
    bool resume = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            name = argv[++i];
        } else if (arg == "--resume") {
            resume = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string& command = positional[0];
    const bool valid = (command == "upload" && positional.size() == 3) || (command == "list" && positional.size() <= 2) ||
                       (command == "delete" && positional.size() == 2) || (command == "probe" && positional.size() == 1);
    if (!valid) {
        printUsage(argv[0]);
        return 1;
    }

    installSignalHandlers();
    try {
        MediaRelay relay(configFile);
        if (command == "upload") {
            return runUpload(relay, positional[1], positional[2], name, resume);
        }
        if (command == "list") {
            return runList(relay, positional.size() == 2 ? positional[1] : std::string());
        }
        if (command == "delete") {
            return runDelete(relay, positional[1]);
        }
        if (relay.testConnection()) {
            fmt::print("Storage target is reachable\n");
            return 0;
        }
        fmt::print(stderr, "Storage target is not reachable\n");
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
