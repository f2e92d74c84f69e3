#include "local_backend.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

TransferError ioError(const std::string& what, const fs::path& path, int error) {
    const bool transient = error == EINTR || error == EAGAIN || error == EIO;
    return TransferError{transient ? ErrorKind::TransientIOError : ErrorKind::IOError,
                         fmt::format("{}: {} (error: {})", what, path.string(), std::strerror(error))};
}

class LocalWriteSink : public WriteSink {
public:
    LocalWriteSink(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

    ~LocalWriteSink() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    LocalWriteSink(const LocalWriteSink&) = delete;
    LocalWriteSink& operator=(const LocalWriteSink&) = delete;

    std::expected<void, TransferError> write(std::span<const char> data) override {
        if (fd_ < 0) {
            return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Write to closed file: {}", path_.string())});
        }
        while (!data.empty()) {
            ssize_t written = ::write(fd_, data.data(), data.size());
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(ioError("Failed to write", path_, errno));
            }
            data = data.subspan(static_cast<std::size_t>(written));
        }
        return {};
    }

    std::expected<void, TransferError> close() override {
        if (fd_ < 0) {
            return {};
        }
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return std::unexpected(ioError("Failed to close", path_, errno));
        }
        return {};
    }

private:
    int fd_;
    fs::path path_;
};

} // namespace

LocalBackend::LocalBackend(fs::path root, const Logger& logger)
    : root_(std::move(root)), logger_(logger) {}

std::expected<fs::path, TransferError> LocalBackend::resolve(const std::string& path) const {
    fs::path relative(normalizeDirectory(path));
    for (const auto& part : relative) {
        if (part == "..") {
            return std::unexpected(TransferError{ErrorKind::InvalidArgument, fmt::format("Path escapes backend root: {}", path)});
        }
    }
    return root_ / relative;
}

std::expected<void, TransferError> LocalBackend::connect() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_)) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure,
                                             fmt::format("Local root is not a usable directory: {} ({})", root_.string(), ec.message())});
    }
    return {};
}

std::expected<bool, TransferError> LocalBackend::exists(const std::string& path) {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }
    std::error_code ec;
    bool found = fs::exists(*target, ec);
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to stat {}: {}", target->string(), ec.message())});
    }
    return found;
}

std::expected<std::optional<std::uint64_t>, TransferError> LocalBackend::size(const std::string& path) {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }
    std::error_code ec;
    auto status = fs::status(*target, ec);
    if (!fs::exists(status)) {
        return std::optional<std::uint64_t>{};
    }
    if (!fs::is_regular_file(status)) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Not a regular file: {}", target->string())});
    }
    auto bytes = fs::file_size(*target, ec);
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to read size of {}: {}", target->string(), ec.message())});
    }
    return std::optional<std::uint64_t>{bytes};
}

std::expected<void, TransferError> LocalBackend::ensureDirectory(const std::string& path) {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (fs::is_directory(*target)) {
        return {};
    }
    std::error_code ec;
    fs::create_directories(*target, ec);
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to create directory {}: {}", target->string(), ec.message())});
    }
    logger_.logMessage(fmt::format("Created directory: {}", target->string()));
    return {};
}

std::expected<std::unique_ptr<WriteSink>, TransferError> LocalBackend::openForWrite(const std::string& path, WriteMode mode) {
    if (mode.kind == WriteMode::Kind::ResumeAt) {
        return std::unexpected(TransferError{ErrorKind::Unsupported, "Local backend does not resume partial files"});
    }
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= mode.kind == WriteMode::Kind::CreateExclusive ? O_EXCL : O_TRUNC;
    int fd = ::open(target->c_str(), flags, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return std::unexpected(TransferError{ErrorKind::AlreadyExists, fmt::format("File already exists: {}", target->string())});
        }
        return std::unexpected(ioError("Failed to open file for writing", *target, errno));
    }
    return std::make_unique<LocalWriteSink>(fd, *target);
}

std::expected<bool, TransferError> LocalBackend::remove(const std::string& path) {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (!fs::is_regular_file(*target)) {
        return false;
    }
    std::error_code ec;
    bool removed = fs::remove(*target, ec);
    if (ec) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to delete {}: {}", target->string(), ec.message())});
    }
    return removed;
}

std::expected<std::vector<RemoteEntry>, TransferError> LocalBackend::list(const std::string& path) {
    auto target = resolve(path);
    if (!target) {
        return std::unexpected(target.error());
    }
    std::vector<RemoteEntry> entries;
    if (!fs::is_directory(*target)) {
        return entries;
    }
    try {
        for (const auto& entry : fs::directory_iterator(*target)) {
            RemoteEntry item;
            item.name = entry.path().filename().string();
            item.isDirectory = entry.is_directory();
            item.size = entry.is_regular_file() ? entry.file_size() : 0;
            item.modified = std::chrono::file_clock::to_sys(entry.last_write_time());
            entries.push_back(std::move(item));
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to list {}: {}", target->string(), e.what())});
    }
    return entries;
}

bool LocalBackend::probe() {
    std::error_code ec;
    return fs::is_directory(root_, ec);
}
