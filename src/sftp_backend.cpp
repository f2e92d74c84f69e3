#include "sftp_backend.hpp"
#include <algorithm>
#include <fcntl.h>
#include <stdexcept>
#include <fmt/format.h>

class SftpBackend::FileSink : public WriteSink {
public:
    FileSink(SftpBackend& backend, sftp_file file, std::string path, std::uint64_t generation)
        : backend_(backend), file_(file), path_(std::move(path)), generation_(generation) {}

    ~FileSink() override {
        std::lock_guard<std::mutex> lock(backend_.mutex_);
        if (file_ && generation_ == backend_.generation_) {
            sftp_close(file_);
        }
    }

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    std::expected<void, TransferError> write(std::span<const char> data) override {
        std::lock_guard<std::mutex> lock(backend_.mutex_);
        if (!file_) {
            return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Write to closed file: {}", path_)});
        }
        if (generation_ != backend_.generation_) {
            file_ = nullptr;
            return std::unexpected(TransferError{ErrorKind::TransientIOError, fmt::format("SFTP session was recreated while writing {}", path_)});
        }
        while (!data.empty()) {
            ssize_t written = sftp_write(file_, data.data(), data.size());
            if (written < 0) {
                return std::unexpected(backend_.sftpError("Failed to write", path_));
            }
            data = data.subspan(static_cast<std::size_t>(written));
        }
        return {};
    }

    std::expected<void, TransferError> close() override {
        std::lock_guard<std::mutex> lock(backend_.mutex_);
        sftp_file file = file_;
        file_ = nullptr;
        if (!file || generation_ != backend_.generation_) {
            return {};
        }
        if (sftp_close(file) != SSH_NO_ERROR) {
            return std::unexpected(backend_.sftpError("Failed to close", path_));
        }
        return {};
    }

private:
    SftpBackend& backend_;
    sftp_file file_;
    std::string path_;
    std::uint64_t generation_; ///< Session the handle belongs to.
};

SftpBackend::SftpBackend(SftpSettings settings, const Logger& logger)
    : settings_(std::move(settings)), logger_(logger) {
    if (settings_.host.empty()) {
        throw std::runtime_error("SFTP host is not configured");
    }
}

SftpBackend::~SftpBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeSession();
}

void SftpBackend::closeSession() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        if (ssh_is_connected(ssh_)) {
            ssh_disconnect(ssh_);
        }
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}

std::expected<void, TransferError> SftpBackend::ensureSession() {
    if (ssh_ && sftp_ && ssh_is_connected(ssh_)) {
        return {};
    }
    if (ssh_) {
        logger_.logWarning(fmt::format("SFTP session to {} dropped, reconnecting", settings_.host));
        closeSession();
    }

    ssh_ = ssh_new();
    if (!ssh_) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to create SSH session"});
    }
    unsigned int port = static_cast<unsigned int>(settings_.port);
    long timeout = std::max<long>(1, static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(settings_.connectTimeout).count()));
    ssh_options_set(ssh_, SSH_OPTIONS_HOST, settings_.host.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh_, SSH_OPTIONS_USER, settings_.username.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_TIMEOUT, &timeout);

    if (ssh_connect(ssh_) != SSH_OK) {
        std::string reason = ssh_get_error(ssh_);
        closeSession();
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure,
                                             fmt::format("SSH connection to {}:{} failed: {}", settings_.host, settings_.port, reason)});
    }
    if (ssh_session_is_known_server(ssh_) != SSH_KNOWN_HOSTS_OK) {
        logger_.logWarning(fmt::format("Host key of {} is not a known host", settings_.host));
    }

    const int auth = settings_.password.empty() ? ssh_userauth_publickey_auto(ssh_, nullptr, nullptr)
                                                : ssh_userauth_password(ssh_, nullptr, settings_.password.c_str());
    if (auth != SSH_AUTH_SUCCESS) {
        closeSession();
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure,
                                             settings_.password.empty() ? "SSH authentication failed"
                                                                        : "SSH password authentication failed"});
    }

    sftp_ = sftp_new(ssh_);
    if (!sftp_ || sftp_init(sftp_) != SSH_OK) {
        closeSession();
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "SFTP initialization failed"});
    }
    ++generation_;
    logger_.logMessage(fmt::format("Connected to SFTP server {}:{}", settings_.host, settings_.port));
    return {};
}

std::string SftpBackend::remotePath(const std::string& path) const {
    const std::string relative = normalizeDirectory(path);
    std::string base = settings_.root;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        return relative.empty() ? "." : relative;
    }
    if (relative.empty()) {
        return base;
    }
    return base == "/" ? "/" + relative : base + "/" + relative;
}

TransferError SftpBackend::sftpError(const std::string& what, const std::string& path) const {
    if (!ssh_ || !ssh_is_connected(ssh_)) {
        return TransferError{ErrorKind::TransientIOError, fmt::format("{} {}: connection lost", what, path)};
    }
    const int code = sftp_get_error(sftp_);
    ErrorKind kind = ErrorKind::IOError;
    if (code == SSH_FX_FILE_ALREADY_EXISTS) {
        kind = ErrorKind::AlreadyExists;
    } else if (code == SSH_FX_CONNECTION_LOST || code == SSH_FX_NO_CONNECTION) {
        kind = ErrorKind::TransientIOError;
    }
    return TransferError{kind, fmt::format("{} {}: {} (sftp error {})", what, path, ssh_get_error(ssh_), code)};
}

std::expected<void, TransferError> SftpBackend::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureSession();
}

std::expected<bool, TransferError> SftpBackend::exists(const std::string& path) {
    auto bytes = size(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return bytes->has_value();
}

std::expected<std::optional<std::uint64_t>, TransferError> SftpBackend::size(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto session = ensureSession(); !session) {
        return std::unexpected(session.error());
    }
    const std::string remote = remotePath(path);
    sftp_attributes attrs = sftp_stat(sftp_, remote.c_str());
    if (!attrs) {
        if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
            return std::optional<std::uint64_t>{};
        }
        return std::unexpected(sftpError("Failed to stat", remote));
    }
    const std::uint64_t bytes = attrs->size;
    const bool regular = attrs->type == SSH_FILEXFER_TYPE_REGULAR;
    sftp_attributes_free(attrs);
    if (!regular) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Not a regular file: {}", remote)});
    }
    return std::optional<std::uint64_t>{bytes};
}

std::expected<void, TransferError> SftpBackend::ensureDirectory(const std::string& path) {
    const std::string directory = normalizeDirectory(path);
    if (directory.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto session = ensureSession(); !session) {
        return std::unexpected(session.error());
    }

    std::string prefix;
    std::size_t start = 0;
    while (start <= directory.size()) {
        const auto slash = directory.find('/', start);
        const auto end = slash == std::string::npos ? directory.size() : slash;
        prefix = directory.substr(0, end);
        const std::string remote = remotePath(prefix);

        if (sftp_attributes attrs = sftp_stat(sftp_, remote.c_str())) {
            const bool isDirectory = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
            sftp_attributes_free(attrs);
            if (!isDirectory) {
                return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Not a directory: {}", remote)});
            }
        } else if (sftp_mkdir(sftp_, remote.c_str(), 0755) != 0) {
            if (sftp_get_error(sftp_) != SSH_FX_FILE_ALREADY_EXISTS) {
                return std::unexpected(sftpError("Failed to create directory", remote));
            }
        } else {
            logger_.logMessage(fmt::format("Created directory: {}", remote));
        }

        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return {};
}

std::expected<std::unique_ptr<WriteSink>, TransferError> SftpBackend::openForWrite(const std::string& path, WriteMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto session = ensureSession(); !session) {
        return std::unexpected(session.error());
    }

    int flags = O_WRONLY;
    switch (mode.kind) {
    case WriteMode::Kind::CreateOrTruncate:
        flags |= O_CREAT | O_TRUNC;
        break;
    case WriteMode::Kind::CreateExclusive:
        flags |= O_CREAT | O_EXCL;
        break;
    case WriteMode::Kind::ResumeAt:
        break;
    }

    const std::string remote = remotePath(path);
    sftp_file file = sftp_open(sftp_, remote.c_str(), flags, 0644);
    if (!file) {
        TransferError error = sftpError("Failed to open file for writing", remote);
        // SFTP v3 servers report a lost exclusive create as a generic failure.
        if (mode.kind == WriteMode::Kind::CreateExclusive && error.kind == ErrorKind::IOError) {
            if (sftp_attributes attrs = sftp_stat(sftp_, remote.c_str())) {
                sftp_attributes_free(attrs);
                error.kind = ErrorKind::AlreadyExists;
            }
        }
        return std::unexpected(std::move(error));
    }
    if (mode.kind == WriteMode::Kind::ResumeAt && sftp_seek64(file, mode.offset) < 0) {
        sftp_close(file);
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to seek {} to byte {}", remote, mode.offset)});
    }
    return std::make_unique<FileSink>(*this, file, remote, generation_);
}

std::expected<bool, TransferError> SftpBackend::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto session = ensureSession(); !session) {
        return std::unexpected(session.error());
    }
    const std::string remote = remotePath(path);
    if (sftp_unlink(sftp_, remote.c_str()) < 0) {
        if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
            return false;
        }
        return std::unexpected(sftpError("Failed to delete", remote));
    }
    logger_.logMessage(fmt::format("Deleted file: {}", remote));
    return true;
}

std::expected<std::vector<RemoteEntry>, TransferError> SftpBackend::list(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto session = ensureSession(); !session) {
        return std::unexpected(session.error());
    }
    const std::string remote = remotePath(path);
    std::vector<RemoteEntry> entries;

    sftp_dir dir = sftp_opendir(sftp_, remote.c_str());
    if (!dir) {
        if (sftp_get_error(sftp_) == SSH_FX_NO_SUCH_FILE) {
            return entries;
        }
        return std::unexpected(sftpError("Failed to list", remote));
    }
    while (sftp_attributes attrs = sftp_readdir(sftp_, dir)) {
        std::string name = attrs->name ? attrs->name : "";
        if (!name.empty() && name != "." && name != "..") {
            RemoteEntry entry;
            entry.name = std::move(name);
            entry.isDirectory = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
            entry.size = entry.isDirectory ? 0 : attrs->size;
            entry.modified = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(attrs->mtime));
            entries.push_back(std::move(entry));
        }
        sftp_attributes_free(attrs);
    }
    const bool complete = sftp_dir_eof(dir) != 0;
    sftp_closedir(dir);
    if (!complete) {
        return std::unexpected(sftpError("Failed to read directory", remote));
    }
    return entries;
}

bool SftpBackend::probe() {
    return connect().has_value();
}
