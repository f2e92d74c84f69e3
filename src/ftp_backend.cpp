#include "ftp_backend.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <fmt/format.h>

namespace {

constexpr long kMaxUploadBuffer = 2 * 1024 * 1024;

bool isConnectionError(CURLcode rc) {
    switch (rc) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_LOGIN_DENIED:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_USE_SSL_FAILED:
    case CURLE_WEIRD_SERVER_REPLY:
        return true;
    default:
        return false;
    }
}

bool isTransient(CURLcode rc) {
    switch (rc) {
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_FTP_ACCEPT_TIMEOUT:
    case CURLE_FTP_CANT_GET_HOST:
        return true;
    default:
        return false;
    }
}

TransferError curlError(CURLcode rc, const std::string& what) {
    const ErrorKind kind = isConnectionError(rc) ? ErrorKind::ConnectionFailure
                         : isTransient(rc)       ? ErrorKind::TransientIOError
                                                 : ErrorKind::IOError;
    return TransferError{kind, fmt::format("{}: {}", what, curl_easy_strerror(rc))};
}

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::vector<std::string_view> splitSegments(std::string_view path) {
    std::vector<std::string_view> segments;
    while (!path.empty()) {
        const auto slash = path.find('/');
        const std::string_view segment = path.substr(0, slash);
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

} // namespace

std::chrono::system_clock::time_point parseMlsdTime(std::string_view value) {
    if (value.size() < 14) {
        return {};
    }
    auto field = [value](std::size_t pos, std::size_t len) {
        int number = 0;
        std::from_chars(value.data() + pos, value.data() + pos + len, number);
        return number;
    };
    std::tm tm{};
    tm.tm_year = field(0, 4) - 1900;
    tm.tm_mon = field(4, 2) - 1;
    tm.tm_mday = field(6, 2);
    tm.tm_hour = field(8, 2);
    tm.tm_min = field(10, 2);
    tm.tm_sec = field(12, 2);
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::optional<RemoteEntry> parseMlsdLine(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    const auto space = line.find(' ');
    if (space == std::string_view::npos || space + 1 >= line.size()) {
        return std::nullopt;
    }

    RemoteEntry entry;
    entry.name = std::string(line.substr(space + 1));
    std::string type;
    std::string_view facts = line.substr(0, space);
    while (!facts.empty()) {
        const auto end = facts.find(';');
        const std::string_view fact = facts.substr(0, end);
        facts = end == std::string_view::npos ? std::string_view{} : facts.substr(end + 1);

        const auto eq = fact.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const std::string key = toLower(fact.substr(0, eq));
        const std::string_view value = fact.substr(eq + 1);
        if (key == "type") {
            type = toLower(value);
        } else if (key == "size") {
            std::from_chars(value.data(), value.data() + value.size(), entry.size);
        } else if (key == "modify") {
            entry.modified = parseMlsdTime(value);
        }
    }

    if (type == "cdir" || type == "pdir") {
        return std::nullopt;
    }
    entry.isDirectory = type == "dir";
    if (entry.isDirectory) {
        entry.size = 0;
    }
    return entry;
}

struct FtpBackend::UploadContext {
    ByteSource* source = nullptr;           ///< Streaming source, or null for a buffered chunk.
    std::span<const char> pending;          ///< Remaining buffered bytes when source is null.
    std::stop_token stop;                   ///< Cancellation signal.
    std::optional<std::uint64_t> expected;  ///< Bytes this call is expected to send.
    std::uint64_t sent = 0;                 ///< Bytes handed to libcurl so far.
    std::optional<TransferError> error;     ///< Source failure that aborted the transfer.
};

class FtpBackend::AppendSink : public WriteSink {
public:
    AppendSink(FtpBackend& backend, std::string path) : backend_(backend), path_(std::move(path)) {}

    std::expected<void, TransferError> write(std::span<const char> data) override {
        if (data.empty()) {
            return {};
        }
        UploadContext context;
        context.pending = data;
        context.expected = data.size();
        return backend_.transferData(path_, context, true);
    }

    std::expected<void, TransferError> close() override { return {}; }

private:
    FtpBackend& backend_;
    std::string path_;
};

FtpBackend::FtpBackend(FtpSettings settings, const Logger& logger)
    : settings_(std::move(settings)), logger_(logger) {
    if (settings_.host.empty()) {
        throw std::runtime_error("FTP host is not configured");
    }
    ensureCurlInitialized();
}

FtpBackend::~FtpBackend() {
    if (control_ || data_ || monitor_) {
        logger_.logDebug(fmt::format("Closing FTP connections to {}", settings_.host));
    }
}

std::string FtpBackend::urlFor(const std::string& path, bool directory) const {
    std::string url = fmt::format("{}://{}:{}/", settings_.encryption == FtpEncryption::Implicit ? "ftps" : "ftp",
                                  settings_.host, settings_.port);
    std::vector<std::string_view> segments = splitSegments(settings_.root);
    for (auto segment : splitSegments(path)) {
        segments.push_back(segment);
    }
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            url += '/';
        }
        url += escapeUrlSegment(segments[i]);
    }
    if (directory && !segments.empty()) {
        url += '/';
    }
    return url;
}

void FtpBackend::applyCommonOptions(CURL* curl) const {
    const long stallSeconds =
        std::max<long>(1, static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(settings_.dataTimeout).count()));

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 60L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 60L);
    curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.password.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(settings_.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);
    curl_easy_setopt(curl, CURLOPT_SERVER_RESPONSE_TIMEOUT, stallSeconds);
    curl_easy_setopt(curl, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));

    if (settings_.encryption == FtpEncryption::Explicit) {
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(curl, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    }
    if (!settings_.passive) {
        curl_easy_setopt(curl, CURLOPT_FTPPORT, "-");
    }
    if (!settings_.verifyTls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

CURL* FtpBackend::prepareHandle(CurlEasyPtr& handle) const {
    if (!handle) {
        handle.reset(curl_easy_init());
    }
    if (handle) {
        curl_easy_reset(handle.get());
        applyCommonOptions(handle.get());
    }
    return handle.get();
}

CURLcode FtpBackend::performOn(CurlEasyPtr& handle) {
    CURLcode rc = curl_easy_perform(handle.get());
    if (isConnectionError(rc) || isTransient(rc)) {
        handle.reset();
    }
    return rc;
}

std::expected<void, TransferError> FtpBackend::connect() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    const std::string rootUrl = urlFor("", true);

    if (control_) {
        CURL* curl = prepareHandle(control_);
        CurlSlistPtr noop;
        appendToSlist(noop, "NOOP");
        curl_easy_setopt(curl, CURLOPT_URL, rootUrl.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_QUOTE, noop.get());
        CURLcode rc = performOn(control_);
        if (rc == CURLE_OK) {
            return {};
        }
        logger_.logWarning(fmt::format("FTP connection to {} is stale ({}), reconnecting", settings_.host, curl_easy_strerror(rc)));
        control_.reset();
    }

    CURL* curl = prepareHandle(control_);
    if (!curl) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
    }
    curl_easy_setopt(curl, CURLOPT_URL, rootUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    CURLcode rc = performOn(control_);
    if (rc != CURLE_OK) {
        control_.reset();
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure,
                                             fmt::format("Failed to connect to FTP server {}:{}: {}", settings_.host,
                                                         settings_.port, curl_easy_strerror(rc))});
    }
    logger_.logMessage(fmt::format("Connected to FTP server {}:{}", settings_.host, settings_.port));
    return {};
}

std::expected<bool, TransferError> FtpBackend::exists(const std::string& path) {
    auto bytes = size(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return bytes->has_value();
}

std::expected<std::optional<std::uint64_t>, TransferError> FtpBackend::size(const std::string& path) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    return querySize(control_, path);
}

std::expected<std::optional<std::uint64_t>, TransferError> FtpBackend::sampleSize(const std::string& path) {
    std::unique_lock<std::mutex> lock(monitorMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::unexpected(TransferError{ErrorKind::TransientIOError, fmt::format("Size query for {} still in flight", path)});
    }
    return querySize(monitor_, path);
}

std::expected<std::optional<std::uint64_t>, TransferError> FtpBackend::querySize(CurlEasyPtr& handle, const std::string& path) {
    CURL* curl = prepareHandle(handle);
    if (!curl) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
    }
    const std::string url = urlFor(path);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    CURLcode rc = performOn(handle);
    // A missing parent directory fails the CWD with an access error.
    if (rc == CURLE_REMOTE_FILE_NOT_FOUND || rc == CURLE_FTP_COULDNT_RETR_FILE || rc == CURLE_REMOTE_ACCESS_DENIED) {
        return std::optional<std::uint64_t>{};
    }
    if (rc != CURLE_OK) {
        return std::unexpected(curlError(rc, fmt::format("Failed to query size of {}", path)));
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length < 0) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Server did not report a size for {}", path)});
    }
    return std::optional<std::uint64_t>{static_cast<std::uint64_t>(length)};
}

std::expected<void, TransferError> FtpBackend::ensureDirectory(const std::string& path) {
    const std::string directory = normalizeDirectory(path);
    if (directory.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(controlMutex_);
    CURL* curl = prepareHandle(control_);
    if (!curl) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
    }
    const std::string url = urlFor(directory, true);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));

    CURLcode rc = performOn(control_);
    if (rc != CURLE_OK) {
        return std::unexpected(curlError(rc, fmt::format("Failed to create directory {}", directory)));
    }
    logger_.logDebug(fmt::format("Ensured directory: {}", directory));
    return {};
}

std::expected<void, TransferError> FtpBackend::transferData(const std::string& path, UploadContext& context, bool append) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    if (!data_) {
        data_.reset(curl_easy_init());
    }
    if (!data_) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
    }
    CURL* curl = data_.get();
    curl_easy_reset(curl);
    applyCommonOptions(curl);

    curl_read_callback readChunk = [](char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
        auto* ctx = static_cast<UploadContext*>(userdata);
        if (ctx->stop.stop_requested()) {
            return CURL_READFUNC_ABORT;
        }
        std::span<char> out(buffer, size * nitems);
        std::size_t count = 0;
        if (ctx->source) {
            auto read = ctx->source->read(out);
            if (!read) {
                ctx->error = read.error();
                return CURL_READFUNC_ABORT;
            }
            count = *read;
        } else {
            count = std::min(out.size(), ctx->pending.size());
            std::memcpy(out.data(), ctx->pending.data(), count);
            ctx->pending = ctx->pending.subspan(count);
        }
        ctx->sent += count;
        return count;
    };
    curl_xferinfo_callback checkStop = [](void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
        return static_cast<UploadContext*>(clientp)->stop.stop_requested() ? 1 : 0;
    };

    const std::string url = urlFor(path);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_APPEND, append ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readChunk);
    curl_easy_setopt(curl, CURLOPT_READDATA, &context);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, checkStop);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
    curl_easy_setopt(curl, CURLOPT_UPLOAD_BUFFERSIZE, std::min(static_cast<long>(settings_.chunkSize), kMaxUploadBuffer));
    if (context.expected) {
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*context.expected));
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        return {};
    }
    if (context.error) {
        return std::unexpected(*context.error);
    }
    if (rc == CURLE_ABORTED_BY_CALLBACK && context.stop.stop_requested()) {
        return std::unexpected(TransferError{ErrorKind::Cancelled, "Upload cancelled by user"});
    }
    TransferError error = curlError(rc, fmt::format("Failed to upload {}", path));
    if (error.kind != ErrorKind::IOError) {
        data_.reset();
    }
    return std::unexpected(std::move(error));
}

std::expected<void, TransferError> FtpBackend::createEmpty(const std::string& path) {
    UploadContext context;
    context.expected = 0;
    return transferData(path, context, false);
}

std::expected<std::unique_ptr<WriteSink>, TransferError> FtpBackend::openForWrite(const std::string& path, WriteMode mode) {
    switch (mode.kind) {
    case WriteMode::Kind::CreateExclusive:
        return std::unexpected(TransferError{ErrorKind::Unsupported, "FTP has no exclusive create"});
    case WriteMode::Kind::CreateOrTruncate:
        if (auto created = createEmpty(path); !created) {
            return std::unexpected(created.error());
        }
        break;
    case WriteMode::Kind::ResumeAt: {
        auto current = size(path);
        if (!current) {
            return std::unexpected(current.error());
        }
        if (current->value_or(0) != mode.offset) {
            return std::unexpected(TransferError{ErrorKind::IOError,
                                                 fmt::format("Cannot resume {} at byte {}: remote file holds {} bytes", path,
                                                             mode.offset, current->value_or(0))});
        }
        break;
    }
    }
    return std::make_unique<AppendSink>(*this, path);
}

std::expected<std::uint64_t, TransferError> FtpBackend::upload(ByteSource& source, const std::string& path, WriteMode mode,
                                                               std::stop_token stop) {
    if (mode.kind == WriteMode::Kind::CreateExclusive) {
        return std::unexpected(TransferError{ErrorKind::Unsupported, "FTP has no exclusive create"});
    }

    const std::uint64_t start = mode.kind == WriteMode::Kind::ResumeAt ? mode.offset : 0;
    const auto length = source.length();
    std::uint64_t position = start;
    bool append = mode.kind == WriteMode::Kind::ResumeAt;

    for (int attempt = 0;; ++attempt) {
        UploadContext context;
        context.source = &source;
        context.stop = stop;
        if (length && *length >= position) {
            context.expected = *length - position;
        }

        auto sent = transferData(path, context, append);
        if (sent) {
            return position + context.sent - start;
        }

        const TransferError& error = sent.error();
        if (error.kind != ErrorKind::TransientIOError || attempt >= settings_.retryAttempts) {
            return std::unexpected(error);
        }
        if (!source.seekable()) {
            return std::unexpected(TransferError{ErrorKind::TransientIOError,
                                                 fmt::format("{} (source cannot seek, upload cannot be retried)", error.message)});
        }
        logger_.logWarning(fmt::format("Transient error uploading {}: {}. Retrying ({}/{})", path, error.message, attempt + 1,
                                       settings_.retryAttempts));

        auto landed = size(path);
        if (!landed) {
            return std::unexpected(landed.error());
        }
        position = landed->value_or(0);
        if (position < start || (length && position > *length)) {
            return std::unexpected(TransferError{ErrorKind::IOError,
                                                 fmt::format("Remote file {} holds {} bytes, cannot continue the upload", path, position)});
        }
        if (auto seeked = source.seek(position); !seeked) {
            return std::unexpected(seeked.error());
        }
        append = position > 0;
    }
}

std::expected<bool, TransferError> FtpBackend::remove(const std::string& path) {
    auto existing = size(path);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (!existing->has_value()) {
        return false;
    }

    const std::string normalized = normalizeDirectory(path);
    const auto slash = normalized.rfind('/');
    const std::string parent = slash == std::string::npos ? std::string() : normalized.substr(0, slash);
    const std::string fileName = slash == std::string::npos ? normalized : normalized.substr(slash + 1);

    std::lock_guard<std::mutex> lock(controlMutex_);
    CURL* curl = prepareHandle(control_);
    if (!curl) {
        return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
    }
    CurlSlistPtr commands;
    appendToSlist(commands, "DELE " + fileName);
    const std::string url = urlFor(parent, true);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_QUOTE, commands.get());

    CURLcode rc = performOn(control_);
    if (rc != CURLE_OK) {
        return std::unexpected(curlError(rc, fmt::format("Failed to delete {}", normalized)));
    }
    logger_.logMessage(fmt::format("Deleted file: {}", normalized));
    return true;
}

std::expected<std::vector<RemoteEntry>, TransferError> FtpBackend::list(const std::string& path) {
    const std::string directory = normalizeDirectory(path);
    std::string listing;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        CURL* curl = prepareHandle(control_);
        if (!curl) {
            return std::unexpected(TransferError{ErrorKind::ConnectionFailure, "Failed to initialize CURL"});
        }
        const std::string url = urlFor(directory, true);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "MLSD");
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendToString);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &listing);

        CURLcode rc = performOn(control_);
        if (rc == CURLE_REMOTE_ACCESS_DENIED) {
            return std::vector<RemoteEntry>{};
        }
        if (rc != CURLE_OK) {
            return std::unexpected(curlError(rc, fmt::format("Failed to list {}", directory.empty() ? "/" : directory)));
        }
    }

    std::vector<RemoteEntry> entries;
    std::string_view remaining(listing);
    while (!remaining.empty()) {
        const auto newline = remaining.find('\n');
        if (auto entry = parseMlsdLine(remaining.substr(0, newline))) {
            entries.push_back(std::move(*entry));
        }
        if (newline == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(newline + 1);
    }
    return entries;
}

bool FtpBackend::probe() {
    return connect().has_value();
}
