#include "transfer_types.hpp"
#include <fmt/format.h>

std::string_view toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectionFailure:
        return "ConnectionFailure";
    case ErrorKind::NameSpaceExhausted:
        return "NameSpaceExhausted";
    case ErrorKind::SizeMismatch:
        return "SizeMismatch";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::TransientIOError:
        return "TransientIOError";
    case ErrorKind::IOError:
        return "IOError";
    case ErrorKind::AlreadyExists:
        return "AlreadyExists";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::Unsupported:
        return "Unsupported";
    }
    return "Unknown";
}

std::string describe(const TransferError& error) {
    return fmt::format("{}: {}", toString(error.kind), error.message);
}

std::string normalizeDirectory(std::string_view directory) {
    std::string normalized;
    normalized.reserve(directory.size());
    for (char c : directory) {
        if (c == '/' && (normalized.empty() || normalized.back() == '/')) {
            continue;
        }
        normalized.push_back(c);
    }
    if (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string joinPath(std::string_view directory, std::string_view name) {
    if (directory.empty()) {
        return std::string(name);
    }
    return fmt::format("{}/{}", directory, name);
}

std::chrono::milliseconds TransferResult::duration() const {
    if (endTime < startTime) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
}

double TransferResult::throughput() const {
    if (skipped || bytesTransferred <= resumeOffset) {
        return 0.0;
    }
    const double seconds = std::chrono::duration<double>(endTime - startTime).count();
    return seconds > 0 ? static_cast<double>(bytesTransferred - resumeOffset) / seconds : 0.0;
}
