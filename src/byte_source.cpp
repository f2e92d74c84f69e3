#include "byte_source.hpp"
#include <filesystem>
#include <stdexcept>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::expected<std::size_t, TransferError> readStream(std::istream& in, std::span<char> buffer) {
    if (buffer.empty() || in.eof()) {
        return 0;
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<std::size_t>(in.gcount());
    if (in.bad()) {
        return std::unexpected(TransferError{ErrorKind::TransientIOError, "Read from source stream failed"});
    }
    return count;
}

std::expected<void, TransferError> seekStream(std::istream& in, std::uint64_t offset) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in) {
        return std::unexpected(TransferError{ErrorKind::IOError, fmt::format("Failed to seek source to byte {}", offset)});
    }
    return {};
}

} // namespace

StreamSource::StreamSource(std::istream& in, std::optional<std::uint64_t> length, bool seekable)
    : in_(in), length_(length), seekable_(seekable) {}

std::expected<std::size_t, TransferError> StreamSource::read(std::span<char> buffer) {
    return readStream(in_, buffer);
}

std::expected<void, TransferError> StreamSource::seek(std::uint64_t offset) {
    if (!seekable_) {
        return std::unexpected(TransferError{ErrorKind::Unsupported, "Source stream is not seekable"});
    }
    return seekStream(in_, offset);
}

FileSource::FileSource(const std::string& path)
    : path_(path), file_(path, std::ios::binary) {
    if (!file_.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open source file: {}", path));
    }
    length_ = fs::file_size(path);
}

std::expected<std::size_t, TransferError> FileSource::read(std::span<char> buffer) {
    auto count = readStream(file_, buffer);
    if (!count) {
        return std::unexpected(TransferError{count.error().kind, fmt::format("Read from {} failed", path_)});
    }
    return count;
}

std::expected<void, TransferError> FileSource::seek(std::uint64_t offset) {
    if (offset > length_) {
        return std::unexpected(TransferError{ErrorKind::InvalidArgument,
                                             fmt::format("Seek offset {} beyond end of {} ({} bytes)", offset, path_, length_)});
    }
    return seekStream(file_, offset);
}
