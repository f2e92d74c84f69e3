/**
 * @file byte_source.hpp
 * @brief Sequential byte sources feeding the transfer engine.
 *
 * A source is read front to back in chunks. Its total length should be known up front:
 * progress percentages, resume and the completed-file short-circuit all depend on it.
 * Seekable sources can be repositioned so a partial upload is resumed instead of redone.
 */

#ifndef BYTE_SOURCE_HPP
#define BYTE_SOURCE_HPP

#include <cstdint>
#include <expected>
#include <fstream>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include "transfer_types.hpp"

/**
 * @brief Interface for the inbound side of a transfer.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Reads up to buffer.size() bytes.
     *
     * @param buffer Destination buffer.
     * @return std::expected<std::size_t, TransferError> Bytes read (0 at end of stream) or an error.
     */
    virtual std::expected<std::size_t, TransferError> read(std::span<char> buffer) = 0;

    /**
     * @brief Total length of the stream, if known.
     */
    virtual std::optional<std::uint64_t> length() const = 0;

    /**
     * @brief Whether seek() is supported.
     */
    virtual bool seekable() const = 0;

    /**
     * @brief Positions the next read at an absolute offset.
     *
     * @param offset Absolute byte offset from the start of the stream.
     * @return std::expected<void, TransferError> Success, or Unsupported / IOError.
     */
    virtual std::expected<void, TransferError> seek(std::uint64_t offset) = 0;
};

/**
 * @brief Adapts any std::istream (an HTTP request body, a pipe, a string stream).
 *
 * The stream is borrowed and must outlive the source.
 */
class StreamSource : public ByteSource {
public:
    /**
     * @brief Wraps a stream.
     *
     * @param in Stream positioned at the first byte to transfer.
     * @param length Declared total length; std::nullopt when unknown.
     * @param seekable Whether the stream may be repositioned with seekg().
     */
    StreamSource(std::istream& in, std::optional<std::uint64_t> length, bool seekable = true);

    std::expected<std::size_t, TransferError> read(std::span<char> buffer) override;
    std::optional<std::uint64_t> length() const override { return length_; }
    bool seekable() const override { return seekable_; }
    std::expected<void, TransferError> seek(std::uint64_t offset) override;

private:
    std::istream& in_;
    std::optional<std::uint64_t> length_;
    bool seekable_;
};

/**
 * @brief Seekable source over a local file.
 */
class FileSource : public ByteSource {
public:
    /**
     * @brief Opens a file for reading.
     *
     * @param path Path of the file.
     * @throws std::runtime_error If the file cannot be opened.
     */
    explicit FileSource(const std::string& path);

    std::expected<std::size_t, TransferError> read(std::span<char> buffer) override;
    std::optional<std::uint64_t> length() const override { return length_; }
    bool seekable() const override { return true; }
    std::expected<void, TransferError> seek(std::uint64_t offset) override;

private:
    std::string path_;
    std::ifstream file_;
    std::uint64_t length_;
};

#endif // BYTE_SOURCE_HPP
