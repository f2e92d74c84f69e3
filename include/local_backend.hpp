/**
 * @file local_backend.hpp
 * @brief Local-disk backend used for development and testing.
 *
 * Maps logical paths onto a sandboxed root directory. Writes always start from scratch
 * (no ResumeAt); exclusive create is supported through O_EXCL so concurrent uploads of the
 * same name cannot silently share a file.
 */

#ifndef LOCAL_BACKEND_HPP
#define LOCAL_BACKEND_HPP

#include <filesystem>
#include <string>
#include "logger.hpp"
#include "transfer_backend.hpp"

/**
 * @brief Backend writing into a directory on a mounted filesystem.
 */
class LocalBackend : public TransferBackend {
public:
    /**
     * @brief Constructs a local backend.
     *
     * @param root Root directory; created on connect() if missing.
     * @param logger Logger for backend events.
     */
    LocalBackend(std::filesystem::path root, const Logger& logger);

    std::string name() const override { return "local"; }
    std::expected<void, TransferError> connect() override;
    std::expected<bool, TransferError> exists(const std::string& path) override;
    std::expected<std::optional<std::uint64_t>, TransferError> size(const std::string& path) override;
    std::expected<void, TransferError> ensureDirectory(const std::string& path) override;
    std::expected<std::unique_ptr<WriteSink>, TransferError> openForWrite(const std::string& path, WriteMode mode) override;
    std::expected<bool, TransferError> remove(const std::string& path) override;
    std::expected<std::vector<RemoteEntry>, TransferError> list(const std::string& path) override;
    bool probe() override;
    bool supportsResume() const override { return false; }
    bool supportsExclusiveCreate() const override { return true; }

    /**
     * @brief Translates a logical path into a filesystem path under the root.
     *
     * @return std::expected<std::filesystem::path, TransferError> The path, or
     *         InvalidArgument for paths escaping the root ("..") or absolute on the host.
     */
    std::expected<std::filesystem::path, TransferError> resolve(const std::string& path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_; ///< Sandbox root.
    const Logger& logger_;       ///< Backend logger.
};

#endif // LOCAL_BACKEND_HPP
