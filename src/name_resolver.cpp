#include "name_resolver.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

NameResolver::NameResolver(const Logger& logger) : logger_(logger) {}

std::pair<std::string, std::string> NameResolver::splitName(const std::string& name) {
    fs::path path(name);
    return {path.stem().string(), path.extension().string()};
}

std::expected<std::string, TransferError> NameResolver::resolve(TransferBackend& backend, const std::string& directory,
                                                                const std::string& desiredName) const {
    auto taken = backend.exists(joinPath(directory, desiredName));
    if (!taken) {
        return std::unexpected(taken.error());
    }
    if (!*taken) {
        return desiredName;
    }

    const auto [stem, extension] = splitName(desiredName);
    for (int counter = 1; counter <= kMaxProbes; ++counter) {
        std::string candidate = fmt::format("{}_{}{}", stem, counter, extension);
        auto exists = backend.exists(joinPath(directory, candidate));
        if (!exists) {
            return std::unexpected(exists.error());
        }
        if (!*exists) {
            logger_.logMessage(fmt::format("File {} already exists. Using new name: {}", desiredName, candidate));
            return candidate;
        }
    }

    return std::unexpected(TransferError{ErrorKind::NameSpaceExhausted,
                                         fmt::format("Too many files with name pattern: {}_*{}", stem, extension)});
}
