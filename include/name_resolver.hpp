/**
 * @file name_resolver.hpp
 * @brief Collision-free destination naming.
 *
 * Given a directory and a desired name, probes the backend for name, then stem_1.ext,
 * stem_2.ext, ... and returns the first name that does not exist. The resolver keeps no
 * state between calls. Two concurrent resolutions of the same name in the same directory
 * can pick the same suffix; writers close that window with an exclusive create where the
 * backend offers one.
 */

#ifndef NAME_RESOLVER_HPP
#define NAME_RESOLVER_HPP

#include <expected>
#include <string>
#include <utility>
#include "logger.hpp"
#include "transfer_backend.hpp"

/**
 * @brief Linear-probe name resolver.
 */
class NameResolver {
public:
    /**
     * @brief Highest numeric suffix probed before giving up.
     */
    static constexpr int kMaxProbes = 1000;

    explicit NameResolver(const Logger& logger);

    /**
     * @brief Returns a name that does not exist in directory.
     *
     * @param backend Backend to probe.
     * @param directory Normalized logical directory.
     * @param desiredName Requested file name.
     * @return std::expected<std::string, TransferError> desiredName when free, otherwise the
     *         first free "stem_N.ext"; NameSpaceExhausted after kMaxProbes suffixes.
     */
    std::expected<std::string, TransferError> resolve(TransferBackend& backend, const std::string& directory,
                                                      const std::string& desiredName) const;

    /**
     * @brief Splits a file name into stem and extension ("clip.mxf" -> {"clip", ".mxf"}).
     *
     * Only the last extension is split off; dotfiles such as ".env" have no extension.
     */
    static std::pair<std::string, std::string> splitName(const std::string& name);

private:
    const Logger& logger_;
};

#endif // NAME_RESOLVER_HPP
