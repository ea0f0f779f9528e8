/**
 * @file image_registry.hpp
 * @brief Runtime name → pinned image resolution
 *
 * Every configured runtime is resolved once, at startup, to an immutable
 * image id. Requests then always run against that exact id, so re-tagging an
 * image while the runner is up cannot change what executes. A missing image
 * is a startup error, never a per-request one.
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/runner_config.hpp"
#include "timebox/utils/container_utils.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace timebox {
namespace core {

/**
 * @struct ImageHandle
 * @brief A runtime bound to one pinned image
 */
struct ImageHandle {
    std::string runtime;                          ///< Logical runtime name
    std::string tag;                              ///< Tag from the configuration
    std::string pinned_id;                        ///< Immutable id the tag resolved to
    std::vector<std::string> command;             ///< argv template
    std::string entry_file;                       ///< Payload file name
    std::chrono::system_clock::time_point resolved_at;
};

/**
 * @class ImageRegistry
 * @brief Resolves and caches runtime images
 */
class ImageRegistry {
public:
    ImageRegistry(utils::ContainerEngine& engine,
                  std::map<std::string, RuntimeProfile> profiles);

    /**
     * @brief Resolve one runtime's image and pin it
     *
     * Repeated calls return the cached handle.
     *
     * @throws InvalidRequestError if the runtime has no profile
     * @throws ImageNotFoundError if the image does not exist
     * @throws InfrastructureFailure if the engine cannot be queried
     */
    const ImageHandle& ResolveRuntimeImage(const std::string& runtime);

    /**
     * @brief Resolve every configured runtime (startup fail-fast)
     * @throws ImageNotFoundError on the first missing image
     */
    void ResolveAll();

    /**
     * @brief Handle of an already resolved runtime
     * @throws InvalidRequestError for unknown or unresolved runtimes
     */
    const ImageHandle& Get(const std::string& runtime) const;

    /// Names of all configured runtimes
    std::vector<std::string> ListRuntimes() const;

    /// All resolved handles
    std::vector<ImageHandle> ResolvedImages() const;

    /**
     * @brief Expand `{file}` and `{image}` in a handle's command template
     */
    static std::vector<std::string> ExpandCommand(const ImageHandle& handle);

private:
    utils::ContainerEngine& engine_;
    std::map<std::string, RuntimeProfile> profiles_;

    mutable std::mutex mutex_;
    std::map<std::string, ImageHandle> resolved_;
};

} // namespace core
} // namespace timebox
