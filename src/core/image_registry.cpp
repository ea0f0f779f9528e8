/**
 * @file image_registry.cpp
 * @brief Implementation of runtime image resolution
 *
 * @date 2025
 */

#include "timebox/core/image_registry.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace timebox {
namespace core {

ImageRegistry::ImageRegistry(utils::ContainerEngine& engine,
                             std::map<std::string, RuntimeProfile> profiles)
    : engine_(engine)
    , profiles_(std::move(profiles)) {
}

const ImageHandle& ImageRegistry::ResolveRuntimeImage(const std::string& runtime) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = resolved_.find(runtime);
        if (cached != resolved_.end()) {
            return cached->second;
        }
    }

    auto profile = profiles_.find(runtime);
    if (profile == profiles_.end()) {
        throw InvalidRequestError("Unknown runtime '" + runtime + "'");
    }

    spdlog::info("Resolving image for runtime '{}': {}", runtime, profile->second.image);

    auto image = engine_.InspectImage(profile->second.image);
    if (!image) {
        throw ImageNotFoundError(runtime, profile->second.image);
    }

    ImageHandle handle;
    handle.runtime = runtime;
    handle.tag = profile->second.image;
    handle.pinned_id = image->id;
    handle.command = profile->second.command;
    handle.entry_file = profile->second.entry_file;
    handle.resolved_at = std::chrono::system_clock::now();

    spdlog::info("Runtime '{}' pinned to {}", runtime, handle.pinned_id);

    std::lock_guard<std::mutex> lock(mutex_);
    // Another thread may have won the race; keep the first pin
    auto inserted = resolved_.emplace(runtime, std::move(handle));
    return inserted.first->second;
}

void ImageRegistry::ResolveAll() {
    for (const auto& [runtime, profile] : profiles_) {
        ResolveRuntimeImage(runtime);
    }
}

const ImageHandle& ImageRegistry::Get(const std::string& runtime) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resolved_.find(runtime);
    if (it == resolved_.end()) {
        if (!profiles_.count(runtime)) {
            throw InvalidRequestError("Unknown runtime '" + runtime + "'");
        }
        throw InvalidRequestError("Runtime '" + runtime + "' has not been resolved");
    }
    return it->second;
}

std::vector<std::string> ImageRegistry::ListRuntimes() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& [runtime, profile] : profiles_) {
        names.push_back(runtime);
    }
    return names;
}

std::vector<ImageHandle> ImageRegistry::ResolvedImages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ImageHandle> handles;
    for (const auto& [runtime, handle] : resolved_) {
        handles.push_back(handle);
    }
    return handles;
}

std::vector<std::string> ImageRegistry::ExpandCommand(const ImageHandle& handle) {
    std::vector<std::string> argv;
    argv.reserve(handle.command.size());
    for (const auto& part : handle.command) {
        std::string expanded = utils::StringUtils::ReplaceAll(part, "{file}", handle.entry_file);
        expanded = utils::StringUtils::ReplaceAll(expanded, "{image}", handle.pinned_id);
        argv.push_back(std::move(expanded));
    }
    return argv;
}

} // namespace core
} // namespace timebox
