/**
 * @file errors.hpp
 * @brief Exception taxonomy of the execution core
 *
 * Signalled conditions that are not execution outcomes. Outcomes (timeout,
 * crash, cancellation, infrastructure failure during a run) travel inside
 * ExecutionResult instead.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace timebox {
namespace core {

/**
 * @class TimeboxError
 * @brief Base of every exception thrown across the core's public seams
 */
class TimeboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ImageNotFoundError
 * @brief A configured runtime image does not exist on the engine
 *
 * Fatal at startup; never raised per request.
 */
class ImageNotFoundError : public TimeboxError {
public:
    ImageNotFoundError(const std::string& runtime, const std::string& tag)
        : TimeboxError("Runtime image not found for '" + runtime + "': " + tag +
                       " (build it before starting the runner)")
        , runtime_(runtime)
        , tag_(tag) {}

    const std::string& GetRuntime() const { return runtime_; }
    const std::string& GetTag() const { return tag_; }

private:
    std::string runtime_;
    std::string tag_;
};

/**
 * @class AdmissionRejected
 * @brief The sandbox pool stayed saturated for the whole admission wait
 *
 * Callers should retry with backoff; this is not an execution failure.
 */
class AdmissionRejected : public TimeboxError {
public:
    AdmissionRejected(std::size_t ceiling, std::chrono::milliseconds waited)
        : TimeboxError("Sandbox pool saturated (" + std::to_string(ceiling) +
                       " live); gave up after " + std::to_string(waited.count()) + " ms")
        , ceiling_(ceiling)
        , waited_(waited) {}

    std::size_t GetCeiling() const { return ceiling_; }
    std::chrono::milliseconds GetWaited() const { return waited_; }

private:
    std::size_t ceiling_;
    std::chrono::milliseconds waited_;
};

/**
 * @class InfrastructureFailure
 * @brief The engine could not provide a sandbox (daemon down, create failed)
 */
class InfrastructureFailure : public TimeboxError {
public:
    using TimeboxError::TimeboxError;
};

/**
 * @class InvalidRequestError
 * @brief The request cannot be executed as submitted
 */
class InvalidRequestError : public TimeboxError {
public:
    using TimeboxError::TimeboxError;
};

} // namespace core
} // namespace timebox
