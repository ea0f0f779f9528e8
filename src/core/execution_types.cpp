#include "timebox/core/execution_types.hpp"

namespace timebox {
namespace core {

std::string StatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return "Completed";
        case ExecutionStatus::TIMED_OUT: return "TimedOut";
        case ExecutionStatus::CRASHED: return "Crashed";
        case ExecutionStatus::KILLED: return "Killed";
        case ExecutionStatus::INFRASTRUCTURE_FAILURE: return "InfrastructureFailure";
    }
    return "InfrastructureFailure";
}

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::COMPILATION_ERROR: return "CompilationError";
        case ErrorKind::RUNTIME_ERROR: return "RuntimeError";
        case ErrorKind::MEMORY_LIMIT_EXCEEDED: return "MemoryLimitExceeded";
        case ErrorKind::TIME_LIMIT_EXCEEDED: return "TimeLimitExceeded";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::SANDBOX_ERROR: return "SandboxError";
    }
    return "None";
}

} // namespace core
} // namespace timebox
