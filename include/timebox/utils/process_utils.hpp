/**
 * @file process_utils.hpp
 * @brief Child process spawning, bounded output capture and command helpers
 *
 * Provides the process plumbing shared by every container engine: a
 * fork/exec wrapper that places the child in its own process group with
 * kernel resource limits applied, a poll(2) based pump that captures
 * stdout/stderr into size-capped buffers while feeding stdin, and a
 * one-shot command runner used for engine CLI calls.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace timebox {
namespace utils {

/**
 * @struct ChildLimits
 * @brief Kernel-enforced limits applied in the child before exec
 */
struct ChildLimits {
    std::optional<std::size_t> address_space_bytes;  ///< RLIMIT_AS
    std::optional<std::size_t> cpu_seconds;          ///< RLIMIT_CPU (SIGXCPU on expiry)
    std::optional<std::size_t> file_size_bytes;      ///< RLIMIT_FSIZE
    bool disable_core_dumps{true};                   ///< RLIMIT_CORE = 0
    bool isolate_network{false};                     ///< Enter fresh user+network namespaces
    bool require_network_isolation{false};           ///< Fail the spawn if isolation is unavailable
};

/**
 * @struct SpawnOptions
 * @brief Everything needed to start one child process
 */
struct SpawnOptions {
    std::vector<std::string> argv;                                  ///< Program and arguments
    std::optional<std::map<std::string, std::string>> environment;  ///< nullopt inherits ours
    std::filesystem::path working_directory;                        ///< Empty keeps ours
    bool new_process_group{true};                                   ///< Child leads its own group
    bool kill_group_on_exit{true};                                  ///< SIGKILL stragglers once the leader exits
    ChildLimits limits;
};

/**
 * @struct ExitStatus
 * @brief Decoded wait status of a reaped child
 */
struct ExitStatus {
    bool exited{false};                    ///< Normal exit (exit_code valid)
    int exit_code{-1};                     ///< Exit code when exited
    int term_signal{0};                    ///< Terminating signal when !exited
    std::optional<std::size_t> max_rss_kb; ///< Peak resident set from rusage
};

/**
 * @class Subprocess
 * @brief Owned child process with piped standard streams
 *
 * The destructor kills the whole process group and reaps the child if the
 * owner never waited for it, so a Subprocess can never leak a running
 * process. Signalling is safe from any thread and becomes a no-op once the
 * child has been reaped.
 */
class Subprocess {
public:
    /**
     * @brief Fork and exec a child
     * @throws std::system_error if pipes, fork, or any pre-exec step fails
     *         (including exec itself, reported through a close-on-exec pipe)
     */
    static std::unique_ptr<Subprocess> Spawn(const SpawnOptions& options);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t Pid() const { return pid_; }
    int StdinFd() const { return stdin_fd_; }
    int StdoutFd() const { return stdout_fd_; }
    int StderrFd() const { return stderr_fd_; }

    void CloseStdin();
    void CloseStdout();
    void CloseStderr();

    /**
     * @brief Deliver a signal to the child's process group (or the child alone)
     * @return false if the child is already reaped or kill(2) failed
     */
    bool SignalGroup(int signal);

    /// True once the child has terminated, without reaping it
    bool HasExited();

    /// Block until the child terminates, then reap it
    ExitStatus Wait();

private:
    Subprocess() = default;
    void CloseFd(int& fd);

    pid_t pid_{-1};
    bool own_group_{true};
    bool kill_group_on_exit_{true};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::mutex state_mutex_;
    bool reaped_{false};
    ExitStatus status_;
};

/**
 * @class BoundedBuffer
 * @brief Append-only byte buffer that drops everything past its cap
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t cap) : cap_(cap) {}

    void Append(const char* data, std::size_t length);

    const std::string& Data() const { return data_; }
    std::string Release() { return std::move(data_); }
    bool Truncated() const { return truncated_; }
    std::size_t TotalBytes() const { return total_bytes_; }
    std::size_t Cap() const { return cap_; }

private:
    std::size_t cap_;
    std::string data_;
    bool truncated_{false};
    std::size_t total_bytes_{0};
};

/**
 * @class StreamPump
 * @brief Incremental stdout/stderr capture with non-blocking stdin feeding
 *
 * Reads both output pipes as data arrives, keeping at most the configured
 * number of bytes per stream. Excess bytes are still read (and discarded)
 * so the child never blocks on a full pipe.
 */
class StreamPump {
public:
    StreamPump(Subprocess& process, std::string stdin_data,
               std::size_t stdout_cap, std::size_t stderr_cap);

    /**
     * @brief Pump until the output streams close or the child exits
     *
     * @param should_stop Polled once per tick; returning true abandons the
     *        streams (their descriptors are closed)
     * @param tick Poll interval
     * @return true if the pump finished on its own, false if abandoned
     */
    bool Run(const std::function<bool()>& should_stop,
             std::chrono::milliseconds tick = std::chrono::milliseconds(50));

    BoundedBuffer& Stdout() { return stdout_; }
    BoundedBuffer& Stderr() { return stderr_; }

private:
    bool ReadAvailable(int fd, BoundedBuffer& buffer);
    void WritePendingInput();
    void DrainAndClose();

    Subprocess& process_;
    std::string stdin_data_;
    std::size_t stdin_offset_{0};
    BoundedBuffer stdout_;
    BoundedBuffer stderr_;
};

/**
 * @struct CommandResult
 * @brief Outcome of a one-shot command
 */
struct CommandResult {
    int exit_code{-1};         ///< Exit code, or 128 + signal
    std::string output;        ///< Captured stdout
    std::string error;         ///< Captured stderr (or spawn error text)
    bool timed_out{false};     ///< Killed because the timeout elapsed
    bool spawn_failed{false};  ///< The program could not be started at all
};

/**
 * @brief Run a command to completion, capturing its output
 *
 * Arguments are passed to exec directly; nothing goes through a shell.
 */
CommandResult RunCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout = std::chrono::seconds(30));

/**
 * @brief Locate an executable the way a shell would, using PATH
 * @return Absolute path, or nullopt when not found or not executable
 */
std::optional<std::filesystem::path> Which(const std::string& program);

/// Ignore SIGPIPE process-wide (writes to dead children return EPIPE)
void IgnoreSigpipe();

} // namespace utils
} // namespace timebox
