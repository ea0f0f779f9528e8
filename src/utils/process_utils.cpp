/**
 * @file process_utils.cpp
 * @brief Implementation of child process spawning and bounded capture
 *
 * **Spawn Sequence**:
 * 1. Resolve the program through PATH and flatten argv/envp in the parent
 *    (nothing in the child allocates)
 * 2. Create close-on-exec pipes for stdin, stdout, stderr and error reporting
 * 3. fork(); the child joins a new process group, resets signal state,
 *    changes directory, applies rlimits, optionally unshares namespaces and
 *    execs
 * 4. Any pre-exec failure is written to the error pipe as (stage, errno);
 *    a successful exec closes the pipe and the parent reads EOF
 *
 * **Reaping**: Wait() first blocks with WNOWAIT so the child stays a zombie
 * while the group is torn down, then reaps under the state mutex. Signals
 * sent through SignalGroup() therefore never hit a recycled pid.
 *
 * @date 2025
 */

#include "timebox/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

extern char** environ;

namespace timebox {
namespace utils {

namespace {

// ============================================================================
// CHILD-SIDE HELPERS
// ============================================================================
// Only async-signal-safe calls are allowed between fork() and exec()

enum class ChildStage : int {
    PROCESS_GROUP = 1,
    SIGNALS,
    CHDIR,
    RLIMIT,
    NAMESPACE,
    DUP_STREAMS,
    EXEC
};

struct ChildFailure {
    int stage;
    int error;
};

const char* StageName(int stage) {
    switch (static_cast<ChildStage>(stage)) {
        case ChildStage::PROCESS_GROUP: return "setpgid";
        case ChildStage::SIGNALS: return "signal reset";
        case ChildStage::CHDIR: return "chdir";
        case ChildStage::RLIMIT: return "setrlimit";
        case ChildStage::NAMESPACE: return "unshare";
        case ChildStage::DUP_STREAMS: return "dup2";
        case ChildStage::EXEC: return "execve";
    }
    return "spawn";
}

[[noreturn]] void ChildDie(int error_fd, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = write(error_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

bool SetLimit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

void MakePipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

void CloseQuietly(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

ExitStatus DecodeStatus(int status, const struct rusage& usage) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exited = false;
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    if (usage.ru_maxrss > 0) {
        result.max_rss_kb = static_cast<std::size_t>(usage.ru_maxrss);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// SIGNAL SETUP
// ============================================================================

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

// ============================================================================
// PATH LOOKUP
// ============================================================================

std::optional<std::filesystem::path> Which(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }

    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(program);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }

        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        struct stat info;
        if (stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(candidate);
        }

        start = end + 1;
    }

    return std::nullopt;
}

namespace {

// Async-signal-safe; used between fork and exec
bool WriteProcFile(const char* path, const char* content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd == -1) {
        return false;
    }
    std::size_t length = std::strlen(content);
    ssize_t written = write(fd, content, length);
    close(fd);
    return written == static_cast<ssize_t>(length);
}

} // anonymous namespace

// ============================================================================
// SUBPROCESS
// ============================================================================

std::unique_ptr<Subprocess> Subprocess::Spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "empty argv");
    }

    IgnoreSigpipe();

    auto program = Which(options.argv[0]);
    if (!program) {
        throw std::system_error(ENOENT, std::generic_category(),
                                "executable not found: " + options.argv[0]);
    }
    std::string program_path = program->string();

    // Flatten argv and envp before fork
    std::vector<std::string> arg_storage = options.argv;
    std::vector<char*> argv;
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (options.environment) {
        for (const auto& [key, value] : *options.environment) {
            env_storage.push_back(key + "=" + value);
        }
        for (auto& entry : env_storage) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
    }
    char** child_env = options.environment ? envp.data() : environ;

    std::string workdir = options.working_directory.string();
    const ChildLimits& limits = options.limits;
    std::string uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    std::string gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                       err_pipe[0], err_pipe[1], report_pipe[0], report_pipe[1]}) {
            CloseQuietly(fd);
        }
    };

    try {
        MakePipe(in_pipe);
        MakePipe(out_pipe);
        MakePipe(err_pipe);
        MakePipe(report_pipe);
    } catch (...) {
        close_all();
        throw;
    }

    pid_t pid = fork();
    if (pid == -1) {
        int error = errno;
        close_all();
        throw std::system_error(error, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child
        int report_fd = report_pipe[1];

        if (options.new_process_group && setpgid(0, 0) == -1) {
            ChildDie(report_fd, ChildStage::PROCESS_GROUP);
        }

        // Ignored dispositions survive exec; restore defaults
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGPIPE, &action, nullptr) == -1) {
            ChildDie(report_fd, ChildStage::SIGNALS);
        }
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr) == -1) {
            ChildDie(report_fd, ChildStage::SIGNALS);
        }

        if (!workdir.empty() && chdir(workdir.c_str()) == -1) {
            ChildDie(report_fd, ChildStage::CHDIR);
        }

        if (limits.address_space_bytes &&
            !SetLimit(RLIMIT_AS, static_cast<rlim_t>(*limits.address_space_bytes))) {
            ChildDie(report_fd, ChildStage::RLIMIT);
        }
        if (limits.cpu_seconds &&
            !SetLimit(RLIMIT_CPU, static_cast<rlim_t>(*limits.cpu_seconds))) {
            ChildDie(report_fd, ChildStage::RLIMIT);
        }
        if (limits.file_size_bytes &&
            !SetLimit(RLIMIT_FSIZE, static_cast<rlim_t>(*limits.file_size_bytes))) {
            ChildDie(report_fd, ChildStage::RLIMIT);
        }
        if (limits.disable_core_dumps && !SetLimit(RLIMIT_CORE, 0)) {
            ChildDie(report_fd, ChildStage::RLIMIT);
        }

        if (limits.isolate_network) {
            if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
                // Map our own ids so files we create keep a valid owner
                bool mapped = WriteProcFile("/proc/self/setgroups", "deny") &&
                              WriteProcFile("/proc/self/uid_map", uid_map.c_str()) &&
                              WriteProcFile("/proc/self/gid_map", gid_map.c_str());
                if (!mapped && limits.require_network_isolation) {
                    ChildDie(report_fd, ChildStage::NAMESPACE);
                }
            } else if (limits.require_network_isolation) {
                ChildDie(report_fd, ChildStage::NAMESPACE);
            }
        }

        if (dup2(in_pipe[0], STDIN_FILENO) == -1 ||
            dup2(out_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(err_pipe[1], STDERR_FILENO) == -1) {
            ChildDie(report_fd, ChildStage::DUP_STREAMS);
        }

        execve(program_path.c_str(), argv.data(), child_env);
        ChildDie(report_fd, ChildStage::EXEC);
    }

    // Parent
    if (options.new_process_group) {
        // Mirror the child's setpgid to close the race before it runs
        setpgid(pid, pid);
    }

    CloseQuietly(in_pipe[0]);
    CloseQuietly(out_pipe[1]);
    CloseQuietly(err_pipe[1]);
    CloseQuietly(report_pipe[1]);

    ChildFailure failure{0, 0};
    ssize_t got;
    do {
        got = read(report_pipe[0], &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);
    CloseQuietly(report_pipe[0]);

    if (got > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        CloseQuietly(in_pipe[1]);
        CloseQuietly(out_pipe[0]);
        CloseQuietly(err_pipe[0]);
        throw std::system_error(failure.error, std::generic_category(),
                                std::string(StageName(failure.stage)) + " failed for " +
                                    options.argv[0]);
    }

    std::unique_ptr<Subprocess> process(new Subprocess());
    process->pid_ = pid;
    process->own_group_ = options.new_process_group;
    process->kill_group_on_exit_ = options.new_process_group && options.kill_group_on_exit;
    process->stdin_fd_ = in_pipe[1];
    process->stdout_fd_ = out_pipe[0];
    process->stderr_fd_ = err_pipe[0];

    SetNonBlocking(process->stdin_fd_);
    SetNonBlocking(process->stdout_fd_);
    SetNonBlocking(process->stderr_fd_);

    spdlog::debug("Spawned pid {}: {}", pid, options.argv[0]);
    return process;
}

Subprocess::~Subprocess() {
    bool needs_reap = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        needs_reap = !reaped_ && pid_ > 0;
    }

    if (needs_reap) {
        SignalGroup(SIGKILL);
        Wait();
    }

    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

void Subprocess::CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void Subprocess::CloseStdin() { CloseFd(stdin_fd_); }
void Subprocess::CloseStdout() { CloseFd(stdout_fd_); }
void Subprocess::CloseStderr() { CloseFd(stderr_fd_); }

bool Subprocess::SignalGroup(int signal) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_ || pid_ <= 0) {
        return false;
    }

    int rc = own_group_ ? killpg(pid_, signal) : kill(pid_, signal);
    if (rc == -1 && errno != ESRCH) {
        spdlog::warn("Failed to signal pid {} with {}: {}", pid_, signal, std::strerror(errno));
        return false;
    }
    return rc == 0;
}

bool Subprocess::HasExited() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return true;
    }

    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
        return false;
    }
    return info.si_pid != 0;
}

ExitStatus Subprocess::Wait() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (reaped_) {
            return status_;
        }
    }

    // Block until the child is a zombie, but leave it unreaped
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
        if (errno != EINTR) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return status_;
    }

    if (kill_group_on_exit_) {
        // The leader is still a zombie, so the group id cannot be recycled yet
        killpg(pid_, SIGKILL);
    }

    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    pid_t rc;
    do {
        rc = wait4(pid_, &status, 0, &usage);
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        spdlog::error("wait4 failed for pid {}: {}", pid_, std::strerror(errno));
        status_ = ExitStatus{};
    } else {
        status_ = DecodeStatus(status, usage);
    }
    reaped_ = true;
    return status_;
}

// ============================================================================
// BOUNDED BUFFER
// ============================================================================

void BoundedBuffer::Append(const char* data, std::size_t length) {
    total_bytes_ += length;
    if (data_.size() >= cap_) {
        if (length > 0) {
            truncated_ = true;
        }
        return;
    }

    std::size_t room = cap_ - data_.size();
    if (length > room) {
        data_.append(data, room);
        truncated_ = true;
    } else {
        data_.append(data, length);
    }
}

// ============================================================================
// STREAM PUMP
// ============================================================================

StreamPump::StreamPump(Subprocess& process, std::string stdin_data,
                       std::size_t stdout_cap, std::size_t stderr_cap)
    : process_(process)
    , stdin_data_(std::move(stdin_data))
    , stdout_(stdout_cap)
    , stderr_(stderr_cap) {
    if (stdin_data_.empty()) {
        process_.CloseStdin();
    }
}

bool StreamPump::ReadAvailable(int fd, BoundedBuffer& buffer) {
    std::array<char, 8192> chunk;
    while (true) {
        ssize_t got = read(fd, chunk.data(), chunk.size());
        if (got > 0) {
            buffer.Append(chunk.data(), static_cast<std::size_t>(got));
            continue;
        }
        if (got == 0) {
            return false;  // EOF
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::warn("Read from child pipe failed: {}", std::strerror(errno));
        return false;
    }
}

void StreamPump::WritePendingInput() {
    int fd = process_.StdinFd();
    while (fd >= 0 && stdin_offset_ < stdin_data_.size()) {
        ssize_t wrote = write(fd, stdin_data_.data() + stdin_offset_,
                              stdin_data_.size() - stdin_offset_);
        if (wrote > 0) {
            stdin_offset_ += static_cast<std::size_t>(wrote);
            continue;
        }
        if (wrote == -1 && errno == EINTR) {
            continue;
        }
        if (wrote == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the program stopped reading; the rest of the input is dropped
        spdlog::debug("Child stdin closed early after {} of {} bytes",
                      stdin_offset_, stdin_data_.size());
        break;
    }
    process_.CloseStdin();
}

void StreamPump::DrainAndClose() {
    if (process_.StdoutFd() >= 0) {
        ReadAvailable(process_.StdoutFd(), stdout_);
        process_.CloseStdout();
    }
    if (process_.StderrFd() >= 0) {
        ReadAvailable(process_.StderrFd(), stderr_);
        process_.CloseStderr();
    }
    process_.CloseStdin();
}

bool StreamPump::Run(const std::function<bool()>& should_stop,
                     std::chrono::milliseconds tick) {
    while (true) {
        std::vector<struct pollfd> fds;
        if (process_.StdoutFd() >= 0) {
            fds.push_back({process_.StdoutFd(), POLLIN, 0});
        }
        if (process_.StderrFd() >= 0) {
            fds.push_back({process_.StderrFd(), POLLIN, 0});
        }
        if (fds.empty()) {
            process_.CloseStdin();
            return true;
        }
        if (process_.StdinFd() >= 0) {
            fds.push_back({process_.StdinFd(), POLLOUT, 0});
        }

        int ready = poll(fds.data(), fds.size(), static_cast<int>(tick.count()));
        if (ready == -1 && errno != EINTR) {
            spdlog::error("poll on child pipes failed: {}", std::strerror(errno));
            DrainAndClose();
            return false;
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }
            if (entry.fd == process_.StdoutFd()) {
                if (!ReadAvailable(entry.fd, stdout_)) {
                    process_.CloseStdout();
                }
            } else if (entry.fd == process_.StderrFd()) {
                if (!ReadAvailable(entry.fd, stderr_)) {
                    process_.CloseStderr();
                }
            } else if (entry.fd == process_.StdinFd()) {
                WritePendingInput();
            }
        }

        if (process_.HasExited()) {
            // Background children may keep the pipes open; take what is buffered
            DrainAndClose();
            return true;
        }

        if (should_stop && should_stop()) {
            DrainAndClose();
            return false;
        }
    }
}

// ============================================================================
// ONE-SHOT COMMANDS
// ============================================================================

CommandResult RunCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
    CommandResult result;

    std::unique_ptr<Subprocess> process;
    try {
        SpawnOptions options;
        options.argv = argv;
        options.limits.disable_core_dumps = false;
        process = Subprocess::Spawn(options);
    } catch (const std::system_error& e) {
        result.spawn_failed = true;
        result.error = e.what();
        return result;
    }

    constexpr std::size_t kCommandOutputCap = 16 * 1024 * 1024;
    StreamPump pump(*process, "", kCommandOutputCap, kCommandOutputCap);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool finished = pump.Run([deadline]() {
        return std::chrono::steady_clock::now() >= deadline;
    });

    if (!finished) {
        result.timed_out = true;
        process->SignalGroup(SIGKILL);
        spdlog::warn("Command timed out after {} ms: {}", timeout.count(), argv.front());
    }

    ExitStatus status = process->Wait();
    result.exit_code = status.exit_code;
    result.output = pump.Stdout().Release();
    result.error = pump.Stderr().Release();
    return result;
}

} // namespace utils
} // namespace timebox
