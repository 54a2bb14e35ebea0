#include "llmtools/bridge/process_runner.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace llmtools {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw McpTransportError(std::string("waitpid failed: ") + strerror(errno));
        }
    }
    return decode_status(status);
}

// Reap pid, killing it if it is still running at deadline.
int wait_until(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timed_out) {
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return decode_status(status);
        if (r < 0 && errno != EINTR) {
            throw McpTransportError(std::string("waitpid failed: ") + strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            kill_group(pid);
            return wait_for(pid);
        }
        ::usleep(5000);
    }
}

} // anonymous namespace

ProcessResult run_process(const std::string& binary,
                          const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) {
    // Build argv before fork: no allocation in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string exec_error = "exec failed: " + binary + "\n";

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw McpTransportError(std::string("Failed to create pipe: ") + strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw McpTransportError(std::string("Failed to fork process: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: own process group so a timeout kills its children too
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::execvp(binary.c_str(), argv.data());
        ssize_t ignored = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    logger()->debug("started {} (pid {}) with {} args", binary, pid, args.size());

    ProcessResult result;
    bool failed = false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int wait_ms = static_cast<int>(std::min<std::int64_t>(remaining.count(), 60000));
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            logger()->error("poll on {} output failed: {}", binary, strerror(errno));
            failed = true;
            break;
        }
        if (ret == 0) continue;  // re-check deadline

        ssize_t n = ::read(out_pipe[0], chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logger()->error("reading {} output failed: {}", binary, strerror(errno));
            failed = true;
            break;
        }
        if (n == 0) break;  // EOF: child and its descendants closed the pipe
        result.output.append(chunk, static_cast<std::size_t>(n));
    }
    ::close(out_pipe[0]);

    if (result.timed_out || failed) {
        kill_group(pid);
        result.exit_code = wait_for(pid);
    } else {
        result.exit_code = wait_until(pid, deadline, result.timed_out);
    }
    if (result.timed_out) {
        logger()->warn("{} (pid {}) timed out after {} ms", binary, pid, timeout.count());
    }
    return result;
}

} // namespace llmtools
