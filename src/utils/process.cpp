#include "utils/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lazyverdi::tui {

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kKillGrace = std::chrono::milliseconds(500);

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drains whatever is readable on fd into out. Returns false once EOF is seen.
bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        // EAGAIN: nothing more for now; anything else is treated as EOF
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void terminate_child(pid_t pid) {
    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kKillGrace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return;
        }
        ::usleep(10 * 1000);
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

} // namespace

ProcessOutput run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const std::atomic<bool>& cancel_requested) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty argv");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "pipe");
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::setpgid(0, 0);
        ::execvp(c_argv[0], c_argv.data());
        const char* msg = "failed to execute: ";
        ssize_t ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
        ignored = ::write(STDERR_FILENO, c_argv[0], std::strlen(c_argv[0]));
        ignored = ::write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    ProcessOutput result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (cancel_requested.load()) {
            result.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe[0], POLLIN, 0};

        int rc = ::poll(fds, count, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            terminate_child(pid);
            throw std::system_error(saved, std::generic_category(), "poll");
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_pipe[0]) {
                out_open = drain(out_pipe[0], result.out);
            } else {
                err_open = drain(err_pipe[0], result.err);
            }
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (result.cancelled || result.timed_out) {
        terminate_child(pid);
        result.exit_code = result.cancelled ? 130 : 124;
        if (result.timed_out) {
            result.err += "\nCommand timed out after " +
                          std::to_string(timeout.count() / 1000) + "s";
        }
        return result;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    result.exit_code = decode_status(status);
    return result;
}

int reap_exited_children() {
    int reaped = 0;
    int status = 0;
    while (::waitpid(-1, &status, WNOHANG) > 0) {
        ++reaped;
    }
    return reaped;
}

std::string find_executable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0 ? program : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::string path(path_env);
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return {};
}

} // namespace lazyverdi::tui
