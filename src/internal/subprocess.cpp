#include "subprocess.hpp"

#include "termctl/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

using namespace termctl::literals;

namespace termctl::internal {

    namespace detail {

        static std::vector<char*> make_argv(const std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size() + 1);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            return argv;
        }

        static void close_pipe(int (&fds)[2]) {
            if (fds[0] >= 0) {
                ::close(fds[0]);
            }
            if (fds[1] >= 0) {
                ::close(fds[1]);
            }
            fds[0] = -1;
            fds[1] = -1;
        }

        static bool read_exact(int fd, void* out, size_t size) {
            auto* cursor = static_cast<char*>(out);
            size_t done = 0;
            while (done < size) {
                auto n = ::read(fd, cursor + done, size - done);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return false;
                }
                done += static_cast<size_t>(n);
            }
            return true;
        }

        static void write_all(int fd, const void* data, size_t size) {
            const auto* cursor = static_cast<const char*>(data);
            size_t done = 0;
            while (done < size) {
                auto n = ::write(fd, cursor + done, size - done);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    return;
                }
                done += static_cast<size_t>(n);
            }
        }

    }  // namespace detail

    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms) {
        if (args.empty()) {
            return {.exit_code = 1, .stderr_output = "empty command"};
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        if (::pipe(stdout_pipe) != 0 || ::pipe(stderr_pipe) != 0) {
            detail::close_pipe(stdout_pipe);
            detail::close_pipe(stderr_pipe);
            return {.exit_code = 1, .stderr_output = "pipe() failed"};
        }

        auto pid = ::fork();
        if (pid < 0) {
            detail::close_pipe(stdout_pipe);
            detail::close_pipe(stderr_pipe);
            return {.exit_code = 1, .stderr_output = "fork() failed"};
        }

        if (pid == 0) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            ::dup2(stdout_pipe[1], STDOUT_FILENO);
            ::dup2(stderr_pipe[1], STDERR_FILENO);
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[1]);

            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }

            auto argv = detail::make_argv(args);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        // parent
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        std::string out_buf{};
        std::string err_buf{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        while (fds_open > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     deadline - std::chrono::steady_clock::now())
                                     .count();
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                    }
                    else {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (timed_out) {
            ::kill(pid, SIGKILL);
        }

        for (auto& pfd : fds) {
            if (pfd.fd >= 0) {
                ::close(pfd.fd);
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }

        if (timed_out) {
            return {.exit_code = 1,
                    .stdout_output = std::move(out_buf),
                    .stderr_output = "{} timed out after {}ms"_format(args.front(), timeout_ms),
                    .timed_out = true};
        }

        int exit_code = 1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }

        return {.exit_code = exit_code, .stdout_output = std::move(out_buf), .stderr_output = std::move(err_buf)};
    }

    pid_t spawn_detached(const std::vector<std::string>& args) {
        if (args.empty()) {
            throw std::runtime_error("empty command");
        }

        // pid_pipe carries the grandchild pid; exec_pipe is close-on-exec and
        // only receives an errno if exec fails.
        int pid_pipe[2]{-1, -1};
        int exec_pipe[2]{-1, -1};
        if (::pipe(pid_pipe) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
            detail::close_pipe(pid_pipe);
            detail::close_pipe(exec_pipe);
            throw std::runtime_error("pipe() failed: {}"_format(std::strerror(errno)));
        }

        auto child = ::fork();
        if (child < 0) {
            auto err = errno;
            detail::close_pipe(pid_pipe);
            detail::close_pipe(exec_pipe);
            throw std::runtime_error("fork() failed: {}"_format(std::strerror(err)));
        }

        if (child == 0) {
            ::close(pid_pipe[0]);
            ::close(exec_pipe[0]);
            ::setsid();

            auto grandchild = ::fork();
            if (grandchild < 0) {
                _exit(1);
            }
            if (grandchild > 0) {
                detail::write_all(pid_pipe[1], &grandchild, sizeof(grandchild));
                _exit(0);
            }

            ::close(pid_pipe[1]);
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) {
                    ::close(devnull);
                }
            }

            auto argv = detail::make_argv(args);
            ::execvp(argv[0], argv.data());
            int err = errno;
            detail::write_all(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        // parent
        ::close(pid_pipe[1]);
        ::close(exec_pipe[1]);

        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }

        pid_t launched = -1;
        bool got_pid = detail::read_exact(pid_pipe[0], &launched, sizeof(launched));
        ::close(pid_pipe[0]);

        int exec_errno = 0;
        bool exec_failed = detail::read_exact(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        ::close(exec_pipe[0]);

        if (!got_pid) {
            throw std::runtime_error("failed to start {}"_format(args.front()));
        }
        if (exec_failed) {
            throw std::runtime_error("failed to exec {}: {}"_format(args.front(), std::strerror(exec_errno)));
        }

        return launched;
    }

}  // namespace termctl::internal
