#include "processUtils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <climits>

namespace {

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "run_process: pipe");
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char* const* argv, const char* working_dir, int out_fd, int err_fd) {
    if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
        ::_exit(127);
    }
    if (working_dir && ::chdir(working_dir) != 0) {
        static const char msg[] = "run_process: cannot change to working directory\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(127);
    }
    ::execvp(argv[0], argv);
    static const char msg[] = "run_process: exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
}

} // namespace

std::string ProcessUtils::get_host_name() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "localhost";
    }
    return std::string(buffer);
}

// Cross-platform thread naming
void ProcessUtils::set_current_thread_name(const std::string& name) {
#if defined(__APPLE__)
    // macOS supports setting name for current thread only
    pthread_setname_np(name.c_str());
#elif defined(__linux__)
    // Linux limits name to 16 chars including NUL
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
    (void)name; // no-op on unsupported platforms
#endif
}

ProcessResult ProcessUtils::run_process(const std::vector<std::string>& argv,
                                        const std::filesystem::path& working_dir) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty command line");
    }

    // Build everything the child needs before forking.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
    c_argv.push_back(nullptr);
    const std::string dir = working_dir.string();

    Pipe out_pipe;
    Pipe err_pipe;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "run_process: fork " + argv.front());
    }
    if (pid == 0) {
        exec_child(c_argv.data(), dir.empty() ? nullptr : dir.c_str(), out_pipe.write_end(), err_pipe.write_end());
    }

    out_pipe.close_write();
    err_pipe.close_write();

    ProcessResult result;
    // Drain both pipes together so a chatty child can never block on a full pipe.
    pollfd fds[2] = {{out_pipe.read_end(), POLLIN, 0}, {err_pipe.read_end(), POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;
    char buffer[8192];
    while (open_streams > 0) {
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            const int saved = errno;
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            throw std::system_error(saved, std::generic_category(), "run_process: poll");
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "run_process: waitpid");
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
