#include "util/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace util {

ProcessResult run_process(const ProcessSpec& spec) noexcept {
    ProcessResult res{};
    if (spec.argv.empty() || spec.argv.front().empty()) {
        res.error = "empty command";
        return res;
    }

    std::vector<char*> args;
    args.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    int log_fd = -1;
    if (!spec.log_path.empty()) {
        log_fd = ::open(spec.log_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
        if (log_fd < 0) {
            res.error = "cannot open log " + spec.log_path.string() + ": " + std::strerror(errno);
            return res;
        }
    }

    // Exec failures in the child are reported back through a CLOEXEC pipe.
    int err_pipe[2] = {-1, -1};
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        res.error = std::string("pipe() failed: ") + std::strerror(errno);
        if (log_fd >= 0) ::close(log_fd);
        return res;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork() failed: ") + std::strerror(errno);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        if (log_fd >= 0) ::close(log_fd);
        return res;
    }
    if (pid == 0) {
        ::close(err_pipe[0]);
        if (log_fd >= 0) {
            ::dup2(log_fd, STDOUT_FILENO);
            ::dup2(log_fd, STDERR_FILENO);
        }
        if (!spec.work_dir.empty() && ::chdir(spec.work_dir.c_str()) != 0) {
            const int err = errno;
            (void)!::write(err_pipe[1], &err, sizeof(err));
            std::_Exit(127);
        }
        ::execvp(args[0], args.data());
        const int err = errno;
        (void)!::write(err_pipe[1], &err, sizeof(err));
        std::_Exit(127);
    }

    ::close(err_pipe[1]);
    if (log_fd >= 0) {
        ::close(log_fd);
    }

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        res.error = "exec " + spec.argv.front() + " failed: " + std::strerror(child_errno);
        return res;
    }
    if (waited < 0) {
        res.error = std::string("waitpid() failed: ") + std::strerror(errno);
        return res;
    }

    res.launched = true;
    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.term_signal = WTERMSIG(status);
    }
    return res;
}

std::string describe(const ProcessResult& res) {
    std::ostringstream oss;
    if (!res.launched) {
        oss << "launch failed: " << res.error;
    } else if (res.term_signal != 0) {
        oss << "signal=" << res.term_signal;
    } else {
        oss << "exit=" << res.exit_code;
    }
    return oss.str();
}

} // namespace util
