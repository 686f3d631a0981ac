#include <string>
#include <vector>
#include <iostream>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <sys/types.h>
#include <sys/wait.h>

#include "process.hpp"

using std::string;
using std::to_string;
using std::vector;

static string errno_message(const string& call, int errno_copy) {
    return call + " failed with errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy);
}

FdGuard::~FdGuard() {
    reset();
}

void FdGuard::reset() {
    if (fd >= 0) {
        int rc = close(fd);
        if (rc != 0) {
            int errno_copy = errno;
            std::cerr << errno_message("close(" + to_string(fd) + ")", errno_copy) << "\n";
        }
        fd = -1;
    }
}

Result<pid_t, std::string> spawn_process(const SpawnOptions& options) {
    if (options.argv.empty()) {
        return ResultInit::err("spawn_process() called with empty argv");
    }

    // Everything the child needs is prepared before fork().
    vector<char*> argv;
    for (const auto& arg: options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int out_fd = -1;
    if (!options.stdout_path.empty()) {
        out_fd = open(options.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (out_fd < 0) {
            int errno_copy = errno;
            return ResultInit::err(errno_message("open(" + options.stdout_path + ")", errno_copy));
        }
    }
    FdGuard stdout_fd(out_fd);

    int err_fd = -1;
    if (options.stderr_to_null) {
        err_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (err_fd < 0) {
            int errno_copy = errno;
            return ResultInit::err(errno_message("open(/dev/null)", errno_copy));
        }
    }
    FdGuard stderr_fd(err_fd);

    // The child reports a failed exec through this pipe; a successful exec closes it.
    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        int errno_copy = errno;
        return ResultInit::err(errno_message("pipe2()", errno_copy));
    }
    FdGuard error_read(error_pipe[0]);
    FdGuard error_write(error_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        int errno_copy = errno;
        return ResultInit::err(errno_message("fork()", errno_copy));
    }

    if (pid == 0) {
        int child_errno = 0;
        if (options.new_process_group && setpgid(0, 0) != 0) {
            child_errno = errno;
        } else if (options.stdin_fd >= 0 && dup2(options.stdin_fd, STDIN_FILENO) < 0) {
            child_errno = errno;
        } else if (stdout_fd.get() >= 0 && dup2(stdout_fd.get(), STDOUT_FILENO) < 0) {
            child_errno = errno;
        } else if (stderr_fd.get() >= 0 && dup2(stderr_fd.get(), STDERR_FILENO) < 0) {
            child_errno = errno;
        } else {
            signal(SIGINT, SIG_DFL);
            signal(SIGPIPE, SIG_DFL);
            execvp(argv[0], argv.data());
            child_errno = errno;
        }

        ssize_t written = write(error_write.get(), &child_errno, sizeof(child_errno));
        _exit(written == sizeof(child_errno) ? 127 : 126);
    }

    error_write.reset();

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(error_read.get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    if (got == sizeof(child_errno)) {
        auto reaped = wait_process(pid);
        if (!reaped.isOk()) {
            std::cerr << reaped.getErrRef() << "\n";
        }
        return ResultInit::err(errno_message("execvp(" + options.argv[0] + ")", child_errno));
    }

    return ResultInit::ok(pid_t(pid));
}

Result<bool, std::string> process_has_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));

    int rc = waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT);
    if (rc != 0) {
        if (errno == ECHILD) {
            // Already reaped.
            return ResultInit::ok(true);
        }
        int errno_copy = errno;
        return ResultInit::err(errno_message("waitid(" + to_string(pid) + ")", errno_copy));
    }

    // With WNOHANG, si_pid stays 0 while the child is running.
    return ResultInit::ok(info.si_pid == pid);
}

Result<int, std::string> wait_process(pid_t pid) {
    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc != pid) {
        int errno_copy = errno;
        return ResultInit::err(errno_message("waitpid(" + to_string(pid) + ")", errno_copy));
    }

    return ResultInit::ok(int(status));
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return "exit code " + to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return string("killed by signal ") + strsignal(WTERMSIG(status));
    }
    return "wait status " + to_string(status);
}

Status write_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t rc = write(fd, data.data() + offset, data.size() - offset);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            int errno_copy = errno;
            return ResultInit::err(errno_message("write()", errno_copy));
        }
        offset += rc;
    }

    return ResultInit::ok();
}
