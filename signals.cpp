#include <string>
#include <iostream>

#include <errno.h>
#include <signal.h>
#include <string.h>

#include "signals.hpp"

using std::string;
using std::to_string;

static volatile sig_atomic_t interrupted = 0;

static void on_interrupt(int) {
    interrupted = 1;
}

Result<bool, std::string> deliver_signal(pid_t pid, int signal_number) {
    int rc = kill(pid, signal_number);
    if (rc != 0) {
        if (errno == ESRCH) {
            // Process does not exist
            return ResultInit::ok(false);
        }

        int errno_copy = errno;
        return ResultInit::err(string("kill(") + to_string(pid) + ", " + strsignal(signal_number) + ") failed with errno = " + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }

    return ResultInit::ok(true);
}

Status install_interrupt_handler() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0) {
        int errno_copy = errno;
        return ResultInit::err(string("sigaction(SIGINT) failed with errno = ") + to_string(errno_copy) + " message = " + strerror(errno_copy));
    }

    return ResultInit::ok();
}

bool was_interrupted() {
    return interrupted != 0;
}

void clear_interrupted() {
    interrupted = 0;
}

IgnoreSigpipeGuard::IgnoreSigpipeGuard() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    memset(&previous, 0, sizeof(previous));
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGPIPE, &action, &previous) == 0) {
        installed = true;
    } else {
        std::cerr << "sigaction(SIGPIPE) failed with errno = " << errno << " message = " << strerror(errno) << "\n";
    }
}

IgnoreSigpipeGuard::~IgnoreSigpipeGuard() {
    if (installed) {
        if (sigaction(SIGPIPE, &previous, nullptr) != 0) {
            std::cerr << "sigaction(SIGPIPE) restore failed with errno = " << errno << " message = " << strerror(errno) << "\n";
        }
        installed = false;
    }
}
