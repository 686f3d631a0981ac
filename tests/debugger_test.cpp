#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "debugger.hpp"
#include "process.hpp"
#include "sampler.hpp"
#include "test_util.hpp"

static bool wait_until_exited(const Debugger& debugger) {
    for (int i = 0; i < 500; ++i) {
        auto exited = debugger_has_exited(debugger);
        if (exited.isOk() && exited.getOkRef()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

TEST(DebuggerTest, AttachRedirectsStdoutToSessionFile) {
    std::string session_path = temp_path("attach.log");

    // echo prints the arguments gdb would have received.
    auto started = attach_debugger("echo", 4242, "/tmp/x.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();
    EXPECT_EQ(debugger.session_path, session_path);

    auto status = wait_debugger(debugger);
    ASSERT_TRUE(status.isOk());
    EXPECT_TRUE(WIFEXITED(status.getOkRef()));
    EXPECT_EQ(WEXITSTATUS(status.getOkRef()), 0);
    EXPECT_EQ(read_file(session_path), "-q -nx -batch -p 4242 -x /tmp/x.gdb\n");

    unlink(session_path.c_str());
}

TEST(DebuggerTest, LaunchAppendsCommand) {
    std::string session_path = temp_path("launch.log");

    auto started = launch_debugger("echo", { "./app", "+RTS", "-N2" }, "/tmp/y.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();

    ASSERT_TRUE(wait_debugger(debugger).isOk());
    EXPECT_EQ(read_file(session_path), "-q -nx -batch -x /tmp/y.gdb --args ./app +RTS -N2\n");

    unlink(session_path.c_str());
}

TEST(DebuggerTest, LaunchDiscardsStderr) {
    std::string gdb = fake_gdb("noisy-gdb", "echo out; echo noise >&2");
    std::string session_path = temp_path("noisy.log");

    auto started = launch_debugger(gdb, { "./app" }, "/tmp/z.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();

    ASSERT_TRUE(wait_debugger(debugger).isOk());
    EXPECT_EQ(read_file(session_path), "out\n");

    unlink(session_path.c_str());
    unlink(gdb.c_str());
}

TEST(DebuggerTest, LaunchWithoutCommandFails) {
    auto started = launch_debugger("echo", {}, "/tmp/z.gdb", temp_path("nothing.log"));
    EXPECT_FALSE(started.isOk());
}

TEST(DebuggerTest, RunsInOwnProcessGroup) {
    std::string gdb = fake_gdb("sleepy-gdb", "exec sleep 10");
    std::string session_path = temp_path("group.log");

    auto started = attach_debugger(gdb, 1, "/tmp/g.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();

    EXPECT_EQ(getpgid(debugger.pid), debugger.pid);
    EXPECT_NE(getpgid(debugger.pid), getpgrp());

    auto exited = debugger_has_exited(debugger);
    ASSERT_TRUE(exited.isOk());
    EXPECT_FALSE(exited.getOkRef());

    ASSERT_TRUE(terminate_debugger(debugger).isOk());
    auto status = wait_debugger(debugger);
    ASSERT_TRUE(status.isOk());
    EXPECT_TRUE(WIFSIGNALED(status.getOkRef()));
    EXPECT_EQ(WTERMSIG(status.getOkRef()), SIGTERM);

    unlink(session_path.c_str());
    unlink(gdb.c_str());
}

TEST(DebuggerTest, SamplerHooksControlDebugger) {
    std::string gdb = fake_gdb("hooked-gdb", "exec sleep 10");
    std::string session_path = temp_path("hooked.log");

    auto started = attach_debugger(gdb, 1, "/tmp/h.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();

    SamplerHooks hooks = SamplerHooks::for_debugger(debugger);
    auto exited = hooks.debugger_exited();
    ASSERT_TRUE(exited.isOk());
    EXPECT_FALSE(exited.getOkRef());

    ASSERT_TRUE(hooks.terminate_debugger().isOk());
    auto status = wait_debugger(debugger);
    ASSERT_TRUE(status.isOk());
    EXPECT_TRUE(WIFSIGNALED(status.getOkRef()));
    EXPECT_EQ(WTERMSIG(status.getOkRef()), SIGTERM);

    unlink(session_path.c_str());
    unlink(gdb.c_str());
}

TEST(DebuggerTest, ExitProbeDoesNotReap) {
    std::string gdb = fake_gdb("exiting-gdb", "exit 3");
    std::string session_path = temp_path("exit.log");

    auto started = attach_debugger(gdb, 1, "/tmp/e.gdb", session_path);
    ASSERT_TRUE(started.isOk()) << started.getErrRef();
    Debugger debugger = std::move(started).getOkRef();

    ASSERT_TRUE(wait_until_exited(debugger));
    EXPECT_FALSE(debugger.reaped);

    // The status is still there for the one wait.
    auto status = wait_debugger(debugger);
    ASSERT_TRUE(status.isOk());
    EXPECT_TRUE(WIFEXITED(status.getOkRef()));
    EXPECT_EQ(WEXITSTATUS(status.getOkRef()), 3);
    EXPECT_TRUE(debugger.reaped);

    auto exited = debugger_has_exited(debugger);
    ASSERT_TRUE(exited.isOk());
    EXPECT_TRUE(exited.getOkRef());

    EXPECT_FALSE(wait_debugger(debugger).isOk());

    unlink(session_path.c_str());
    unlink(gdb.c_str());
}

TEST(DebuggerTest, MissingDebuggerIsStartupFailure) {
    auto started = attach_debugger("/nonexistent/gdb", 1, "/tmp/m.gdb", temp_path("missing.log"));
    ASSERT_FALSE(started.isOk());
    EXPECT_NE(started.getErrRef().find("execvp(/nonexistent/gdb)"), std::string::npos);

    unlink(temp_path("missing.log").c_str());
}

TEST(DebuggerTest, UnwritableSessionFileIsStartupFailure) {
    auto started = attach_debugger("echo", 1, "/tmp/u.gdb", "/nonexistent-dir/session.log");
    ASSERT_FALSE(started.isOk());
    EXPECT_NE(started.getErrRef().find("/nonexistent-dir/session.log"), std::string::npos);
}

TEST(ProcessTest, DescribeWaitStatus) {
    pid_t pid = fork();
    if (pid == 0) {
        _exit(7);
    }
    ASSERT_GT(pid, 0);
    auto status = wait_process(pid);
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(describe_wait_status(status.getOkRef()), "exit code 7");
}
