/* test_process.cpp - tests for the Poco process launcher against real /bin/sh children, and the controller on top of it
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "process.h"
#include "speech_controller.h"
#include "speech_script.h"

// =============================================================================
// COMMAND WRAPPING
// =============================================================================

TEST(ProcessCommand, PlainCommandIsUntouched) {
    std::string command;
    std::vector<std::string> args;
    wrap_process_command("say", {"-v", "Alex", "hi"}, process_launch_options(), command, args);
    EXPECT_EQ(command, "say");
    EXPECT_EQ(args, std::vector<std::string>({"-v", "Alex", "hi"}));
}

TEST(ProcessCommand, DroppedProcessTerminationMatchesLaunch) {
    process_launch_options plain;
    EXPECT_EQ(default_termination_mode(plain), TERMINATE_PROCESS);
    process_launch_options grouped;
    grouped.new_process_group = true;
    EXPECT_EQ(default_termination_mode(grouped), TERMINATE_PROCESS_GROUP);
    process_launch_options shell;
    shell.shell = true;
#ifdef _WIN32
    EXPECT_EQ(default_termination_mode(shell), TERMINATE_PROCESS_TREE);
#else
    EXPECT_EQ(default_termination_mode(shell), TERMINATE_PROCESS);
#endif
}

#ifdef _WIN32

TEST(ProcessCommand, WindowsShellJoinsPowershellScriptUnquoted) {
    platform_profile ps = select_platform_profile(SAYX_PLATFORM_WIN32);
    speech_invocation inv = build_speak_invocation(ps, "hello", "", 0);
    std::string command;
    std::vector<std::string> args;
    wrap_process_command(inv.command, inv.args, inv.options, command, args);
    EXPECT_EQ(command, "cmd.exe");
    EXPECT_EQ(args, std::vector<std::string>({"/d", "/s", "/c", std::string("powershell ") + g_powershell_speech_script}));
}

#else

TEST(ProcessCommand, ShellWrapsQuotedCommandLine) {
    process_launch_options options;
    options.shell = true;
    std::string command;
    std::vector<std::string> args;
    wrap_process_command("powershell", {"a b; it's"}, options, command, args);
    EXPECT_EQ(command, "/bin/sh");
    EXPECT_EQ(args, std::vector<std::string>({"-c", "powershell 'a b; it'\\''s'"}));
}

TEST(ProcessCommand, ProcessGroupRunsThroughSetsid) {
    process_launch_options options;
    options.new_process_group = true;
    std::string command;
    std::vector<std::string> args;
    wrap_process_command("festival", {"--pipe"}, options, command, args);
    EXPECT_EQ(command, "setsid");
    EXPECT_EQ(args, std::vector<std::string>({"festival", "--pipe"}));
}

TEST(ProcessCommand, DecodesSignalledExit) {
    process_exit normal = decode_exit_code(3);
    EXPECT_TRUE(normal.has_code);
    EXPECT_EQ(normal.code, 3);
    process_exit killed = decode_exit_code(256 + 15);
    EXPECT_FALSE(killed.has_code);
    EXPECT_EQ(killed.signal, 15);
    EXPECT_FALSE(killed.succeeded());
    EXPECT_TRUE(decode_exit_code(0).succeeded());
}

// =============================================================================
// REAL CHILDREN
// =============================================================================

class ProcessTest : public ::testing::Test {
protected:
    std::shared_ptr<event_loop> loop = std::make_shared<event_loop>();
    system_process_launcher launcher{loop};
    std::vector<std::string> stderr_chunks;
    std::vector<process_exit> exits;

    process_events record() {
        process_events events;
        events.on_stderr = [this](const std::string& data) { stderr_chunks.push_back(data); };
        events.on_exit = [this](const process_exit& exit) { exits.push_back(exit); };
        return events;
    }

    std::shared_ptr<child_process> shell(const std::string& script, const process_launch_options& options = process_launch_options()) {
        return launcher.launch("/bin/sh", {"-c", script}, options, record());
    }
};

TEST_F(ProcessTest, ReportsExitCode) {
    auto child = shell("exit 3");
    EXPECT_GT(child->pid(), 0);
    loop->run();
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_TRUE(exits[0].has_code);
    EXPECT_EQ(exits[0].code, 3);
    EXPECT_TRUE(stderr_chunks.empty());
}

TEST_F(ProcessTest, ReleasesLoopOnceChildExits) {
    auto child = shell("exit 0");
    EXPECT_TRUE(loop->has_work());
    loop->run();
    EXPECT_FALSE(loop->has_work());
    ASSERT_EQ(exits.size(), 1u);
}

TEST_F(ProcessTest, ReportsFirstStderrChunkBeforeExit) {
    auto child = shell("echo oops >&2");
    loop->run();
    ASSERT_EQ(stderr_chunks.size(), 1u);
    EXPECT_EQ(stderr_chunks[0], "oops\n");
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_TRUE(exits[0].succeeded());
}

TEST_F(ProcessTest, PipesInputToChild) {
    auto child = shell("read line; test \"$line\" = hello");
    child->write_input("hello\n");
    child->close_input();
    loop->run();
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_TRUE(exits[0].succeeded());
}

TEST_F(ProcessTest, TerminateSignalsChild) {
    auto child = shell("exec sleep 30");
    child->terminate(TERMINATE_PROCESS);
    loop->run();
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_FALSE(exits[0].has_code);
    EXPECT_EQ(exits[0].signal, 15);
}

TEST_F(ProcessTest, TerminateGroupReachesGrandchildren) {
    process_launch_options options;
    options.new_process_group = true;
    // The backgrounded sleep holds stderr open, so the exit only arrives once the whole group is gone.
    auto child = shell("sleep 30 & echo started >&2; wait", options);
    while (stderr_chunks.empty()) loop->run_one(50);
    child->terminate(TERMINATE_PROCESS_GROUP);
    loop->run();
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_FALSE(exits[0].succeeded());
}

// =============================================================================
// CONTROLLER END TO END
// =============================================================================

TEST(SpeechControllerProcess, RunsConfiguredCommand) {
    auto loop = std::make_shared<event_loop>();
    speech_options opts;
    opts.platform = SAYX_PLATFORM_LINUX;
    opts.commands[SAYX_PLATFORM_LINUX] = "true";
    auto say = create_speech_controller(loop, opts);
    std::vector<speech_status> results;
    say->speak("hello", "", 0, [&](const speech_status& s) { results.push_back(s); });
    EXPECT_TRUE(say->is_speaking());
    loop->run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok()) << results[0].to_string();
    EXPECT_FALSE(say->is_speaking());
}

TEST(SpeechControllerProcess, FailingCommandReportsExitCode) {
    auto loop = std::make_shared<event_loop>();
    speech_options opts;
    opts.platform = SAYX_PLATFORM_LINUX;
    opts.commands[SAYX_PLATFORM_LINUX] = "false";
    auto say = create_speech_controller(loop, opts);
    std::vector<speech_status> results;
    say->speak("hello", "", 0, [&](const speech_status& s) { results.push_back(s); });
    loop->run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].code, SPEECH_PROCESS_FAILED);
    EXPECT_EQ(results[0].exit_code, 1);
}

TEST(SpeechControllerProcess, StopEndsSpeech) {
    auto loop = std::make_shared<event_loop>();
    speech_options opts;
    opts.platform = SAYX_PLATFORM_MACOS;
    opts.commands[SAYX_PLATFORM_MACOS] = "sleep";
    auto say = create_speech_controller(loop, opts);
    std::vector<speech_status> speak_results, stop_results;
    say->speak("30", "", 0, [&](const speech_status& s) { speak_results.push_back(s); });
    say->stop([&](const speech_status& s) { stop_results.push_back(s); });
    EXPECT_FALSE(say->is_speaking());
    loop->run();
    ASSERT_EQ(stop_results.size(), 1u);
    EXPECT_TRUE(stop_results[0].ok());
    ASSERT_EQ(speak_results.size(), 1u);
    EXPECT_EQ(speak_results[0].code, SPEECH_PROCESS_FAILED);
    EXPECT_EQ(speak_results[0].signal, 15);
}

#endif
