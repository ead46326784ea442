/**
 * @file process_runner_test.cpp
 * @brief Unit tests for child process execution
 *
 * @see include/pacs/forward/integration/process_runner.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pacs/forward/integration/process_runner.h"

#include "utils/test_helpers.h"

#include <chrono>

namespace pacs::forward::integration {
namespace {

using namespace ::testing;
using namespace pacs::forward::test;

class ProcessRunnerTest : public pacs_forward_test {};

TEST_F(ProcessRunnerTest, ErrorCodesInAllocatedRange) {
    EXPECT_EQ(to_error_code(process_error::executable_not_found), -980);
    EXPECT_EQ(to_error_code(process_error::abnormal_exit), -984);
}

TEST_F(ProcessRunnerTest, FindExecutableOnPath) {
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute() || sh->has_parent_path());

    EXPECT_FALSE(find_executable("pacs_forward_no_such_tool").has_value());
    EXPECT_FALSE(find_executable("").has_value());
}

TEST_F(ProcessRunnerTest, FindExecutableWithPath) {
    auto script = root() / "tool.sh";
    write_file(script, "#!/bin/sh\nexit 0\n");
    EXPECT_FALSE(find_executable(script.string()).has_value());

    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    EXPECT_TRUE(find_executable(script.string()).has_value());
}

TEST_F(ProcessRunnerTest, RunCommandReportsExitStatus) {
    auto success = run_command({"true"});
    ASSERT_TRUE(success.has_value());
    EXPECT_EQ(*success, 0);

    auto failure = run_command({"false"});
    ASSERT_TRUE(failure.has_value());
    EXPECT_NE(*failure, 0);

    auto code = run_command({"sh", "-c", "exit 60"});
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 60);
}

TEST_F(ProcessRunnerTest, RunCommandPassesArguments) {
    auto out = root() / "out.txt";
    auto status = run_command({"sh", "-c", "printf '%s' \"$1\" > \"$2\"", "sh",
                               "hello world", out.string()});
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 0);
    EXPECT_EQ(read_file(out), "hello world");
}

TEST_F(ProcessRunnerTest, MissingExecutableFails) {
    auto result = run_command({"pacs_forward_no_such_tool"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), process_error::executable_not_found);

    auto empty = run_command({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), process_error::spawn_failed);
}

TEST_F(ProcessRunnerTest, SpawnAndKillLongRunningChild) {
    auto child = spawn_command({"sleep", "30"});
    ASSERT_TRUE(child.has_value());
    EXPECT_TRUE(child->valid());
    EXPECT_TRUE(child->running());

    auto killed = child->kill();
    EXPECT_TRUE(killed.has_value());
    EXPECT_FALSE(child->valid());
    EXPECT_FALSE(child->running());
}

TEST_F(ProcessRunnerTest, WaitReturnsExitStatus) {
    auto child = spawn_command({"sh", "-c", "exit 3"});
    ASSERT_TRUE(child.has_value());

    auto status = child->wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 3);
    EXPECT_FALSE(child->valid());
}

TEST_F(ProcessRunnerTest, MovedHandleOwnsProcess) {
    auto spawned = spawn_command({"sleep", "30"});
    ASSERT_TRUE(spawned.has_value());

    child_process moved = std::move(*spawned);
    EXPECT_FALSE(spawned->valid());
    EXPECT_TRUE(moved.valid());
    EXPECT_TRUE(moved.kill().has_value());
}

}  // namespace
}  // namespace pacs::forward::integration
