#include <gtest/gtest.h>
#include "commands/TestCommand.hpp"
#include "test_utils.hpp"

class TestCommandTest : public CmdTestBase<TestCommand> {};

TEST_F(TestCommandTest, registers_itself) {
    ASSERT_NE(Command::find(TEST_CMD_NAME), nullptr);
}

TEST_F(TestCommandTest, passes) {
    EXPECT_EQ("", run_cmd({"test"}));
}
