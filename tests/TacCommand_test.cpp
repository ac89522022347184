#include <gtest/gtest.h>
#include "commands/TacCommand.hpp"
#include "test_utils.hpp"

class TacCommandTest : public CmdTestBase<TacCommand> {
    protected:
    void SetUp() override {
        fname = write_temp_file("tac.txt", std::string("one\ntwo\r\n\nthree"));
    }

    fs::path fname;
};

TEST_F(TacCommandTest, registers_itself) {
    ASSERT_NE(Command::find("tac"), nullptr);
}

TEST_F(TacCommandTest, all_lines) {
    EXPECT_EQ("three\n\ntwo\none\n", run_cmd({"tac", fname}));
}

TEST_F(TacCommandTest, limit) {
    EXPECT_EQ("three\n\n", run_cmd({"tac", fname, "-n", "2"}));
    EXPECT_EQ("", run_cmd({"tac", fname, "-n", "0"}));
}

TEST_F(TacCommandTest, every_block_size) {
    for (const char* block_size : { "3", "4", "7", "0x10", "4k" }) {
        EXPECT_EQ("three\n\ntwo\none\n", run_cmd({"tac", fname, "-b", block_size})) << "block size " << block_size;
    }
}

TEST_F(TacCommandTest, offset) {
    EXPECT_EQ("two\none\n", run_cmd({"tac", fname, "--offset", "7"}));
    EXPECT_EQ("\ntwo\none\n", run_cmd({"tac", fname, "--offset", "9"}));
}

TEST_F(TacCommandTest, empty_file) {
    fs::path empty = write_temp_file("tac_empty.txt", std::string());
    EXPECT_EQ("", run_cmd({"tac", empty}));
    EXPECT_EQ("", run_cmd({"tac", empty, "--mmap"}));
}

TEST_F(TacCommandTest, negative_limit) {
    run_cmd({"tac", fname, "-n", "-5"}, 1);
}
