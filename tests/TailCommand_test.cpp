#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "commands/TailCommand.hpp"
#include "test_utils.hpp"

class TailCommandTest : public CmdTestBase<TailCommand> {
    protected:
    void SetUp() override {
        fname = write_temp_file("tail.txt", std::string("AAAA\nBBBB\r\nCCCC\nDDDD\n"));
    }

    fs::path fname;
};

TEST_F(TailCommandTest, registers_itself) {
    ASSERT_NE(Command::find(TAIL_CMD_NAME), nullptr);
}

TEST_F(TailCommandTest, default_count) {
    EXPECT_EQ("AAAA\nBBBB\nCCCC\nDDDD\n", run_cmd({"tail", fname}));
}

TEST_F(TailCommandTest, last_lines_in_file_order) {
    EXPECT_EQ("CCCC\nDDDD\n", run_cmd({"tail", fname, "-n", "2"}));
}

TEST_F(TailCommandTest, small_blocks) {
    EXPECT_EQ("BBBB\nCCCC\nDDDD\n", run_cmd({"tail", fname, "-n", "3", "-b", "3"}));
}

TEST_F(TailCommandTest, mmap) {
    EXPECT_EQ("DDDD\n", run_cmd({"tail", fname, "-n", "1", "--mmap"}));
}

TEST_F(TailCommandTest, offset) {
    EXPECT_EQ("AAAA\nBBBB\n", run_cmd({"tail", fname, "--offset", "9"}));
    EXPECT_EQ("AAAA\nBBBB\nCCCC\n", run_cmd({"tail", fname, "--offset", "11"}));
}

TEST_F(TailCommandTest, json) {
    auto out = run_cmd({"tail", fname, "-n", "2", "--json"});
    auto json = nlohmann::json::parse(out);

    ASSERT_EQ(2, json.size());
    EXPECT_EQ("DDDD", json[0]["text"]);
    EXPECT_EQ(16, json[0]["offset"]);
    EXPECT_EQ(4, json[0]["length"]);
    EXPECT_EQ(1, json[0]["terminator"]);

    EXPECT_EQ("CCCC", json[1]["text"]);
    EXPECT_EQ(11, json[1]["offset"]);
}

TEST_F(TailCommandTest, utf16) {
    Charset charset("UTF-16BE");
    fs::path utf16 = write_temp_file("tail_utf16.txt", charset.encode("first\r\nsecond ÄÖÜ\r\n"));
    EXPECT_EQ("second ÄÖÜ\n", run_cmd({"tail", utf16, "-n", "1", "--charset", "UTF-16BE", "-b", "5"}));
}

TEST_F(TailCommandTest, missing_file) {
    run_cmd({"tail", "no/such/file"}, 1);
}

TEST_F(TailCommandTest, unsupported_charset) {
    EXPECT_EQ("", run_cmd({"tail", fname, "--charset", "ISO-2022-JP"}, 1));
}

TEST_F(TailCommandTest, invalid_block_size) {
    run_cmd({"tail", fname, "-b", "0"}, 1);
    run_cmd({"tail", fname, "-b", "4x"}, 1);
}

TEST_F(TailCommandTest, offset_past_end) {
    run_cmd({"tail", fname, "--offset", "1000"}, 1);
}

TEST_F(TailCommandTest, negative_count) {
    run_cmd({"tail", fname, "-n", "-1"}, 1);
    run_cmd({"tail", fname, "-n", "-1", "--json"}, 1);
}

TEST_F(TailCommandTest, invalid_utf8) {
    fs::path bad = write_temp_file("tail_bad.txt", std::string("good\n\xff\xfe\n"));
    EXPECT_EQ("", run_cmd({"tail", bad}, 1));
}
