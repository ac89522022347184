#pragma once
#include <filesystem>
#include <functional>
#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/common.hpp"
#include "scanning/ReversedLinesReader.hpp"

using testing::HasSubstr;
using testing::ElementsAre;

// per-process scratch directory, created on first use
std::filesystem::path temp_path(const std::string& name);

// writes data to temp_path(name) and returns the full path
std::filesystem::path write_temp_file(const std::string& name, const std::string& data);
std::filesystem::path write_temp_file(const std::string& name, const buf_t& data);

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);

// reads until read_line() returns std::nullopt
std::vector<std::string> read_all(ReversedLinesReader& reader);

// in-memory reader over str
std::unique_ptr<ReversedLinesReader> memory_reader(const std::string& str, size_t block_size = ReversedLinesReader::DEFAULT_BLOCK_SIZE,
        const std::string& charset = "UTF-8");

// std::filesystem::path is not convertible to std::string on windows, so we need these
typedef std::variant<std::string, std::filesystem::path, const char*> VPathOrStr;
std::vector<std::string> vpath2vstr(const std::initializer_list<VPathOrStr>& vpaths);

template <typename TCmd>
class CmdTestBase : public ::testing::Test {
    protected:

    // parses args (args[0] is the program name) and runs the command, returns its stdout
    std::string run_cmd(const std::initializer_list<VPathOrStr>& args, int expected_code = 0) {
        TCmd cmd;
        std::vector<std::string> vargs = vpath2vstr(args);
        logger->set_arguments(vargs);
        cmd.parser().parse_args(vargs);
        int code = -1;
        std::string out = capture_stdout([&]{ code = cmd.run(); });
        EXPECT_EQ(expected_code, code);
        return out;
    }
};
