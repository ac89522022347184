#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include "io/Logger.hpp"
#include "test_utils.hpp"

#include <fstream>
#include <sstream>

class LoggerTest : public ::testing::Test {
    protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(m_out);
        sink->set_pattern("%l %v");
        m_logger = std::make_unique<Logger>(std::make_shared<spdlog::logger>("logger_test", sink));
    }

    std::vector<std::string> lines() const {
        return split(m_out.str(), '\n');
    }

    std::ostringstream m_out;
    std::unique_ptr<Logger> m_logger;
};

TEST_F(LoggerTest, verbosity) {
    m_logger->set_verbosity(0);
    m_logger->debug("hidden");
    m_logger->info("shown {}", 1);

    m_logger->set_verbosity(1);
    m_logger->debug("shown {}", 2);
    m_logger->trace("hidden");

    m_logger->set_verbosity(-4);
    m_logger->critical("hidden");

    EXPECT_THAT(lines(), ElementsAre("info shown 1", "debug shown 2"));
}

TEST_F(LoggerTest, dedup) {
    m_logger->set_dedup_limit(2);
    for (int i = 0; i < 5; i++) {
        m_logger->warn("bad block {}", i);
    }
    m_logger->error("other");

    EXPECT_THAT(lines(), ElementsAre(
        "warning bad block 0",
        "warning bad block 1",
        "warning bad block 2 [repeated 2 times. suppressing]",
        "error other"));
}

TEST_F(LoggerTest, no_dedup_limit) {
    m_logger->set_dedup_limit(0);
    for (int i = 0; i < 5; i++) {
        m_logger->warn("bad block {}", i);
    }
    EXPECT_EQ(5, lines().size());
}

TEST_F(LoggerTest, console_level_guard) {
    m_logger->set_verbosity(0);
    {
        Logger::ConsoleLevelGuard guard(*m_logger, Logger::level::critical);
        m_logger->info("hidden");
    }
    m_logger->info("shown");
    EXPECT_THAT(lines(), ElementsAre("info shown"));
}

TEST_F(LoggerTest, add_file) {
    fs::path fname = temp_path("logger_test.log");
    fs::remove(fname);

    m_logger->set_verbosity(0);
    ASSERT_TRUE(m_logger->add_file(fname));
    EXPECT_FALSE(m_logger->add_file(temp_path("second.log")));
    EXPECT_EQ(fname, m_logger->file());

    m_logger->debug("to file only");
    m_logger->info("to both");

    EXPECT_THAT(lines(), ElementsAre("info to both"));

    m_logger.reset();

    std::ifstream file(fname);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_THAT(contents.str(), HasSubstr("to file only"));
    EXPECT_THAT(contents.str(), HasSubstr("to both"));
}
