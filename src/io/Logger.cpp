/**
 * @file Logger.cpp
 * @brief Logger wrapper around spdlog.
 *
 * Console output goes to a colored stderr sink, stdout is left to the commands. An optional
 * file sink collects everything from DEBUG up, independently of the console
 * verbosity.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <fmt/ranges.h> // fmt::join()
#include <algorithm>
#include <fstream>

/**
 * @brief Maps -v/-q counter to spdlog levels.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 */
void Logger::set_verbosity(int verbosity){
    static const level levels[] = { level::off, level::critical, level::err, level::warn, level::info, level::debug, level::trace };

    int idx = std::clamp(verbosity + 4, 0, (int)(sizeof(levels)/sizeof(levels[0])) - 1);
    m_logger->set_level(levels[idx]);
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a shell escape, only makes the logged command line readable
static std::string quote_if_needed(const std::string& arg) {
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds a file sink.
 *
 * The file is opened for appending, a blank line separates sessions. If the
 * current level is above DEBUG, it is moved to the console sink and the file
 * sink gets DEBUG.
 *
 * @param fname Log file.
 * @return False if a file sink is already present or the file can't be opened.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2);
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    if( m_logger->level() != level::debug && m_logger->level() != level::trace ){
        file_sink->set_level(level::debug);
        set_console_level(m_logger->level());
        m_logger->set_level(level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("{}", m_banner);
    }

    std::vector<std::string> quoted;
    quoted.reserve(m_arguments.size());
    for( const auto& arg : m_arguments ){
        quoted.push_back(quote_if_needed(arg));
    }
    m_logger->debug("started as {}", fmt::join(quoted, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

// the first sink is always the console one
void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl);
}

Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
