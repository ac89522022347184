/**
 * @file ReaderCommand.cpp
 * @brief Options and error reporting shared by the tail and tac commands.
 */

#include "ReaderCommand.hpp"

#include <cstdio>

ReaderCommand::ReaderCommand(bool reg, const char* name, const char* description) : Command(reg, name, description) {
    m_parser.add_argument("filename").help("file to read");
    m_parser.add_argument("-c", "--charset")
        .default_value(std::string("UTF-8"))
        .help("file charset, any ICU name or alias");
    m_parser.add_argument("-b", "--block-size")
        .default_value(std::to_string(ReversedLinesReader::DEFAULT_BLOCK_SIZE))
        .help("read block size, like 4096, 0x1000 or 4k");
    m_parser.add_argument("--offset")
        .scan<'i', int64_t>()
        .help("read backwards from this byte offset instead of the end of file");
    m_parser.add_argument("--mmap")
        .implicit_value(true)
        .default_value(false)
        .help("memory map the file instead of pread()");
}

/**
 * @brief Opens the file named on the command line.
 *
 * @throws Charset::UnsupportedError, std::invalid_argument, std::runtime_error
 */
std::unique_ptr<ReversedLinesReader> ReaderCommand::open_reader() {
    const fs::path fname = m_parser.get<std::string>("filename");
    const std::string charset = m_parser.get<std::string>("--charset");
    const uint64_t block_size = human2bytes(m_parser.get<std::string>("--block-size"));

    auto reader = std::make_unique<ReversedLinesReader>(fname, charset, block_size, m_parser.get<bool>("--mmap"));
    if( auto offset = m_parser.present<int64_t>("--offset") ){
        reader->seek(*offset);
    }
    logger->debug("{}: {}, block size {}, reading backwards from {:#x}", fname, bytes2human(reader->size(), " bytes"),
            bytes2human(block_size, " bytes"), reader->get_file_pointer());
    return reader;
}

/**
 * @brief Opens the reader and runs the command.
 *
 * @return 0 on success, 1 on any error. The error is logged.
 */
int ReaderCommand::run() {
    try {
        auto reader = open_reader();
        process(*reader);
        reader->close();
    } catch( const Charset::UnsupportedError& e ){
        logger->critical("{}", e.what());
        return 1;
    } catch( const std::exception& e ){
        logger->error("{}: {}", m_parser.get<std::string>("filename"), e.what());
        return 1;
    }
    std::fflush(stdout);
    return 0;
}
