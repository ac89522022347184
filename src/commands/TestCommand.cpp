/**
 * @file TestCommand.cpp
 * @brief Self-test: platform type sizes and an in-memory reverse reading round trip.
 *
 * Runs implicitly (and silently) before every other command, and explicitly
 * as "revlines test" with full trace output.
 */

#include "TestCommand.hpp"
#include "io/MemoryReader.hpp"
#include "scanning/ReversedLinesReader.hpp"

#include <algorithm>

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

// off_t must be 64-bit for pread() past 4Gb, larger files are rejected by Reader where size_t is narrower
static bool check_type_sizes() {
    logger->trace("selftest: sizeof(int)       = {}", sizeof(int));
    logger->trace("selftest: sizeof(off_t)     = {}", sizeof(off_t));
    logger->trace("selftest: sizeof(size_t)    = {}", sizeof(size_t));
    logger->trace("selftest: sizeof(ssize_t)   = {}", sizeof(ssize_t));
    logger->trace("selftest: sizeof(uint64_t)  = {}", sizeof(uint64_t));

    if( sizeof(off_t) != 8 ){
        logger->critical("selftest: sizeof(off_t) != 8");
        return false;
    }

    return true;
}

// encodes the lines joined by mixed terminators and reads them back for every block size
static bool check_round_trip(const std::string& charset_name) {
    static const std::vector<std::string> lines {
        "first line",
        "",
        "ÄäÜüÖöß ©µ¥£",
        "CRLF follows",
        "明輸子京",
        "last",
    };
    static const std::vector<std::string> terminators { "\n", "\r\n", "\r", "\r\n", "\n" };

    Charset charset(charset_name);

    // characters the charset can't represent are left out
    std::vector<std::string> expected;
    buf_t data;
    for( size_t i = 0; i < lines.size(); i++ ){
        buf_t encoded;
        try {
            encoded = charset.encode(lines[i]);
        } catch( const Charset::DecodeError& ){
            logger->trace("selftest: {}: no mapping for line {}, skipped", charset.name(), i);
            continue;
        }
        if( !data.empty() ){
            buf_t term = charset.encode(terminators[expected.size() % terminators.size()]);
            data.insert(data.end(), term.begin(), term.end());
        }
        data.insert(data.end(), encoded.begin(), encoded.end());
        expected.push_back(lines[i]);
    }
    std::reverse(expected.begin(), expected.end());

    for( size_t block_size : { (size_t)charset.max_char_size(), (size_t)3 * charset.max_char_size(), (size_t)7, data.size(), ReversedLinesReader::DEFAULT_BLOCK_SIZE } ){
        if( block_size < (size_t)charset.max_char_size() ){
            continue;
        }
        ReversedLinesReader reader(std::make_unique<MemoryReader>(data, "selftest"), charset_name, block_size);
        std::vector<std::string> got = reader.read_lines((int)lines.size() + 1);
        if( got != expected ){
            logger->critical("selftest: {} block size {}: got {} lines, expected {}", charset.name(), block_size, got.size(), expected.size());
            return false;
        }
        if( reader.get_file_pointer() != 0 || reader.state() != ReversedLinesReader::State::Exhausted ){
            logger->critical("selftest: {} block size {}: reader not exhausted", charset.name(), block_size);
            return false;
        }
    }
    logger->trace("selftest: {}: {} lines, {} bytes OK", charset.name(), expected.size(), data.size());
    return true;
}

// "\r" ends the first block and "\n" starts the second one
static bool check_split_crlf() {
    ReversedLinesReader reader(std::make_unique<MemoryReader>(std::string("abc\r\nxyz")), "UTF-8", 4);
    std::vector<std::string> got = reader.read_lines(3);
    if( got != std::vector<std::string>{ "xyz", "abc" } ){
        logger->critical("selftest: CRLF split between blocks is not recognized, got {} lines", got.size());
        return false;
    }
    return true;
}

// seek to the first byte of a line returns that line first
static bool check_seek_to_line_start() {
    ReversedLinesReader reader(std::make_unique<MemoryReader>(std::string("AAAA\nBBBB\nCCCC\n"), "selftest"), "UTF-8");
    reader.seek(10);
    const off_t fp = reader.get_file_pointer();
    std::optional<std::string> line = reader.read_line();
    if( fp != 10 || line != "CCCC" ){
        logger->critical("selftest: seek(10): file pointer {}, first line \"{}\"", fp, line.value_or("<none>"));
        return false;
    }
    return true;
}

/**
 * @brief Runs all self-tests.
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    if( !check_type_sizes() ){
        return 1;
    }

    try {
        for( const char* charset : { "UTF-8", "ISO-8859-1", "UTF-16LE", "UTF-16BE", "UTF-32BE", "Shift_JIS", "GBK" } ){
            if( !check_round_trip(charset) ){
                return 1;
            }
        }
        if( !check_split_crlf() || !check_seek_to_line_start() ){
            return 1;
        }
    } catch( const std::exception& e ){
        logger->critical("selftest: {}", e.what());
        return 1;
    }

    logger->trace("selftest: OK");
    return 0;
}
