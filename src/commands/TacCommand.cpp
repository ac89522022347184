/**
 * @file TacCommand.cpp
 * @brief Prints lines of a file last to first, like tac(1).
 */

#include "TacCommand.hpp"

REGISTER_COMMAND(TacCommand);

TacCommand::TacCommand(bool reg) : ReaderCommand(reg, "tac", "print lines of a file in reverse order") {
    m_parser.add_argument("-n", "--lines")
        .scan<'i', int>()
        .help("stop after this many lines [default: all]");
}

void TacCommand::process(ReversedLinesReader& reader) {
    auto limit = m_parser.present<int>("--lines");
    if( limit && *limit < 0 ){
        throw std::invalid_argument(fmt::format("line count < 0: {}", *limit));
    }

    uint64_t nlines = 0;
    while( !limit || nlines < (uint64_t)*limit ){
        auto line = reader.read_line();
        if( !line ){
            break;
        }
        fmt::print("{}\n", *line);
        nlines++;
    }
    logger->debug("{} lines printed", nlines);
}
