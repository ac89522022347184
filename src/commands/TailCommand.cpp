/**
 * @file TailCommand.cpp
 * @brief Prints the last N lines of a file without reading it from the start.
 *
 * Plain output is in file order, one line per output line. With --json the
 * lines are printed in the order they were read (last line first) together
 * with their byte positions:
 *
 *   [{"offset": 10, "length": 4, "terminator": 1, "text": "CCCC"}, ...]
 */

#include "TailCommand.hpp"

#include <nlohmann/json.hpp>

REGISTER_COMMAND(TailCommand);

TailCommand::TailCommand(bool reg) : ReaderCommand(reg, TAIL_CMD_NAME, "print the last lines of a file") {
    m_parser.add_argument("-n", "--lines")
        .default_value(10)
        .scan<'i', int>()
        .help("number of lines");
    m_parser.add_argument("--json")
        .implicit_value(true)
        .default_value(false)
        .help("print lines with their offsets as a JSON array, last line first");
}

void TailCommand::process(ReversedLinesReader& reader) {
    const int nlines = m_parser.get<int>("--lines");

    if( !m_parser.get<bool>("--json") ){
        fmt::print("{}", reader.to_string(nlines));
        return;
    }

    if( nlines < 0 ){
        throw std::invalid_argument(fmt::format("line count < 0: {}", nlines));
    }

    nlohmann::ordered_json result = nlohmann::ordered_json::array();
    for( int i = 0; i < nlines; i++ ){
        auto line = reader.next_line();
        if( !line ){
            break;
        }
        result.push_back({
            {"offset", line->offset},
            {"length", line->byte_length},
            {"terminator", line->terminator_length},
            {"text", line->text},
        });
    }
    fmt::print("{}\n", result.dump(2));
}
