#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/BlockReader.hpp"
#include "io/ByteSource.hpp"
#include "text/Charset.hpp"

struct DecodedLine {
    std::string text;             // UTF-8
    off_t offset = 0;             // file offset of the first byte of the line
    size_t byte_length = 0;       // encoded length, without terminator
    size_t terminator_length = 0; // terminator that follows the line in the file, 0 if none
};

// reads lines of a file from the last one to the first one, block by block
//
// not thread-safe, a single reader is a sequential stateful scan
class ReversedLinesReader {
    public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 4096;

    enum class State {
        Scanning,                   // earlier blocks remain
        ExhaustedPendingFinalLine,  // first block of the file is in the window
        Exhausted,                  // everything is returned
        Failed,                     // read_line() threw, only seek() or close() are allowed
        Closed,
    };

    class StateError : public std::logic_error {
        public:
        explicit StateError(const std::string& msg) : std::logic_error(msg) {}
    };

    ReversedLinesReader(const std::filesystem::path& fname, const std::string& charset,
            size_t block_size = DEFAULT_BLOCK_SIZE, bool mapped = false);
    ReversedLinesReader(std::unique_ptr<ByteSource> source, const std::string& charset,
            size_t block_size = DEFAULT_BLOCK_SIZE);
    ~ReversedLinesReader();

    ReversedLinesReader(const ReversedLinesReader&) = delete;
    ReversedLinesReader& operator=(const ReversedLinesReader&) = delete;

    // next line in reverse order, std::nullopt at the start of the file
    std::optional<std::string> read_line();
    std::optional<DecodedLine> next_line();

    // up to count lines in reverse order
    std::vector<std::string> read_lines(int count);

    // last count lines in file order, each followed by '\n'
    std::string to_string(int count);

    // continue as if the file ended at offset; an offset at the start of a line
    // includes that whole line, an offset inside a line cuts it there
    void seek(off_t offset);

    // boundary between returned and not yet returned bytes, the seek offset until the next line is returned
    off_t get_file_pointer() const { return m_seek_pointer ? *m_seek_pointer : m_window_offset + (off_t)m_cursor; }

    void close();

    State state() const { return m_state; }
    const Charset& charset() const { return m_charset; }
    size_t block_size() const { return m_blocks.block_size(); }
    size_t size() const { return m_source->size(); }

    private:
    std::optional<DecodedLine> scan_window();
    DecodedLine final_line();
    void pull_block();
    size_t terminator_at(int64_t pos) const;
    DecodedLine take_line(size_t start, size_t end, size_t terminator_length);
    void reset(off_t end);
    off_t line_end(off_t offset);
    void check_usable() const;

    Charset m_charset;
    std::unique_ptr<ByteSource> m_source;
    BlockReader m_blocks;
    const size_t m_guard;

    State m_state = State::Scanning;
    buf_t m_window;                   // current block followed by the trailing fragment, in file order
    off_t m_window_offset = 0;        // file offset of m_window[0]
    size_t m_cursor = 0;              // [0, m_cursor) of the window is not returned yet
    int64_t m_scan_pos = -1;          // next window position to check for the last byte of a terminator
    size_t m_pending_terminator = 0;  // terminator following [0, m_cursor)
    uint64_t m_next_block = 0;
    bool m_first_piece_seen = false;  // the piece after the last terminator is dropped if empty
    std::optional<off_t> m_seek_pointer;
    bool m_seek_pending = false;      // the end set by seek() may still move to the end of its line
};
