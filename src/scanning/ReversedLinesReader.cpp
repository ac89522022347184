/**
 * @file ReversedLinesReader.cpp
 * @brief Reverse line scanner: returns lines of a file from the last to the first.
 *
 * The scanner keeps one window: the most recently read block followed by the
 * unconsumed head of the previous window (the trailing fragment). The window is
 * scanned backwards for CRLF, LF or CR encoded in the file charset, one
 * character step at a time. Bytes after a terminator, up to the previous cut,
 * form one line.
 *
 * While earlier blocks remain, the first bytes of the window (the guard region)
 * are not scanned: a CR at the end of the earlier block may pair with an LF at
 * the window start, and a multi byte character may straddle the boundary. The
 * next block is merged first. Positions that were already checked are never
 * checked again after a merge.
 */

#include "ReversedLinesReader.hpp"
#include "io/MappedReader.hpp"
#include "io/Reader.hpp"
#include "utils/common.hpp"

#include <algorithm>

static std::unique_ptr<ByteSource> open_source(const std::filesystem::path& fname, bool mapped) {
    if (mapped) {
        return std::make_unique<MappedReader>(fname);
    }
    return std::make_unique<Reader>(fname);
}

static std::unique_ptr<ByteSource> not_null(std::unique_ptr<ByteSource> source) {
    if (!source) {
        throw std::invalid_argument("byte source is null");
    }
    return source;
}

static size_t checked_block_size(const Charset& charset, size_t block_size) {
    if (block_size == 0 || block_size < (size_t)charset.max_char_size()) {
        throw std::invalid_argument(fmt::format("block size {} is smaller than max char size {} of {}",
                    block_size, charset.max_char_size(), charset.name()));
    }
    return block_size;
}

/**
 * @brief Opens a file for reverse line reading.
 *
 * @param fname File to read.
 * @param charset Charset name, validated before anything is read.
 * @param block_size Bytes per positioned read, at least the charset max char size.
 * @param mapped Use a memory mapping instead of pread().
 * @throws Charset::UnsupportedError, std::invalid_argument, std::runtime_error
 */
ReversedLinesReader::ReversedLinesReader(const std::filesystem::path& fname, const std::string& charset,
        size_t block_size, bool mapped) :
    ReversedLinesReader(open_source(fname, mapped), charset, block_size)
{
}

ReversedLinesReader::ReversedLinesReader(std::unique_ptr<ByteSource> source, const std::string& charset, size_t block_size) :
    m_charset(charset),
    m_source(not_null(std::move(source))),
    m_blocks(*m_source, checked_block_size(m_charset, block_size)),
    m_guard(std::max<size_t>(m_charset.crlf().size(), m_charset.max_char_size() - 1))
{
    reset(m_source->size());
    logger->debug("{}: reverse reading {} bytes, block size {}, charset {}",
            m_source->name(), m_source->size(), block_size, m_charset.name());
}

ReversedLinesReader::~ReversedLinesReader() {
    close();
}

void ReversedLinesReader::close() {
    if (m_state == State::Closed) {
        return;
    }
    m_source->close();
    m_window.clear();
    m_state = State::Closed;
}

void ReversedLinesReader::check_usable() const {
    if (m_state == State::Closed) {
        throw StateError("reader is closed");
    }
    if (m_state == State::Failed) {
        throw StateError("reader is in failed state, seek() to restart");
    }
}

void ReversedLinesReader::reset(off_t end) {
    m_blocks.seek(end);
    m_window.clear();
    m_window_offset = end;
    m_cursor = 0;
    m_scan_pos = -1;
    m_pending_terminator = 0;
    m_next_block = 0;
    m_first_piece_seen = false;
    m_state = end == 0 ? State::Exhausted : State::Scanning;
}

/**
 * @brief Restarts reverse reading as if the file ended at @p offset.
 *
 * An offset inside a line cuts that line at the offset. An offset at the start of
 * a line makes that line, with its terminator, the next one returned. The
 * position is resolved by the next read, seek() itself does no I/O.
 * get_file_pointer() returns @p offset until a line is returned.
 *
 * @throws std::invalid_argument If offset is negative.
 * @throws StateError If offset is past the size seen at open time, or the reader is closed.
 */
void ReversedLinesReader::seek(off_t offset) {
    if (m_state == State::Closed) {
        throw StateError("seek on closed reader");
    }
    if (offset < 0) {
        throw std::invalid_argument(fmt::format("seek offset < 0: {}", offset));
    }
    if ((size_t)offset > m_source->size()) {
        throw StateError(fmt::format("{}: seek offset {} is past the end of file ({})", m_source->name(), offset, m_source->size()));
    }
    reset(offset);
    m_seek_pointer = offset;
    m_seek_pending = offset > 0 && (size_t)offset < m_source->size();
    logger->debug("{}: seek to {}", m_source->name(), offset);
}

/**
 * @brief Finds where the line starting at @p offset ends.
 *
 * @return End of the line including its terminator if a terminator (or the start
 *         of the file) precedes @p offset, @p offset itself otherwise.
 * @throws ByteSource::ReadError On I/O error.
 */
off_t ReversedLinesReader::line_end(off_t offset) {
    const buf_t& lf = m_charset.lf();
    const buf_t& cr = m_charset.cr();
    const buf_t& crlf = m_charset.crlf();
    const size_t size = m_source->size();
    const size_t step = m_charset.step();
    if (offset <= 0 || (size_t)offset >= size || (size_t)offset % step != 0) {
        return offset;
    }

    const size_t before = std::min<size_t>(offset, crlf.size());
    buf_t around(before + lf.size());
    around.resize(m_source->read_at(offset - (off_t)before, around));

    const bool after_lf = before >= lf.size() && around.matches_at(before - lf.size(), lf);
    // a CR directly followed by LF is half of a CRLF, not the end of a line
    const bool after_cr = before >= cr.size() && around.matches_at(before - cr.size(), cr) && !around.matches_at(before, lf);
    if (!after_lf && !after_cr) {
        return offset;
    }

    buf_t ahead;
    for (size_t pos = 0; ; pos += step) {
        while (ahead.size() < pos + crlf.size() && (size_t)offset + ahead.size() < size) {
            buf_t chunk(std::min(block_size(), size - (size_t)offset - ahead.size()));
            const size_t nread = m_source->read_at(offset + (off_t)ahead.size(), chunk);
            if (nread != chunk.size()) {
                throw ByteSource::ReadError(fmt::format("{}: short read at {:#x}: {} of {} bytes",
                            m_source->name(), offset + (off_t)ahead.size(), nread, chunk.size()));
            }
            ahead.insert(ahead.end(), chunk.begin(), chunk.end());
        }

        if (pos >= ahead.size()) {
            return size; // last line of the file has no terminator
        }
        for (const buf_t* seq : { &crlf, &lf, &cr }) {
            if (ahead.matches_at(pos, *seq)) {
                const off_t end = offset + (off_t)(pos + seq->size());
                logger->debug("{}: seek to line start {}, reading up to {}", m_source->name(), offset, end);
                return end;
            }
        }
    }
}

// length of the terminator whose last byte is at pos, 0 if there is none
size_t ReversedLinesReader::terminator_at(int64_t pos) const {
    // CRLF must be tried first, its LF alone would match too
    for (const buf_t* seq : { &m_charset.crlf(), &m_charset.lf(), &m_charset.cr() }) {
        const int64_t start = pos + 1 - (int64_t)seq->size();
        if (start >= 0 && m_window.matches_at(start, *seq)) {
            return seq->size();
        }
    }
    return 0;
}

DecodedLine ReversedLinesReader::take_line(size_t start, size_t end, size_t terminator_length) {
    DecodedLine line;
    line.offset = m_window_offset + (off_t)start;
    line.byte_length = end - start;
    line.terminator_length = terminator_length;
    line.text = m_charset.decode(m_window.data() + start, end - start, line.offset);
    return line;
}

// finds the next terminator below the cursor, std::nullopt if more bytes are needed
std::optional<DecodedLine> ReversedLinesReader::scan_window() {
    const int64_t floor = m_state == State::Scanning ? (int64_t)m_guard : 0;
    const int64_t step = m_charset.step();

    int64_t pos = m_scan_pos;
    for (; pos >= floor; pos -= step) {
        const size_t len = terminator_at(pos);
        if (len == 0) {
            continue;
        }

        const size_t start = pos + 1;
        DecodedLine line = take_line(start, m_cursor, m_pending_terminator);
        m_cursor = start - len;
        m_pending_terminator = len;
        m_scan_pos = (int64_t)m_cursor - 1;
        return line;
    }

    m_scan_pos = pos;
    return std::nullopt;
}

// prepends the next (earlier) block to the unconsumed part of the window
void ReversedLinesReader::pull_block() {
    buf_t block = m_blocks.read_block(m_next_block);
    const size_t added = block.size();

    m_window.splice_front(block, m_cursor);
    m_window_offset = m_blocks.block_start(m_next_block);
    m_cursor += added;
    m_scan_pos += added;
    m_next_block++;

    if (m_next_block == m_blocks.block_count()) {
        m_state = State::ExhaustedPendingFinalLine;
        logger->trace("{}: first block reached, window {} bytes", m_source->name(), m_window.size());
    }
}

// no terminators left: whatever precedes the cursor is the first line of the file
DecodedLine ReversedLinesReader::final_line() {
    DecodedLine line = take_line(0, m_cursor, m_pending_terminator);
    m_first_piece_seen = true;
    m_window.clear();
    m_window_offset = 0;
    m_cursor = 0;
    m_scan_pos = -1;
    m_pending_terminator = 0;
    m_state = State::Exhausted;
    return line;
}

/**
 * @brief Returns the next line in reverse order together with its position.
 *
 * @return The line, or std::nullopt once the start of the file has been reached.
 *         Calls after that return std::nullopt without doing any I/O.
 * @throws ByteSource::ReadError On I/O error.
 * @throws Charset::DecodeError If the line is not valid in the file charset.
 * @throws StateError If the reader is closed or failed earlier.
 */
std::optional<DecodedLine> ReversedLinesReader::next_line() {
    check_usable();
    if (m_state == State::Exhausted) {
        return std::nullopt;
    }

    try {
        if (m_seek_pending) {
            m_seek_pending = false;
            const off_t end = line_end(m_blocks.end());
            if (end != m_blocks.end()) {
                reset(end);
            }
        }

        while (true) {
            std::optional<DecodedLine> line = scan_window();
            if (line) {
                if (!m_first_piece_seen) {
                    m_first_piece_seen = true;
                    if (line->byte_length == 0) {
                        continue; // file ends with a terminator
                    }
                }
                m_seek_pointer.reset();
                return line;
            }

            if (m_state == State::Scanning) {
                pull_block();
                continue;
            }
            m_seek_pointer.reset();
            return final_line();
        }
    } catch (const std::exception& e) {
        m_state = State::Failed;
        logger->debug("{}: reader failed at {}: {}", m_source->name(), get_file_pointer(), e.what());
        throw;
    }
}

std::optional<std::string> ReversedLinesReader::read_line() {
    std::optional<DecodedLine> line = next_line();
    if (!line) {
        return std::nullopt;
    }
    return std::move(line->text);
}

/**
 * @brief Reads up to @p count lines in reverse order.
 *
 * @return Fewer than count lines if the start of the file is reached first.
 * @throws std::invalid_argument If count is negative.
 */
std::vector<std::string> ReversedLinesReader::read_lines(int count) {
    if (count < 0) {
        throw std::invalid_argument(fmt::format("line count < 0: {}", count));
    }

    std::vector<std::string> lines;
    lines.reserve(std::min(count, 1024));
    for (int i = 0; i < count; i++) {
        std::optional<std::string> line = read_line();
        if (!line) {
            break;
        }
        lines.push_back(std::move(*line));
    }
    return lines;
}

/**
 * @brief Returns the last @p count lines in file order, each followed by '\n'.
 * @throws std::invalid_argument If count is negative.
 */
std::string ReversedLinesReader::to_string(int count) {
    std::vector<std::string> lines = read_lines(count);
    std::reverse(lines.begin(), lines.end());

    std::string result;
    for (const auto& line : lines) {
        result += line;
        result += '\n';
    }
    return result;
}
