#pragma once
#include <cstdint>
#include <sys/types.h>

#include "ByteSource.hpp"

// splits [0, end) of a ByteSource into block_size chunks and hands them out by index
// counted from the end
//
// blocks are aligned to the start of the file, not to end: block 0 is the short one,
// [(n-1) * block_size, end), and seek() never moves a block boundary. Slicing from the
// end, [max(0, end - (k+1) * block_size), end - k * block_size), would give the same
// lines with the short block at the file start instead.
//
// no caching: every read_block() is a fresh positioned read
class BlockReader {
    public:
    BlockReader(ByteSource& source, size_t block_size);

    buf_t read_block(uint64_t index) const;

    // treat offset as the new end of the source
    void seek(off_t offset);

    uint64_t block_count() const { return m_block_count; }
    size_t block_size() const { return m_block_size; }
    off_t end() const { return m_end; }

    // byte range of a block, [start, end)
    off_t block_start(uint64_t index) const;
    off_t block_end(uint64_t index) const;

    private:
    ByteSource& m_source;
    const size_t m_block_size;
    off_t m_end = 0;
    uint64_t m_block_count = 0;
};
