/**
 * @file BlockReader.cpp
 * @brief Translates block indices (counted from the end) into positioned reads.
 *
 * Blocks are aligned to the start of the file so that reads line up with the
 * underlying filesystem blocks when block_size matches them. With
 * n = ceil(end / block_size), block k covers
 * [(n-1-k) * block_size, min(end, (n-k) * block_size)).
 */

#include "BlockReader.hpp"
#include "utils/common.hpp"

#include <algorithm>

/**
 * @param source Byte source to read from, must outlive the BlockReader.
 * @param block_size Block size in bytes, must be non-zero.
 * @throws std::invalid_argument If block_size is zero.
 */
BlockReader::BlockReader(ByteSource& source, size_t block_size) : m_source(source), m_block_size(block_size) {
    if (block_size == 0) {
        throw std::invalid_argument("block size must be > 0");
    }
    seek(source.size());
}

/**
 * @brief Makes @p offset the new end of the source and recomputes the block count.
 * @throws std::invalid_argument If offset is outside [0, size].
 */
void BlockReader::seek(off_t offset) {
    if (offset < 0 || (size_t)offset > m_source.size()) {
        throw std::invalid_argument(fmt::format("{}: offset {:#x} out of range [0, {:#x}]", m_source.name(), offset, m_source.size()));
    }
    m_end = offset;
    m_block_count = ((uint64_t)m_end + m_block_size - 1) / m_block_size;
}

off_t BlockReader::block_start(uint64_t index) const {
    if (index >= m_block_count) {
        throw std::out_of_range(fmt::format("block index {} >= block count {}", index, m_block_count));
    }
    return (off_t)((m_block_count - 1 - index) * m_block_size);
}

off_t BlockReader::block_end(uint64_t index) const {
    return std::min<off_t>(m_end, block_start(index) + (off_t)m_block_size);
}

/**
 * @brief Reads the block with the given index counted from the end.
 *
 * @param index 0 for the last block, block_count()-1 for the first one.
 * @return Exactly block_end(index) - block_start(index) bytes.
 * @throws std::out_of_range If index >= block_count().
 * @throws ByteSource::ReadError On I/O error, or if the source returned fewer bytes than expected.
 */
buf_t BlockReader::read_block(uint64_t index) const {
    const off_t start = block_start(index);
    const size_t length = block_end(index) - start;

    buf_t buf(length);
    size_t nread = m_source.read_at(start, buf);
    if (nread != length) {
        throw ByteSource::ReadError(fmt::format("{}: short read at {:#x}: got {:#x} of {:#x} bytes", m_source.name(), start, nread, length));
    }
    logger->trace("block {}/{}: [{:#x}, {:#x})", index, m_block_count, start, start + length);
    return buf;
}
