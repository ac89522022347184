/**
 * @file MappedReader.cpp
 * @brief ByteSource implementation backed by a read-only mio mapping.
 */

#include "MappedReader.hpp"
#include "Reader.hpp"
#include "utils/common.hpp"

#include <cstring>

/**
 * @brief Maps the whole file read-only.
 *
 * @param fname Path to the file.
 * @throws std::runtime_error If the file cannot be stat'ed or mapped.
 */
MappedReader::MappedReader(const std::filesystem::path& fname) : m_fname(fname) {
    m_size = Reader::get_size(fname);
    if (m_size > 0) {
        std::error_code error;
        m_mmap = mio::make_mmap_source(fname.native(), error);
        if (error) {
            throw std::runtime_error(fmt::format("mmap(\"{}\"): {}", fname, error.message()));
        }
        m_size = m_mmap.size();
    }
    m_open = true;
    logger->debug("mapped {}, size: {}", fname, m_size);
}

void MappedReader::close() {
    if (m_mmap.is_mapped()) {
        m_mmap.unmap();
    }
    m_open = false;
}

size_t MappedReader::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( !m_open ){
        throw ReadError(fmt::format("{}: read from closed reader", m_fname));
    }
    if( (size_t)offset >= m_size ) {
        return 0;
    }
    count = std::min(count, m_size - (size_t)offset);
    memcpy(buf, m_mmap.data() + offset, count);
    return count;
}
