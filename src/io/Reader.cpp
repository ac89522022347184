/**
 * @file Reader.cpp
 * @brief Implementation of the pread()-based file and device reader.
 *
 * Provides positioned reads for regular files and block devices on Linux and
 * macOS. The size is determined once when the file is opened; reads never go
 * past it even if the file grows later, which keeps block arithmetic of the
 * reverse line scanner stable for the whole session.
 */

#include "Reader.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/ioctl.h>
#include <linux/fs.h>
#elif __APPLE__
#include <sys/ioctl.h>
#include <sys/disk.h>
#endif

size_t Reader::get_size(const std::filesystem::path& fname) {
    size_t size = 0;
    struct stat st;
    if( stat(fname.string().c_str(), &st) == -1 ) {
        throw std::runtime_error(fmt::format("stat(\"{}\"): {}", fname, strerror(errno)));
    }

    if (S_ISREG(st.st_mode)) {
        // regular file
        if ((uint64_t)st.st_size > SIZE_MAX) {
            throw std::runtime_error(fmt::format("\"{}\": size {} does not fit in size_t", fname, (uint64_t)st.st_size));
        }
        size = st.st_size;
    } else if (S_ISBLK(st.st_mode)) {
        // block device
        int fd = open(fname.string().c_str(), O_RDONLY);
        if (fd == -1) {
            throw std::runtime_error(fmt::format("open(\"{}\"): {}", fname, strerror(errno)));
        }
#ifdef __linux__
        if (ioctl(fd, BLKGETSIZE64, &size) == -1) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(fmt::format("ioctl({:#x}, BLKGETSIZE64): {}", fd, strerror(err)));
        }
#elif __APPLE__
        uint32_t blockSize = 0;
        if (ioctl(fd, DKIOCGETBLOCKSIZE, &blockSize) == -1) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(fmt::format("ioctl({:#x}, DKIOCGETBLOCKSIZE): {}", fd, strerror(err)));
        }

        uint64_t blockCount = 0;
        if (ioctl(fd, DKIOCGETBLOCKCOUNT, &blockCount) == -1) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(fmt::format("ioctl({:#x}, DKIOCGETBLOCKCOUNT): {}", fd, strerror(err)));
        }
        size = (size_t)blockSize * blockCount;
#endif
        ::close(fd);
    } else if (S_ISDIR(st.st_mode)) {
        throw std::runtime_error(fmt::format("\"{}\" is a directory", fname));
    }
    return size;
}

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

/**
 * @brief Opens the file/device for reading and determines its size.
 *
 * @param fname Path to file or device to open.
 * @throws std::runtime_error If file cannot be opened or size cannot be determined.
 */
Reader::Reader(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.string().c_str(), OPEN_MODE);
    if( m_fd == -1 ) {
        throw std::runtime_error(fmt::format("open(\"{}\", {:#x}): {}", fname, OPEN_MODE, strerror(errno)));
    }
    try {
        m_size = get_size(fname);
    } catch (...) {
        ::close(m_fd);
        m_fd = -1;
        throw;
    }
    logger->debug("opened {}, size: {}", fname, m_size);
}

Reader::~Reader() {
    close();
}

/**
 * @brief Closes the file descriptor. Safe to call more than once.
 */
void Reader::close() {
    if( m_fd != -1 ) {
        ::close(m_fd);
        m_fd = -1;
    }
}

/**
 * @brief Reads data from a specific file position.
 *
 * Retries on EINTR and on short reads until either @p count bytes are read or
 * the size captured at open time is reached.
 *
 * @param offset File position to read from.
 * @param buf Buffer to read into.
 * @param count Number of bytes to read.
 * @return Number of bytes actually read (less than count only at EOF).
 * @throws std::invalid_argument If offset is negative.
 * @throws ReadError On read error, or if the reader is closed.
 */
size_t Reader::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw std::invalid_argument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( m_fd == -1 ){
        throw ReadError(fmt::format("{}: read from closed reader", m_fname));
    }
    if( (size_t)offset >= m_size ) {
        return 0;
    }
    count = std::min(count, m_size - (size_t)offset);

    char* out = static_cast<char*>(buf);
    size_t total_read = 0;
    while (total_read < count) {
        ssize_t nread = ::pread(m_fd, out + total_read, count - total_read, offset + total_read);
        if (nread == -1) {
            if (errno == EINTR) continue;
            throw ReadError(fmt::format("read(fd {:#x}, offset {:#x}, count {:#x}): {}", m_fd, offset + total_read, count - total_read, strerror(errno)));
        }
        if (nread == 0) {
            // file was truncated after open
            break;
        }
        total_read += static_cast<size_t>(nread);
    }
    return total_read;
}
