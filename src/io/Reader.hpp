#pragma once
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <string>

#include "ByteSource.hpp"

// file reader over pread(), can read from:
//  - regular file
//  - linux/macos block device (/dev/sdX)
//
// size is captured once in the constructor, growing files are not followed
class Reader : public ByteSource {
    public:
    Reader(const std::filesystem::path& fname);
    ~Reader() override;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    // either succeeds or throws an exception
    size_t read_at(off_t offset, void* buf, size_t count) override;
    using ByteSource::read_at;

    // get size of a regular file/device
    size_t size() const override { return m_size; }

    void close() override;
    bool is_open() const override { return m_fd != -1; }
    std::string name() const override { return m_fname.string(); }

    // get size of file/*nix device
    static size_t get_size(const std::filesystem::path& fname);

    private:
        std::filesystem::path m_fname;
        int m_fd = -1;
        size_t m_size = 0;
};
