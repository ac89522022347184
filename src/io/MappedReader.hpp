#pragma once
#include <filesystem>
#include <mio/mmap.hpp>

#include "ByteSource.hpp"

// read-only memory mapped file, same contract as Reader
// empty files are not mapped at all (mmap() refuses zero length)
class MappedReader : public ByteSource {
    public:
    explicit MappedReader(const std::filesystem::path& fname);
    ~MappedReader() override { close(); }

    size_t read_at(off_t offset, void* buf, size_t count) override;
    using ByteSource::read_at;

    size_t size() const override { return m_size; }
    void close() override;
    bool is_open() const override { return m_open; }
    std::string name() const override { return m_fname.string(); }

    private:
    std::filesystem::path m_fname;
    mio::mmap_source m_mmap;
    size_t m_size = 0;
    bool m_open = false;
};
