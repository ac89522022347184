#pragma once
#include <algorithm>
#include <cstring>
#include <string>

#include "ByteSource.hpp"

// in-memory ByteSource, used by the self-test and unit tests
class MemoryReader : public ByteSource {
    public:
    explicit MemoryReader(buf_t data, std::string name = "<memory>") : m_data(std::move(data)), m_name(std::move(name)) {}
    explicit MemoryReader(const std::string& data) : MemoryReader(buf_t(data)) {}

    size_t read_at(off_t offset, void* buf, size_t count) override {
        if( offset < 0 ){
            throw std::invalid_argument("offset < 0");
        }
        if( !m_open ){
            throw ReadError(m_name + ": read from closed reader");
        }
        m_reads++;
        if( (size_t)offset >= m_data.size() ){
            return 0;
        }
        count = std::min(count, m_data.size() - (size_t)offset);
        memcpy(buf, m_data.data() + offset, count);
        return count;
    }
    using ByteSource::read_at;

    size_t size() const override { return m_data.size(); }
    void close() override { m_open = false; }
    bool is_open() const override { return m_open; }
    std::string name() const override { return m_name; }

    // number of read_at() calls so far
    size_t reads() const { return m_reads; }

    private:
    buf_t m_data;
    std::string m_name;
    bool m_open = true;
    size_t m_reads = 0;
};
