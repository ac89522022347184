#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sys/types.h>

#include "core/buf_t.hpp"

// positioned random-access byte source, the only thing BlockReader needs from a file
class ByteSource {
    public:
    virtual ~ByteSource() = default;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // size captured at open time, never re-read
    virtual size_t size() const = 0;

    // either succeeds or throws ReadError, returns less than count only at EOF
    virtual size_t read_at(off_t offset, void* buf, size_t count) = 0;
    size_t read_at(off_t offset, buf_t& buf) {
        return read_at(offset, buf.data(), buf.size());
    }

    // idempotent
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // for log messages
    virtual std::string name() const = 0;
};
