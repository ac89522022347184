#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/types.h>

#include <unicode/ucnv.h>

#include "core/buf_t.hpp"

// ICU converter restricted to encodings that can be scanned backwards for line terminators:
// every character has a known maximum byte length and CR/LF can only appear as themselves,
// never as a part of another character
class Charset {
    public:
    class UnsupportedError : public std::runtime_error {
        public:
        explicit UnsupportedError(const std::string& msg) : std::runtime_error(msg) {}
    };

    class DecodeError : public std::runtime_error {
        public:
        explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // throws UnsupportedError
    explicit Charset(const std::string& name);

    Charset(Charset&&) = default;
    Charset& operator=(Charset&&) = default;

    // strict conversion to UTF-8, throws DecodeError on malformed or truncated input
    // offset is only used in the error message
    std::string decode(const uint8_t* data, size_t size, off_t offset = 0);
    std::string decode(const buf_t& buf) { return decode(buf.data(), buf.size()); }

    // UTF-8 to this charset, throws DecodeError if the input is not valid UTF-8 or has no mapping
    buf_t encode(const std::string& utf8);

    // ICU canonical name
    const std::string& name() const { return m_name; }

    int max_char_size() const { return m_max_char_size; }
    int min_char_size() const { return m_min_char_size; }

    // distance between candidate terminator positions
    int step() const { return m_step; }

    // terminators encoded in this charset
    const buf_t& crlf() const { return m_crlf; }
    const buf_t& lf() const { return m_lf; }
    const buf_t& cr() const { return m_cr; }

    static bool is_supported(const std::string& name);

    private:
    struct ConverterCloser {
        void operator()(UConverter* cnv) const { ucnv_close(cnv); }
    };

    buf_t encode_ascii(const char* str) const;

    std::unique_ptr<UConverter, ConverterCloser> m_cnv;
    std::string m_name;
    int m_max_char_size = 1;
    int m_min_char_size = 1;
    int m_step = 1;
    buf_t m_crlf, m_lf, m_cr;
};
