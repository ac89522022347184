#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

class buf_t : public std::vector<uint8_t> {
    public:
    buf_t() = default;
    buf_t(size_t size) : std::vector<uint8_t>(size) {}
    buf_t(const buf_t& src, size_t size) : std::vector<uint8_t>(src.data(), src.data() + size) {}
    buf_t(const void* data, size_t size) :
        std::vector<uint8_t>(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size) {}
    buf_t(const std::string& str) : buf_t(str.data(), str.size()) {}

    // replace contents with front ++ [0, keep) of the current contents
    void splice_front(const buf_t& front, size_t keep);

    // true if [pos, pos+needle.size()) equals needle
    bool matches_at(size_t pos, const buf_t& needle) const;

    std::string to_string() const { return std::string(reinterpret_cast<const char*>(data()), size()); }
};
