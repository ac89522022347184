/**
 * @file buf_t.cpp
 * @brief Implementation of buf_t helpers used by the reverse line scanner.
 *
 * The scanner keeps its window in a single buf_t and rebuilds it on every block
 * rollover: the freshly read (earlier) block goes to the front and the unconsumed
 * head of the previous window follows it.
 */

#include "buf_t.hpp"
#include <cstring>
#include <stdexcept>

/**
 * @brief Replaces buffer contents with @p front followed by the first @p keep bytes.
 *
 * @param front Bytes to place at the start of the buffer.
 * @param keep Number of leading bytes of the current contents to keep after @p front.
 * @throws std::out_of_range If keep exceeds the current size.
 */
void buf_t::splice_front(const buf_t& front, size_t keep) {
    if (keep > size()) {
        throw std::out_of_range("buf_t::splice_front: keep > size");
    }

    buf_t merged(front.size() + keep);
    if (!front.empty()) {
        memcpy(merged.data(), front.data(), front.size());
    }
    if (keep) {
        memcpy(merged.data() + front.size(), data(), keep);
    }
    swap(merged);
}

/**
 * @brief Checks whether @p needle occurs at position @p pos.
 * @return False if the needle does not fit, true on a byte-exact match.
 */
bool buf_t::matches_at(size_t pos, const buf_t& needle) const {
    if (needle.empty() || pos > size() || needle.size() > size() - pos) {
        return false;
    }
    return memcmp(data() + pos, needle.data(), needle.size()) == 0;
}
