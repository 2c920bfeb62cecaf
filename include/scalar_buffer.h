/**
 * @file scalar_buffer.h
 * @brief Pushback queue of code points not yet handed to the parser.
 */

#ifndef UNICSV_SCALAR_BUFFER_H
#define UNICSV_SCALAR_BUFFER_H

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>

namespace unicsv {

/**
 * @brief FIFO of code points with insertion at both ends.
 *
 * Values come out of next() in the order they appeared in the source stream:
 * prepend() puts scalars in front of everything queued (keeping their
 * relative order), append() puts them behind everything queued.
 *
 * Owned by exactly one parsing session; it performs no I/O.
 */
class ScalarBuffer {
public:
    ScalarBuffer() = default;

    /// Front scalar, or std::nullopt when the buffer is empty
    std::optional<char32_t> next() {
        if (scalars_.empty()) return std::nullopt;
        char32_t front = scalars_.front();
        scalars_.pop_front();
        return front;
    }

    void prepend(char32_t scalar) { scalars_.push_front(scalar); }
    void prepend(std::u32string_view scalars);

    void append(char32_t scalar) { scalars_.push_back(scalar); }
    void append(std::u32string_view scalars);

    size_t size() const { return scalars_.size(); }
    bool empty() const { return scalars_.empty(); }
    void clear() { scalars_.clear(); }

private:
    std::deque<char32_t> scalars_;
};

}  // namespace unicsv

#endif  // UNICSV_SCALAR_BUFFER_H
