#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include <vector>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace BybitTrader {
namespace Core {

/**
 * Fixed-capacity circular buffer. Once full, each push overwrites the oldest value.
 * Index 0 is the oldest retained value, size()-1 the newest.
 */
template <typename T>
class RollingWindow {
public:
    explicit RollingWindow(std::size_t window_capacity)
        : values(window_capacity), head_index(0), value_count(0) {
        if (window_capacity == 0) {
            throw std::invalid_argument("RollingWindow capacity must be greater than 0");
        }
    }

    void push(const T& value) {
        values[head_index] = value;
        head_index = (head_index + 1) % values.size();
        if (value_count < values.size()) {
            ++value_count;
        }
    }

    const T& operator[](std::size_t index) const {
        if (index >= value_count) {
            throw std::out_of_range("RollingWindow index " + std::to_string(index) + " out of range");
        }
        std::size_t oldest_index = (head_index + values.size() - value_count) % values.size();
        return values[(oldest_index + index) % values.size()];
    }

    const T& newest() const { return (*this)[value_count - 1]; }

    std::size_t size() const { return value_count; }
    std::size_t capacity() const { return values.size(); }
    bool full() const { return value_count == values.size(); }
    bool empty() const { return value_count == 0; }

    void clear() {
        head_index = 0;
        value_count = 0;
    }

private:
    std::vector<T> values;
    std::size_t head_index;     // slot the next push writes
    std::size_t value_count;
};

} // namespace Core
} // namespace BybitTrader

#endif // ROLLING_WINDOW_HPP
