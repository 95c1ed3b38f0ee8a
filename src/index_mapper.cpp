#include "ringframe/index_mapper.hpp"

#include <stdexcept>
#include <string>

namespace ringframe {

std::vector<std::size_t> IndexSet::to_vector() const {
    if (!contiguous_) {
        return rows_;
    }

    std::vector<std::size_t> rows(range_.count);
    for (std::size_t i = 0; i < range_.count; ++i) {
        rows[i] = range_.first + i;
    }
    return rows;
}

std::size_t wrap_index(index_t position, std::size_t capacity) noexcept {
    const auto cap = static_cast<index_t>(capacity);
    auto row = position % cap;
    if (row < 0) {
        row += cap;
    }
    return static_cast<std::size_t>(row);
}

IndexSet map_indices(index_t start, index_t length, std::size_t capacity) {
    if (length < 0) {
        throw std::invalid_argument("Index length must not be negative, got " +
                                    std::to_string(length));
    }
    if (capacity == 0) {
        throw std::invalid_argument("Index capacity must be positive");
    }

    const auto first = wrap_index(start, capacity);
    const auto count = static_cast<std::size_t>(length);

    // Fast path: the run fits before the wrap boundary
    if (first + count <= capacity) {
        return IndexSet::contiguous(first, count);
    }

    std::vector<std::size_t> rows(count);
    std::size_t row = first;
    for (std::size_t i = 0; i < count; ++i) {
        rows[i] = row;
        if (++row == capacity) {
            row = 0;
        }
    }
    return IndexSet::wrapped(std::move(rows));
}

}  // namespace ringframe
