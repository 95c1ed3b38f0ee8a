#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace ringframe {

/// Logical cursor type. Cursors grow without bound and are mapped onto
/// storage with a modulo, so they are signed 64-bit rather than size_t.
using index_t = std::int64_t;

/// Half-open run of physical rows [first, first + count).
struct IndexRange {
    std::size_t first = 0;
    std::size_t count = 0;

    friend bool operator==(const IndexRange&, const IndexRange&) = default;
};

/// Physical row positions for a logical (start, length) request.
///
/// Either a single contiguous run, which lets the storage copy in one bulk
/// operation, or an explicit ordered list of rows when the request crosses
/// the capacity boundary.
class IndexSet {
public:
    IndexSet() = default;

    static IndexSet contiguous(std::size_t first, std::size_t count) {
        IndexSet set;
        set.range_ = {first, count};
        return set;
    }

    static IndexSet wrapped(std::vector<std::size_t> rows) {
        IndexSet set;
        set.contiguous_ = false;
        set.range_ = {rows.empty() ? 0 : rows.front(), rows.size()};
        set.rows_ = std::move(rows);
        return set;
    }

    [[nodiscard]] bool is_contiguous() const noexcept { return contiguous_; }

    /// First row and count. For a wrapped set `first` is the first row only.
    [[nodiscard]] const IndexRange& range() const noexcept { return range_; }

    [[nodiscard]] std::size_t size() const noexcept { return range_.count; }
    [[nodiscard]] bool empty() const noexcept { return range_.count == 0; }

    /// Physical row of the i-th logical position.
    [[nodiscard]] std::size_t operator[](std::size_t i) const noexcept {
        return contiguous_ ? range_.first + i : rows_[i];
    }

    /// Expands the set into an explicit row list.
    [[nodiscard]] std::vector<std::size_t> to_vector() const;

private:
    bool contiguous_ = true;
    IndexRange range_{};
    std::vector<std::size_t> rows_;
};

/// Maps the logical range [start, start + length) onto a storage of
/// `capacity` rows.
///
/// Returns a contiguous run when `(start mod capacity) + length <= capacity`,
/// otherwise the `length` rows `(start + i) mod capacity` in order. Negative
/// starts use floor-modulo so every row lies in [0, capacity).
///
/// Pure and stateless; safe to call from any thread.
///
/// @throws std::invalid_argument if length < 0 or capacity == 0.
[[nodiscard]] IndexSet map_indices(index_t start, index_t length, std::size_t capacity);

/// Physical row of a single logical position. `capacity` must be non-zero.
[[nodiscard]] std::size_t wrap_index(index_t position, std::size_t capacity) noexcept;

}  // namespace ringframe
