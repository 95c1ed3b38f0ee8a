#pragma once

#include "ringframe/index_mapper.hpp"
#include "ringframe/log.hpp"
#include "ringframe/sample_array.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ringframe {

/// Result of RingBuffer::read_last: the newest hop-aligned window and the
/// number of hops the read cursor moved past.
template <typename T>
struct LastWindow {
    SampleArray<T> data;
    std::size_t frames = 0;
};

/// Fixed-capacity circular buffer of sample frames.
///
/// The write cursor (`end`) never runs more than `maxsize()` rows ahead of the
/// read cursor (`start`): a strict write that does not fit throws, a
/// non-strict write drops data instead. Cursors are logical and grow without
/// bound; storage positions are `cursor mod maxsize()`.
///
/// Reads always return copies, so later writes cannot corrupt data already
/// handed to the caller.
///
/// Thread safety: none. One producer and one consumer must be coordinated
/// externally (see Synchronized). Anything that reallocates storage
/// (set_maxsize, reshape, expanding_write, growing_write) needs exclusive
/// access.
template <typename T>
    requires std::is_arithmetic_v<T>
class RingBuffer {
public:
    using value_type = T;
    using array_type = SampleArray<T>;

    /// Constructs an empty buffer of `maxsize` rows by `columns` channels.
    /// @throws std::invalid_argument if maxsize or columns is zero.
    explicit RingBuffer(std::size_t maxsize, std::size_t columns = 1)
        : storage_{checked_capacity(maxsize), columns} {}

    /// Constructs a buffer sized to `data`, with all of it readable.
    /// @throws std::invalid_argument if data has no rows.
    explicit RingBuffer(array_type data) { set_data(std::move(data)); }

    [[nodiscard]] std::size_t maxsize() const noexcept { return storage_.rows(); }
    [[nodiscard]] std::size_t columns() const noexcept { return storage_.columns(); }
    [[nodiscard]] Shape shape() const noexcept { return storage_.shape(); }

    /// Number of readable rows (end - start).
    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(end_ - start_);
    }

    [[nodiscard]] bool empty() const noexcept { return end_ == start_; }
    [[nodiscard]] bool full() const noexcept { return size() == maxsize(); }

    /// Rows that can be written without overflowing.
    [[nodiscard]] std::size_t available_space() const noexcept { return maxsize() - size(); }

    [[nodiscard]] index_t start() const noexcept { return start_; }
    [[nodiscard]] index_t end() const noexcept { return end_; }

    /// Resets both cursors to zero. Storage is left as is.
    void clear() noexcept {
        start_ = 0;
        end_ = 0;
    }

    // -------------------------------------------------------------------------
    // Producer interface
    // -------------------------------------------------------------------------

    /// Appends `data` at the write cursor and returns the number of rows
    /// written.
    ///
    /// When the rows do not fit and `error_on_overflow` is set, nothing is
    /// written. Otherwise only the last maxsize() rows of the batch are kept
    /// and the oldest buffered rows are dropped to make room.
    ///
    /// @throws std::invalid_argument on a column mismatch.
    /// @throws std::overflow_error on a strict write that does not fit.
    std::size_t write(const array_type& data, bool error_on_overflow = true) {
        check_columns(data.columns(), data.rows());
        return write_rows(data.values(), data.rows(), error_on_overflow);
    }

    /// Appends interleaved samples (columns() values per row).
    std::size_t write(std::span<const T> interleaved, bool error_on_overflow = true) {
        if (interleaved.size() % columns() != 0) {
            throw std::invalid_argument("Interleaved write of " + std::to_string(interleaved.size()) +
                                        " samples is not a whole number of " +
                                        std::to_string(columns()) + "-column rows");
        }
        return write_rows(interleaved, interleaved.size() / columns(), error_on_overflow);
    }

    /// Writes `data`, first growing the buffer to exactly size() + rows if it
    /// would overflow. Never loses data; `error_on_overflow` cannot trigger.
    std::size_t expanding_write(const array_type& data, bool error_on_overflow = true) {
        check_columns(data.columns(), data.rows());
        if (data.rows() > available_space()) {
            reallocate(size() + data.rows());
        }
        return write(data, error_on_overflow);
    }

    /// Writes `data`, growing the buffer by the minimum needed so that
    /// size() + rows <= maxsize().
    std::size_t growing_write(const array_type& data) {
        check_columns(data.columns(), data.rows());
        const auto available = available_space();
        if (data.rows() > available) {
            reallocate(maxsize() + (data.rows() - available));
        }
        return write(data, true);
    }

    // -------------------------------------------------------------------------
    // Consumer interface
    // -------------------------------------------------------------------------

    /// Reads and consumes every readable row.
    array_type read() { return read(size()); }

    /// Reads and consumes `amount` rows. Returns an empty array and leaves the
    /// cursors alone when fewer than `amount` rows are buffered.
    array_type read(std::size_t amount) {
        if (amount == 0 || amount > size()) {
            return array_type(0, columns());
        }
        auto out = peek(amount);
        start_ += static_cast<index_t>(amount);
        return out;
    }

    /// Like read(), but reads whatever is buffered when `amount` exceeds it.
    array_type read_remaining(std::size_t amount) { return read(std::min(amount, size())); }
    array_type read_remaining() { return read(); }

    /// Reads up to `amount` rows but moves the read cursor only by
    /// `increment`, so consecutive calls return overlapping windows. An
    /// increment larger than `amount` skips rows; the cursor never passes
    /// the write cursor.
    array_type read_overlap(std::size_t amount, std::size_t increment) {
        amount = std::min(amount, size());
        if (amount == 0) {
            return array_type(0, columns());
        }
        auto out = peek(amount);
        start_ += static_cast<index_t>(std::min(increment, size()));
        return out;
    }

    array_type read_overlap(std::size_t amount) { return read_overlap(amount, amount); }
    array_type read_overlap() { return read_overlap(size()); }

    /// Returns the newest window of `amount` rows whose start lies on an
    /// `update_rate` hop from the read cursor, then moves one hop past it.
    ///
    /// Used to keep a spectral display current: hops that are already stale
    /// are skipped rather than processed. `frames` counts skipped hops plus
    /// the one read. Returns an empty window and zero frames when fewer than
    /// `amount` rows are buffered.
    ///
    /// @throws std::invalid_argument if update_rate is zero.
    LastWindow<T> read_last(std::size_t amount, std::size_t update_rate) {
        if (update_rate == 0) {
            throw std::invalid_argument("read_last needs a non-zero update rate");
        }
        if (amount == 0 || amount > size()) {
            return {array_type(0, columns()), 0};
        }

        const auto skips = (size() - amount) / update_rate;
        start_ += static_cast<index_t>(skips * update_rate);

        LastWindow<T> result{peek(amount), skips + 1};
        start_ += static_cast<index_t>(std::min(update_rate, size()));
        return result;
    }

    LastWindow<T> read_last(std::size_t amount) { return read_last(amount, amount); }

    /// Copy of the readable rows. Cursors do not move.
    [[nodiscard]] array_type get_data() const { return peek(size()); }

    /// Replaces storage with `data`, all of which becomes readable.
    /// @throws std::invalid_argument if data has no rows.
    void set_data(array_type data) {
        checked_capacity(data.rows());
        storage_ = std::move(data);
        start_ = 0;
        end_ = static_cast<index_t>(storage_.rows());
    }

    // -------------------------------------------------------------------------
    // Reallocation
    // -------------------------------------------------------------------------

    /// Changes the capacity, keeping the newest readable rows that fit.
    /// Cursors are rebased so the kept rows start at zero.
    /// @throws std::invalid_argument if maxsize is zero.
    void set_maxsize(std::size_t maxsize) { reallocate(maxsize); }

    /// Changes the shape. With the same column count this is set_maxsize().
    /// Otherwise the readable samples are reinterpreted as rows of the new
    /// width when they divide evenly and fit; if not, the buffer is cleared.
    /// @throws std::invalid_argument if rows or columns is zero.
    void reshape(std::size_t rows, std::size_t columns) {
        if (columns == this->columns()) {
            reallocate(rows);
            return;
        }

        array_type next(checked_capacity(rows), columns);
        const auto samples = size() * this->columns();
        const auto new_rows = samples / columns;

        if (samples % columns == 0 && new_rows <= rows) {
            const auto valid = get_data();
            next.scatter(IndexSet::contiguous(0, new_rows), valid.values());
            storage_ = std::move(next);
            start_ = 0;
            end_ = static_cast<index_t>(new_rows);
        } else {
            RINGFRAME_LOG_DEBUG("ring_buffer", "reshape to ({}, {}) discards {} buffered rows",
                                rows, columns, size());
            storage_ = std::move(next);
            clear();
        }
    }

    void set_columns(std::size_t columns) { reshape(maxsize(), columns); }

    /// Reallocates zeroed storage of the given shape and clears the cursors.
    void reshape_and_zero(std::size_t rows, std::size_t columns) {
        storage_ = array_type(checked_capacity(rows), columns);
        clear();
    }

    /// Converts the element type, keeping contents and cursors.
    template <typename U>
    [[nodiscard]] RingBuffer<U> astype() const {
        RingBuffer<U> out(maxsize(), columns());
        out.storage_ = storage_.template astype<U>();
        out.start_ = start_;
        out.end_ = end_;
        return out;
    }

private:
    template <typename U>
        requires std::is_arithmetic_v<U>
    friend class RingBuffer;

    static std::size_t checked_capacity(std::size_t maxsize) {
        if (maxsize == 0) {
            throw std::invalid_argument("Ring buffer capacity must be positive");
        }
        return maxsize;
    }

    void check_columns(std::size_t columns, std::size_t rows) const {
        if (columns != this->columns()) {
            throw std::invalid_argument("Could not broadcast input array from shape (" +
                                        std::to_string(rows) + ", " + std::to_string(columns) +
                                        ") into shape (" + std::to_string(maxsize()) + ", " +
                                        std::to_string(this->columns()) + ")");
        }
    }

    std::size_t write_rows(std::span<const T> interleaved, std::size_t rows,
                           bool error_on_overflow) {
        const auto available = available_space();
        if (rows > available) {
            if (error_on_overflow) {
                throw std::overflow_error("Not enough space in the ring buffer: " +
                                          std::to_string(available) + " < " +
                                          std::to_string(rows));
            }

            // Keep the tail of an oversized batch, then make room by dropping
            // the oldest buffered rows
            if (rows > maxsize()) {
                interleaved = interleaved.subspan((rows - maxsize()) * columns());
                rows = maxsize();
            }
            start_ += static_cast<index_t>(rows - std::min(rows, available));
        }

        storage_.scatter(map_indices(end_, static_cast<index_t>(rows), maxsize()), interleaved);
        end_ += static_cast<index_t>(rows);
        return rows;
    }

    [[nodiscard]] array_type peek(std::size_t amount) const {
        return storage_.gather(map_indices(start_, static_cast<index_t>(amount), maxsize()));
    }

    void reallocate(std::size_t maxsize) {
        array_type next(checked_capacity(maxsize), columns());
        const auto keep = std::min(size(), maxsize);

        if (keep > 0) {
            const auto newest =
                storage_.gather(map_indices(end_ - static_cast<index_t>(keep),
                                            static_cast<index_t>(keep), this->maxsize()));
            next.scatter(IndexSet::contiguous(0, keep), newest);
        }

        RINGFRAME_LOG_DEBUG("ring_buffer", "reallocated {} -> {} rows, kept {} of {}",
                            this->maxsize(), maxsize, keep, size());

        storage_ = std::move(next);
        start_ = 0;
        end_ = static_cast<index_t>(keep);
    }

    array_type storage_;
    index_t start_ = 0;
    index_t end_ = 0;
};

}  // namespace ringframe
