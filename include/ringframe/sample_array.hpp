#pragma once

#include "ringframe/index_mapper.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ringframe {

/// Rows by columns.
struct Shape {
    std::size_t rows = 0;
    std::size_t columns = 1;

    friend bool operator==(const Shape&, const Shape&) = default;
};

/// Row-major two-dimensional sample storage of shape [rows, columns].
///
/// One row holds one frame (one sample per channel). Buffers own their
/// storage as a SampleArray and hand out SampleArray copies from reads, so
/// returned data never aliases live storage.
template <typename T>
    requires std::is_arithmetic_v<T>
class SampleArray {
public:
    using value_type = T;

    /// Empty array with one column.
    SampleArray() = default;

    /// Zero-filled array of the given shape.
    /// @throws std::invalid_argument if columns == 0.
    SampleArray(std::size_t rows, std::size_t columns)
        : rows_{rows}, columns_{checked_columns(columns)}, values_(rows * columns, T{}) {}

    /// Wraps interleaved values (row after row).
    /// @throws std::invalid_argument if columns == 0 or the value count is not
    ///         a multiple of columns.
    SampleArray(std::vector<T> values, std::size_t columns)
        : columns_{checked_columns(columns)}, values_{std::move(values)} {
        if (values_.size() % columns_ != 0) {
            throw std::invalid_argument("Cannot shape " + std::to_string(values_.size()) +
                                        " values into rows of " + std::to_string(columns_) +
                                        " columns");
        }
        rows_ = values_.size() / columns_;
    }

    /// Copies interleaved values.
    explicit SampleArray(std::span<const T> values, std::size_t columns = 1)
        : SampleArray(std::vector<T>(values.begin(), values.end()), columns) {}

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t columns() const noexcept { return columns_; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }
    [[nodiscard]] Shape shape() const noexcept { return {rows_, columns_}; }

    [[nodiscard]] T* data() noexcept { return values_.data(); }
    [[nodiscard]] const T* data() const noexcept { return values_.data(); }

    [[nodiscard]] std::span<const T> values() const noexcept { return values_; }

    [[nodiscard]] std::span<T> row(std::size_t r) noexcept {
        return {values_.data() + r * columns_, columns_};
    }
    [[nodiscard]] std::span<const T> row(std::size_t r) const noexcept {
        return {values_.data() + r * columns_, columns_};
    }

    [[nodiscard]] T& operator()(std::size_t r, std::size_t c) noexcept {
        return values_[r * columns_ + c];
    }
    [[nodiscard]] const T& operator()(std::size_t r, std::size_t c) const noexcept {
        return values_[r * columns_ + c];
    }

    friend bool operator==(const SampleArray&, const SampleArray&) = default;

    /// Copies the rows named by `indices` into a new array.
    [[nodiscard]] SampleArray gather(const IndexSet& indices) const {
        SampleArray out(indices.size(), columns_);
        gather_into(indices, out.values_);
        return out;
    }

    /// Copies `indices.size()` rows of `source`, starting at `first_row`, into
    /// the rows named by `indices`.
    /// @throws std::invalid_argument on a column mismatch or short source.
    void scatter(const IndexSet& indices, const SampleArray& source, std::size_t first_row = 0) {
        if (source.columns_ != columns_) {
            throw std::invalid_argument(shape_mismatch(source));
        }
        if (first_row + indices.size() > source.rows_) {
            throw std::invalid_argument("Source has too few rows for the requested scatter");
        }
        scatter(indices, source.values().subspan(first_row * columns_, indices.size() * columns_));
    }

    /// Copies interleaved rows into the rows named by `indices`.
    /// `rows` must hold exactly indices.size() * columns() values.
    void scatter(const IndexSet& indices, std::span<const T> rows) {
        if (rows.size() != indices.size() * columns_) {
            throw std::invalid_argument("Interleaved source does not match the index count");
        }

        if (indices.is_contiguous()) {
            const auto& run = indices.range();
            std::copy(rows.begin(), rows.end(),
                      values_.begin() + static_cast<std::ptrdiff_t>(run.first * columns_));
            return;
        }

        for (std::size_t i = 0; i < indices.size(); ++i) {
            const auto src = rows.subspan(i * columns_, columns_);
            std::copy(src.begin(), src.end(), row(indices[i]).begin());
        }
    }

    /// Copies the rows named by `indices` into an interleaved destination of
    /// exactly indices.size() * columns() values. Does not allocate.
    void gather_into(const IndexSet& indices, std::span<T> out) const {
        if (out.size() != indices.size() * columns_) {
            throw std::invalid_argument("Interleaved destination does not match the index count");
        }

        if (indices.is_contiguous()) {
            const auto& run = indices.range();
            std::copy_n(values_.begin() + static_cast<std::ptrdiff_t>(run.first * columns_),
                        run.count * columns_, out.begin());
            return;
        }

        for (std::size_t i = 0; i < indices.size(); ++i) {
            const auto src = row(indices[i]);
            std::copy(src.begin(), src.end(), out.begin() + static_cast<std::ptrdiff_t>(i * columns_));
        }
    }

    /// Sets every sample in the rows named by `indices`.
    void fill_rows(const IndexSet& indices, T value = T{}) {
        if (indices.is_contiguous()) {
            const auto& run = indices.range();
            std::fill_n(values_.begin() + static_cast<std::ptrdiff_t>(run.first * columns_),
                        run.count * columns_, value);
            return;
        }

        for (std::size_t i = 0; i < indices.size(); ++i) {
            const auto dst = row(indices[i]);
            std::fill(dst.begin(), dst.end(), value);
        }
    }

    void fill(T value) { std::fill(values_.begin(), values_.end(), value); }

    /// Rows [first, first + count) as a new array.
    [[nodiscard]] SampleArray slice(std::size_t first, std::size_t count) const {
        return gather(IndexSet::contiguous(first, count));
    }

    /// Copy-casts every sample to another element type.
    template <typename U>
    [[nodiscard]] SampleArray<U> astype() const {
        std::vector<U> converted(values_.size());
        std::transform(values_.begin(), values_.end(), converted.begin(),
                       [](T v) { return static_cast<U>(v); });
        return SampleArray<U>(std::move(converted), columns_);
    }

    /// Stacks `bottom` under `top`.
    /// @throws std::invalid_argument if the column counts differ.
    [[nodiscard]] static SampleArray vstack(const SampleArray& top, const SampleArray& bottom) {
        if (top.columns_ != bottom.columns_) {
            throw std::invalid_argument(top.shape_mismatch(bottom));
        }
        std::vector<T> values;
        values.reserve(top.size() + bottom.size());
        values.insert(values.end(), top.values_.begin(), top.values_.end());
        values.insert(values.end(), bottom.values_.begin(), bottom.values_.end());
        return SampleArray(std::move(values), top.columns_);
    }

private:
    static std::size_t checked_columns(std::size_t columns) {
        if (columns == 0) {
            throw std::invalid_argument("Sample arrays need at least one column");
        }
        return columns;
    }

    std::string shape_mismatch(const SampleArray& other) const {
        return "Could not broadcast array of shape (" + std::to_string(other.rows_) + ", " +
               std::to_string(other.columns_) + ") into shape (" + std::to_string(rows_) + ", " +
               std::to_string(columns_) + ")";
    }

    std::size_t rows_ = 0;
    std::size_t columns_ = 1;
    std::vector<T> values_;
};

}  // namespace ringframe
