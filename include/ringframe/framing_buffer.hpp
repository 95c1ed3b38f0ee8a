#pragma once

#include "ringframe/index_mapper.hpp"
#include "ringframe/log.hpp"
#include "ringframe/sample_array.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ringframe {

/// Sizing of a FramingBuffer in time rather than rows.
struct FramingConfig {
    double sample_rate = 22050.0;  // Rows (frames) per second
    double seconds = 2.0;          // Capacity in seconds
    double buffer_delay = 0.0;     // Seconds buffered before the first real read
    std::size_t channels = 1;
};

/// Circular frame buffer with decoupled read and write cursors, for real-time
/// audio with a fixed latency.
///
/// Writes always land where the previous write ended and may overrun unread
/// data. Reads always advance by the full amount requested; positions that no
/// write has reached, or that were overwritten more than maxsize() rows ago,
/// read as zeros. A consumer running ahead of a stalled producer therefore
/// gets silence instead of an error.
///
/// With a non-zero `buffer_delay` the buffer starts closed: reads return
/// zeros without moving the read cursor until `buffer_delay` seconds of data
/// are buffered. clear() closes it again.
///
/// Thread safety: none, as for RingBuffer.
template <typename T>
    requires std::is_arithmetic_v<T>
class FramingBuffer {
public:
    using value_type = T;
    using array_type = SampleArray<T>;

    /// @throws std::invalid_argument if the configuration is not finite,
    ///         yields no rows or more than 2^31, has no channels, or the delay
    ///         is negative or longer than `seconds`.
    explicit FramingBuffer(const FramingConfig& config = {})
        : config_{checked_config(config)},
          storage_{capacity_for(config_.sample_rate, config_.seconds), config_.channels},
          delay_rows_{rows_for(config_.sample_rate, config_.buffer_delay)},
          can_read_{delay_rows_ == 0} {}

    [[nodiscard]] std::size_t maxsize() const noexcept { return storage_.rows(); }
    [[nodiscard]] std::size_t channels() const noexcept { return storage_.columns(); }
    [[nodiscard]] std::size_t columns() const noexcept { return storage_.columns(); }
    [[nodiscard]] Shape shape() const noexcept { return storage_.shape(); }

    [[nodiscard]] double sample_rate() const noexcept { return config_.sample_rate; }
    [[nodiscard]] double seconds() const noexcept { return config_.seconds; }
    [[nodiscard]] double buffer_delay() const noexcept { return config_.buffer_delay; }
    [[nodiscard]] const FramingConfig& config() const noexcept { return config_; }

    [[nodiscard]] index_t start() const noexcept { return start_; }
    [[nodiscard]] index_t end() const noexcept { return end_; }

    /// False while the buffer is still priming.
    [[nodiscard]] bool can_read() const noexcept { return can_read_; }

    /// Written but unread rows, clamped into [0, maxsize()].
    [[nodiscard]] std::size_t size() const noexcept {
        const auto length = end_ - start_;
        if (length <= 0) {
            return 0;
        }
        return std::min(static_cast<std::size_t>(length), maxsize());
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] std::size_t available_space() const noexcept { return maxsize() - size(); }

    /// Zeroes storage, resets both cursors and re-arms the priming delay.
    void clear() {
        start_ = 0;
        end_ = 0;
        storage_.fill(T{});
        can_read_ = delay_rows_ == 0;
    }

    // -------------------------------------------------------------------------
    // Producer interface
    // -------------------------------------------------------------------------

    /// Writes `data` at the write cursor, overwriting whatever is there, and
    /// advances the cursor by data.rows(). Never fails for lack of space.
    /// @throws std::invalid_argument on a channel mismatch.
    std::size_t write(const array_type& data) {
        if (data.columns() != channels()) {
            throw std::invalid_argument(
                "Could not broadcast input array with " + std::to_string(data.columns()) +
                " columns into a framing buffer of " + std::to_string(channels()) + " channels");
        }
        return write_rows(data.values(), data.rows());
    }

    /// Writes interleaved samples (channels() values per row).
    std::size_t write(std::span<const T> interleaved) {
        if (interleaved.size() % channels() != 0) {
            throw std::invalid_argument("Interleaved write of " + std::to_string(interleaved.size()) +
                                        " samples is not a whole number of " +
                                        std::to_string(channels()) + "-channel frames");
        }
        return write_rows(interleaved, interleaved.size() / channels());
    }

    // -------------------------------------------------------------------------
    // Consumer interface
    // -------------------------------------------------------------------------

    /// Reads `amount` rows from the read cursor, zero-filling every position
    /// outside the live window [max(0, end - maxsize()), end), and advances
    /// the cursor by `amount`.
    array_type read(std::size_t amount) {
        array_type out(amount, channels());
        read_into(std::span<T>{out.data(), out.size()});
        return out;
    }

    /// Reads the written but unread rows.
    array_type read() { return read(size()); }

    /// Fills `out` (a whole number of interleaved frames) the way read() does.
    /// Does not allocate for unwrapped reads; meant for audio callbacks.
    /// @return Number of frames read.
    std::size_t read_into(std::span<T> out) {
        if (out.size() % channels() != 0) {
            throw std::invalid_argument("Read destination is not a whole number of frames");
        }

        const auto amount = out.size() / channels();
        std::fill(out.begin(), out.end(), T{});
        if (!can_read_) {
            return amount;
        }

        const auto first = start_;
        const auto last = start_ + static_cast<index_t>(amount);
        const auto live_begin = std::max(first, std::max<index_t>(0, end_ - capacity()));
        const auto live_end = std::min(last, end_);

        if (live_begin < live_end) {
            const auto offset = static_cast<std::size_t>(live_begin - first) * channels();
            const auto count = static_cast<std::size_t>(live_end - live_begin);
            storage_.gather_into(map_indices(live_begin, live_end - live_begin, maxsize()),
                                 out.subspan(offset, count * channels()));
        }

        start_ = last;
        return amount;
    }

    /// Copy of the live unread rows. Cursors do not move.
    [[nodiscard]] array_type get_data() const {
        const auto live_begin = std::max(start_, std::max<index_t>(0, end_ - capacity()));
        if (live_begin >= end_) {
            return array_type(0, channels());
        }
        return storage_.gather(map_indices(live_begin, end_ - live_begin, maxsize()));
    }

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    /// Changes the sample rate; capacity follows sample_rate * seconds.
    void set_sample_rate(double sample_rate) {
        auto next = config_;
        next.sample_rate = sample_rate;
        apply(next);
    }

    /// Changes the capacity in seconds. A delay longer than the new capacity
    /// is shortened to it.
    void set_seconds(double seconds) {
        auto next = config_;
        next.seconds = seconds;
        next.buffer_delay = std::min(next.buffer_delay, seconds);
        apply(next);
    }

    /// @throws std::invalid_argument if negative or longer than seconds().
    void set_buffer_delay(double buffer_delay) {
        auto next = config_;
        next.buffer_delay = buffer_delay;
        config_ = checked_config(next);
        delay_rows_ = rows_for(config_.sample_rate, config_.buffer_delay);
    }

    /// Reallocates with a new channel count. Buffered data is discarded.
    void set_channels(std::size_t channels) {
        auto next = config_;
        next.channels = channels;
        config_ = checked_config(next);
        storage_ = array_type(maxsize(), channels);
        clear();
    }

    /// Converts the element type, keeping contents, cursors and priming state.
    template <typename U>
    [[nodiscard]] FramingBuffer<U> astype() const {
        FramingBuffer<U> out(config_);
        out.storage_ = storage_.template astype<U>();
        out.start_ = start_;
        out.end_ = end_;
        out.can_read_ = can_read_;
        return out;
    }

private:
    template <typename U>
        requires std::is_arithmetic_v<U>
    friend class FramingBuffer;

    /// Largest capacity a configuration may ask for.
    static constexpr std::size_t kMaxRows = std::size_t{1} << 31;

    static std::size_t rows_for(double sample_rate, double seconds) {
        return static_cast<std::size_t>(std::ceil(sample_rate * seconds));
    }

    static std::size_t capacity_for(double sample_rate, double seconds) {
        const auto rows = rows_for(sample_rate, seconds);
        if (rows == 0) {
            throw std::invalid_argument("Framing buffer capacity must be positive");
        }
        return rows;
    }

    static FramingConfig checked_config(const FramingConfig& config) {
        if (!std::isfinite(config.sample_rate) || !std::isfinite(config.seconds) ||
            !(config.sample_rate > 0.0) || !(config.seconds > 0.0)) {
            throw std::invalid_argument("Sample rate and seconds must be positive and finite");
        }
        if (config.sample_rate * config.seconds > static_cast<double>(kMaxRows)) {
            throw std::invalid_argument("Framing buffer capacity exceeds " +
                                        std::to_string(kMaxRows) + " rows");
        }
        if (config.channels == 0) {
            throw std::invalid_argument("Framing buffer needs at least one channel");
        }
        if (!(config.buffer_delay >= 0.0 && config.buffer_delay <= config.seconds)) {
            throw std::invalid_argument(
                "The buffer delay cannot be greater than the total number of seconds the "
                "buffer can hold");
        }
        return config;
    }

    [[nodiscard]] index_t capacity() const noexcept { return static_cast<index_t>(maxsize()); }

    std::size_t write_rows(std::span<const T> interleaved, std::size_t rows) {
        // Rows older than one capacity would be overwritten by this same batch
        const auto skipped = rows > maxsize() ? rows - maxsize() : 0;
        const auto kept = rows - skipped;

        storage_.scatter(map_indices(end_ + static_cast<index_t>(skipped),
                                     static_cast<index_t>(kept), maxsize()),
                         interleaved.subspan(skipped * channels()));
        end_ += static_cast<index_t>(rows);

        if (!can_read_ && end_ - start_ >= static_cast<index_t>(delay_rows_)) {
            can_read_ = true;
        }
        return rows;
    }

    /// Reallocates for a new configuration, migrating the newest live unread
    /// rows that fit. Cursors are rebased to zero.
    void apply(const FramingConfig& config) {
        const auto checked = checked_config(config);
        array_type next(capacity_for(checked.sample_rate, checked.seconds), checked.channels);

        const auto unread = get_data();
        const auto keep = std::min(unread.rows(), next.rows());
        if (keep > 0) {
            next.scatter(IndexSet::contiguous(0, keep), unread, unread.rows() - keep);
        }

        RINGFRAME_LOG_DEBUG("framing_buffer", "reallocated {} -> {} rows, kept {} unread",
                            maxsize(), next.rows(), keep);

        config_ = checked;
        storage_ = std::move(next);
        delay_rows_ = rows_for(config_.sample_rate, config_.buffer_delay);
        start_ = 0;
        end_ = static_cast<index_t>(keep);
    }

    FramingConfig config_;
    array_type storage_;
    std::size_t delay_rows_ = 0;
    bool can_read_ = true;
    index_t start_ = 0;
    index_t end_ = 0;
};

}  // namespace ringframe
