#pragma once

#include "ringframe/framing_buffer.hpp"
#include "ringframe/ring_buffer.hpp"

#include <concepts>
#include <cstddef>
#include <mutex>
#include <utility>

namespace ringframe {

/// Operations shared by RingBuffer and FramingBuffer. The two differ in how
/// their cursors move, not in this surface.
template <typename B>
concept SampleBuffer = requires(B& buffer, const B& cbuffer, const typename B::array_type& data,
                                std::size_t amount) {
    typename B::value_type;
    { buffer.write(data) } -> std::convertible_to<std::size_t>;
    { buffer.read(amount) } -> std::same_as<typename B::array_type>;
    { buffer.clear() };
    { cbuffer.size() } -> std::convertible_to<std::size_t>;
    { cbuffer.available_space() } -> std::convertible_to<std::size_t>;
    { cbuffer.maxsize() } -> std::convertible_to<std::size_t>;
    { cbuffer.get_data() } -> std::same_as<typename B::array_type>;
};

static_assert(SampleBuffer<RingBuffer<float>>);
static_assert(SampleBuffer<FramingBuffer<float>>);

/// Pairs a buffer with a mutex for callers that share it between a producer
/// and a consumer thread.
///
/// The buffers themselves never lock. Everything that touches the wrapped
/// buffer goes through with_lock(), which also covers reallocating
/// operations that need exclusive access.
template <SampleBuffer Buffer>
class Synchronized {
public:
    using buffer_type = Buffer;
    using array_type = typename Buffer::array_type;

    template <typename... Args>
    explicit Synchronized(Args&&... args) : buffer_(std::forward<Args>(args)...) {}

    Synchronized(const Synchronized&) = delete;
    Synchronized& operator=(const Synchronized&) = delete;

    /// Runs `fn(buffer)` with the lock held and returns its result.
    template <typename Fn>
    decltype(auto) with_lock(Fn&& fn) {
        std::lock_guard lock{mutex_};
        return std::forward<Fn>(fn)(buffer_);
    }

    template <typename Fn>
    decltype(auto) with_lock(Fn&& fn) const {
        std::lock_guard lock{mutex_};
        return std::forward<Fn>(fn)(buffer_);
    }

    /// Runs `fn(buffer)` only if the lock is free right now. Never blocks,
    /// so a real-time producer can skip a block instead of waiting on the
    /// consumer.
    /// @return Whether `fn` ran.
    template <typename Fn>
    bool try_with_lock(Fn&& fn) {
        std::unique_lock lock{mutex_, std::try_to_lock};
        if (!lock.owns_lock()) {
            return false;
        }
        std::forward<Fn>(fn)(buffer_);
        return true;
    }

    template <typename... Args>
    std::size_t write(Args&&... args) {
        std::lock_guard lock{mutex_};
        return buffer_.write(std::forward<Args>(args)...);
    }

    array_type read(std::size_t amount) {
        std::lock_guard lock{mutex_};
        return buffer_.read(amount);
    }

    void clear() {
        std::lock_guard lock{mutex_};
        buffer_.clear();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock{mutex_};
        return buffer_.size();
    }

    [[nodiscard]] std::size_t available_space() const {
        std::lock_guard lock{mutex_};
        return buffer_.available_space();
    }

    [[nodiscard]] array_type get_data() const {
        std::lock_guard lock{mutex_};
        return buffer_.get_data();
    }

private:
    mutable std::mutex mutex_;
    Buffer buffer_;
};

/// Analysis buffer shared by the audio callback and the analyzer thread.
using AnalysisBuffer = Synchronized<RingBuffer<float>>;

}  // namespace ringframe
