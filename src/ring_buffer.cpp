// RingBuffer is header-only (template class). The common sample types are
// instantiated here so template errors surface when the library builds.

#include "ringframe/ring_buffer.hpp"

#include <cstdint>

namespace ringframe {

template class RingBuffer<float>;
template class RingBuffer<double>;
template class RingBuffer<std::int16_t>;
template class RingBuffer<std::int32_t>;

}  // namespace ringframe
