// FramingBuffer is header-only (template class). The common sample types are
// instantiated here so template errors surface when the library builds.

#include "ringframe/framing_buffer.hpp"

#include <cstdint>

namespace ringframe {

template class FramingBuffer<float>;
template class FramingBuffer<double>;
template class FramingBuffer<std::int16_t>;
template class FramingBuffer<std::int32_t>;

}  // namespace ringframe
