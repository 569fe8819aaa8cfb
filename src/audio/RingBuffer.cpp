/**
 * RingBuffer.cpp - Lock-free SPSC implementation
 * Note: Most logic is in header (template class)
 */

#include "vtc/audio/RingBuffer.hpp"

namespace vtc::audio {

// Explicit instantiation for the sample types in use
template class RingBuffer<float>;
template class RingBuffer<int16_t>;

} // namespace vtc::audio
