// Both containers are header-only templates. Instantiating them here for the
// sample type used by the audio pipeline keeps template errors inside the core
// library build instead of surfacing first in downstream targets.

#include "chunkring/chunked_ring_buffer.hpp"
#include "chunkring/ring_buffer.hpp"

namespace chunkring {

template class RingBuffer<float>;
template class ChunkedRingBuffer<float>;

}  // namespace chunkring
