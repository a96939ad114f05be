#pragma once

#include "nec_types.h"
#include <stddef.h>

namespace necir
{
  // Queue one captured burst all-or-nothing: its (low, high) pairs followed by
  // kPulseTimeoutMarker go in only when everything fits; otherwise just the
  // marker, so a burst is never split and the next one stays aligned.
  // Queue needs size_t spaces() and bool push(uint32_t); pairAt(i, low, high)
  // yields pair i. Returns false when the pairs (or the marker) were dropped.
  template <typename Queue, typename PairAt>
  bool forwardBurst(Queue &queue, size_t pairCount, PairAt pairAt)
  {
    const size_t spaces = queue.spaces();
    if (spaces == 0)
    {
      return false;
    }
    const bool fits = pairCount * 2 + 1 <= spaces;
    if (fits)
    {
      for (size_t i = 0; i < pairCount; ++i)
      {
        uint32_t low = 0;
        uint32_t high = 0;
        pairAt(i, low, high);
        if (!queue.push(low) || !queue.push(high))
          return false;
      }
    }
    return queue.push(necir::kPulseTimeoutMarker) && fits;
  }
} // namespace necir
