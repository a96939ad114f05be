#pragma once

#include <stdint.h>

namespace necir
{
    constexpr uint32_t kHdrMarkUs = 9000;
    constexpr uint32_t kHdrSpaceUs = 4500;
    constexpr uint32_t kRepeatSpaceUs = 2250;
    constexpr uint32_t kBitMarkUs = 560;
    constexpr uint32_t kZeroSpaceUs = kBitMarkUs;
    constexpr uint32_t kOneSpaceUs = kBitMarkUs * 3;
    constexpr uint32_t kTolerancePercent = 20;

    // Tolerance is taken from the observed value, not the expected one:
    // |v - expected| < v * 20%. Accepts expected/1.2 < v < expected/0.8.
    inline bool matches(uint32_t v, uint32_t expectedUs)
    {
        uint64_t diff = v > expectedUs ? v - expectedUs : expectedUs - v;
        return diff * 100 < static_cast<uint64_t>(v) * kTolerancePercent;
    }

    inline bool isZeroBit(uint32_t markUs, uint32_t spaceUs)
    {
        return matches(markUs, kBitMarkUs) && matches(spaceUs, kZeroSpaceUs);
    }

    inline bool isOneBit(uint32_t markUs, uint32_t spaceUs)
    {
        return matches(markUs, kBitMarkUs) && matches(spaceUs, kOneSpaceUs);
    }
} // namespace necir
