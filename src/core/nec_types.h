#pragma once

#include <stddef.h>
#include <stdint.h>
#include <array>

namespace necir
{

  // Sentinel pushed by a pulse source when the line stayed idle past its timeout.
  constexpr uint32_t kPulseTimeoutMarker = 0xFFFFFFFF;

  // Command code reported for a held key when repeats are not reported as the key.
  constexpr uint32_t kRepeatCode = 0xFFFFFFFF;

  // Start pair + 32 data pairs = 66; headroom for noise before a burst is dropped.
  constexpr size_t kMaxBurstValues = 128;

  enum class DecodeError : uint8_t
  {
    None = 0,
    InsufficientData,
    InvalidStartSequence,
    InvalidZeroBit,
    InvalidOneBit,
    InvalidRepeatFrame,
    FrameTooLong,
  };

  // One finalized group of durations (microseconds) between two idle timeouts.
  struct Burst
  {
    std::array<uint32_t, kMaxBurstValues> us{};
    uint16_t len{0};

    void clear() { len = 0; }
    bool append(uint32_t v)
    {
      if (len >= us.size())
        return false;
      us[len++] = v;
      return true;
    }
    uint32_t operator[](size_t i) const { return us[i]; }
    size_t size() const { return len; }
  };

  const char *decodeErrorName(necir::DecodeError err);

} // namespace necir
