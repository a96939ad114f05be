#pragma once

#include "core/nec_types.h"
#include "core/pulse_acquisition.h"
#include <deque>
#include <initializer_list>
#include <vector>

namespace necir_test
{
  // 256 kHz capture clock: us = ticks * 7.8125
  constexpr uint32_t kClockHz = 256000;
  constexpr uint32_t kHdrMarkTicks = 1152;  // 9000 us
  constexpr uint32_t kHdrSpaceTicks = 576;  // 4500 us
  constexpr uint32_t kRepeatSpaceTicks = 288; // 2250 us
  constexpr uint32_t kBitMarkTicks = 72;    // 562 us
  constexpr uint32_t kOneSpaceTicks = 215;  // 1679 us

  class FakePulseSource : public necir::PulseSource
  {
  public:
    explicit FakePulseSource(uint32_t hz = kClockHz) : hz_(hz) {}

    bool read(uint32_t &ticks) override
    {
      if (values_.empty())
        return false;
      ticks = values_.front();
      values_.pop_front();
      return true;
    }
    uint32_t frequencyHz() const override { return hz_; }

    void feed(const std::vector<uint32_t> &values) { values_.insert(values_.end(), values.begin(), values.end()); }
    void setFrequencyHz(uint32_t hz) { hz_ = hz; }
    size_t pendingCount() const { return values_.size(); }

  private:
    std::deque<uint32_t> values_;
    uint32_t hz_;
  };

  // Tick stream for a frame of `pairs` data bits taken MSB-first from code, ended by the timeout marker.
  inline std::vector<uint32_t> commandTicks(uint32_t code, int pairs = 32)
  {
    std::vector<uint32_t> v{kHdrMarkTicks, kHdrSpaceTicks};
    for (int i = 0; i < pairs; ++i)
    {
      bool one = (code >> (31 - i)) & 0x1;
      v.push_back(kBitMarkTicks);
      v.push_back(one ? kOneSpaceTicks : kBitMarkTicks);
    }
    v.push_back(necir::kPulseTimeoutMarker);
    return v;
  }

  inline std::vector<uint32_t> repeatTicks()
  {
    return {kHdrMarkTicks, kRepeatSpaceTicks, necir::kPulseTimeoutMarker};
  }

  inline necir::Burst burstOf(std::initializer_list<uint32_t> values)
  {
    necir::Burst b;
    for (uint32_t v : values)
      b.append(v);
    return b;
  }

  // Microsecond burst with nominal NEC timings.
  inline necir::Burst commandBurst(uint32_t code, int pairs = 32)
  {
    necir::Burst b = burstOf({9000, 4500});
    for (int i = 0; i < pairs; ++i)
    {
      bool one = (code >> (31 - i)) & 0x1;
      b.append(560);
      b.append(one ? 1680 : 560);
    }
    return b;
  }
} // namespace necir_test
