#pragma once

#include "nec_types.h"
#include <atomic>

namespace necir
{

  // Producer of raw tick values: (low, high) pairs followed by
  // kPulseTimeoutMarker at the end of each burst.
  class PulseSource
  {
  public:
    virtual ~PulseSource() = default;

    // Non-blocking; false when nothing is pending.
    virtual bool read(uint32_t &ticks) = 0;

    // Capture clock in Hz. One tick spans two clock cycles, so
    // us = ticks * 2'000'000 / frequencyHz().
    virtual uint32_t frequencyHz() const = 0;
  };

  // Single-producer/single-consumer "latest value" slot (triple buffer).
  // publish() never waits and replaces any value the consumer has not taken.
  class BurstSlot
  {
  public:
    BurstSlot() = default;
    BurstSlot(const BurstSlot &) = delete;
    BurstSlot &operator=(const BurstSlot &) = delete;

    // Producer side
    necir::Burst &back() { return buffers_[back_]; }
    void publish();

    // Consumer side
    bool pending() const;
    bool take(necir::Burst &out);
    void discard();

  private:
    static constexpr uint8_t kIndexMask = 0x03;
    static constexpr uint8_t kFresh = 0x04;

    necir::Burst buffers_[3];
    uint8_t back_{0};
    uint8_t front_{2};
    std::atomic<uint8_t> middle_{1};
  };

  // Drains a PulseSource, converts tick counts to microseconds and keeps the
  // most recent command burst and repeat burst for the decoder.
  class AcquisitionBuffer
  {
  public:
    explicit AcquisitionBuffer(necir::PulseSource &source);
    AcquisitionBuffer(const AcquisitionBuffer &) = delete;
    AcquisitionBuffer &operator=(const AcquisitionBuffer &) = delete;

    // Periodic tick: drain everything the source holds right now.
    void service();
    // Feed one raw value.
    void push(uint32_t value);
    // Forget a partially accumulated burst.
    void reset();

    bool commandReady() const { return command_.pending(); }
    bool repeatReady() const { return repeat_.pending(); }
    bool takeCommand(necir::Burst &out) { return command_.take(out); }
    bool takeRepeat(necir::Burst &out) { return repeat_.take(out); }
    void discardCommand() { command_.discard(); }

    uint32_t overflowCount() const { return overflowCount_.load(std::memory_order_relaxed); }

    static uint32_t ticksToUs(uint32_t ticks, uint32_t frequencyHz);

  private:
    void finalize();

    necir::PulseSource &source_;
    uint32_t ticks_[necir::kMaxBurstValues]{};
    uint16_t tickCount_{0};
    bool truncated_{false};
    std::atomic<uint32_t> overflowCount_{0};
    necir::BurstSlot command_;
    necir::BurstSlot repeat_;
  };

} // namespace necir
