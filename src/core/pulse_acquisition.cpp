#include "pulse_acquisition.h"

namespace necir
{

    void BurstSlot::publish()
    {
        uint8_t prev = middle_.exchange(static_cast<uint8_t>(back_ | kFresh), std::memory_order_acq_rel);
        back_ = prev & kIndexMask;
    }

    bool BurstSlot::pending() const
    {
        return (middle_.load(std::memory_order_acquire) & kFresh) != 0;
    }

    bool BurstSlot::take(necir::Burst &out)
    {
        if (!pending())
        {
            return false;
        }
        uint8_t prev = middle_.exchange(front_, std::memory_order_acq_rel);
        front_ = prev & kIndexMask;
        out = buffers_[front_];
        return true;
    }

    void BurstSlot::discard()
    {
        if (!pending())
        {
            return;
        }
        uint8_t prev = middle_.exchange(front_, std::memory_order_acq_rel);
        front_ = prev & kIndexMask;
    }

    AcquisitionBuffer::AcquisitionBuffer(necir::PulseSource &source)
        : source_(source) {}

    uint32_t AcquisitionBuffer::ticksToUs(uint32_t ticks, uint32_t frequencyHz)
    {
        if (frequencyHz == 0)
        {
            return 0;
        }
        uint64_t us = static_cast<uint64_t>(ticks) * 2000000ULL / frequencyHz;
        return us > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(us);
    }

    void AcquisitionBuffer::service()
    {
        uint32_t value = 0;
        while (source_.read(value))
        {
            push(value);
        }
    }

    void AcquisitionBuffer::push(uint32_t value)
    {
        if (value == necir::kPulseTimeoutMarker)
        {
            finalize();
            return;
        }
        if (tickCount_ >= necir::kMaxBurstValues)
        {
            truncated_ = true;
            return;
        }
        ticks_[tickCount_++] = value;
    }

    void AcquisitionBuffer::reset()
    {
        tickCount_ = 0;
        truncated_ = false;
    }

    void AcquisitionBuffer::finalize()
    {
        const uint32_t hz = source_.frequencyHz();
        if (truncated_)
        {
            overflowCount_.fetch_add(1, std::memory_order_relaxed);
        }
        else if (hz != 0 && tickCount_ >= 2)
        {
            // Exactly two values is a repeat marker, anything longer a command.
            necir::BurstSlot &slot = (tickCount_ == 2) ? repeat_ : command_;
            necir::Burst &out = slot.back();
            out.clear();
            for (uint16_t i = 0; i < tickCount_; ++i)
            {
                out.append(ticksToUs(ticks_[i], hz));
            }
            slot.publish();
        }
        reset();
    }

} // namespace necir
