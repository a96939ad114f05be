#include "core/decoder.h"
#include "core/pulse_forward.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <vector>

using necir_test::FakePulseSource;

namespace
{
    // Bounded queue in front of the drain, like the RMT ISR's FreeRTOS queue.
    struct BoundedQueue
    {
        explicit BoundedQueue(size_t capacity) : capacity(capacity) {}

        size_t spaces() const { return capacity - values.size(); }
        bool push(uint32_t v)
        {
            if (values.size() >= capacity)
                return false;
            values.push_back(v);
            return true;
        }
        std::vector<uint32_t> takeAll()
        {
            std::vector<uint32_t> out;
            out.swap(values);
            return out;
        }

        size_t capacity;
        std::vector<uint32_t> values;
    };

    // Captured (low, high) tick pairs, without the marker.
    std::vector<uint32_t> pairsOf(const std::vector<uint32_t> &ticks)
    {
        return std::vector<uint32_t>(ticks.begin(), ticks.end() - 1);
    }

    bool forward(BoundedQueue &queue, const std::vector<uint32_t> &pairs)
    {
        auto pairAt = [&pairs](size_t i, uint32_t &low, uint32_t &high)
        {
            low = pairs[i * 2];
            high = pairs[i * 2 + 1];
        };
        return necir::forwardBurst(queue, pairs.size() / 2, pairAt);
    }
} // namespace

TEST(ForwardBurst, FittingBurstIsQueuedWithMarker)
{
    BoundedQueue queue(256);
    std::vector<uint32_t> ticks = necir_test::commandTicks(0x00FF9867);
    EXPECT_TRUE(forward(queue, pairsOf(ticks)));
    EXPECT_EQ(ticks, queue.values);
}

TEST(ForwardBurst, ExactFitIsQueued)
{
    BoundedQueue queue(3);
    EXPECT_TRUE(forward(queue, pairsOf(necir_test::repeatTicks())));
    EXPECT_EQ(necir_test::repeatTicks(), queue.values);
}

TEST(ForwardBurst, OversizedBurstLeavesOnlyMarker)
{
    BoundedQueue queue(10);
    EXPECT_FALSE(forward(queue, pairsOf(necir_test::commandTicks(0x00FF9867))));
    ASSERT_EQ(1u, queue.values.size());
    EXPECT_EQ(necir::kPulseTimeoutMarker, queue.values[0]);
}

TEST(ForwardBurst, FullQueueDropsEverything)
{
    BoundedQueue queue(2);
    queue.push(1);
    queue.push(2);
    EXPECT_FALSE(forward(queue, pairsOf(necir_test::repeatTicks())));
    EXPECT_EQ(2u, queue.values.size());
}

TEST(ForwardBurst, OverflowDoesNotCostTheNextPress)
{
    FakePulseSource source;
    necir::AcquisitionBuffer acquisition(source);
    necir::Decoder decoder(acquisition);
    // Room for one full frame (66 values + marker) but not two.
    BoundedQueue queue(100);

    EXPECT_TRUE(forward(queue, pairsOf(necir_test::commandTicks(0x00FF9867))));
    EXPECT_FALSE(forward(queue, pairsOf(necir_test::commandTicks(0x00FFA25D))));
    source.feed(queue.takeAll());
    acquisition.service();
    ASSERT_TRUE(decoder.decode());
    EXPECT_EQ(0x00FF9867u, decoder.commandCode());

    EXPECT_TRUE(forward(queue, pairsOf(necir_test::commandTicks(0x00FF629D))));
    source.feed(queue.takeAll());
    acquisition.service();
    ASSERT_TRUE(decoder.decode());
    EXPECT_EQ(0x00FF629Du, decoder.commandCode());
    EXPECT_EQ(0u, acquisition.overflowCount());
}
