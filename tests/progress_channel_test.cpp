#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "infra/monitoring/progress_channel.hpp"
#include "test_utils.hpp"

using treecp::infra::ProgressChannel;
using treecp::infra::ProgressPump;
using treecp::test::RecordingSink;

TEST(ProgressChannelTest, ReceiveReturnsZeroAfterCloseAndDrain)
{
    ProgressChannel channel{4};
    auto sender = channel.sender();
    sender.send();
    sender.send();
    channel.close();

    EXPECT_EQ(channel.receive(), 2u);
    EXPECT_EQ(channel.receive(), 0u);
}

TEST(ProgressChannelTest, CapacityIsAtLeastOne)
{
    ProgressChannel channel{0};
    EXPECT_EQ(channel.capacity(), 1u);
}

TEST(ProgressChannelTest, SendBlocksWhileFull)
{
    ProgressChannel channel{1};
    auto sender = channel.sender();
    sender.send();

    auto blocked = std::async(std::launch::async, [sender] { sender.send(); });
    EXPECT_EQ(blocked.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    EXPECT_EQ(channel.receive(), 1u);
    blocked.get();
    EXPECT_EQ(channel.receive(), 1u);
}

TEST(ProgressPumpTest, EveryTickReachesSink)
{
    RecordingSink sink;
    constexpr int writers = 8;
    constexpr int per_writer = 500;
    {
        ProgressPump pump{sink, 2};
        std::vector<std::jthread> threads;
        for (int w = 0; w < writers; ++w) {
            threads.emplace_back([sender = pump.sender()] {
                for (int i = 0; i < per_writer; ++i) sender.send();
            });
        }
        threads.clear(); // join
        pump.drain_and_stop();
    }
    EXPECT_EQ(sink.advanced(), static_cast<std::uint64_t>(writers * per_writer));
    EXPECT_EQ(sink.finish_calls(), 0);
}

TEST(ProgressPumpTest, DestructorStopsConsumer)
{
    RecordingSink sink;
    {
        ProgressPump pump{sink, 8};
        pump.sender().send();
    }
    EXPECT_EQ(sink.advanced(), 1u);
}
