#include "transport/delivery_channel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <variant>

using namespace mlld::transport;
using namespace std::chrono_literals;

TEST(DeliveryChannelTest, DeliversMessagesInOrder) {
    auto [sender, receiver] = make_channel();

    ASSERT_TRUE(sender.send(EventMessage{{{"seq", 1}}}));
    ASSERT_TRUE(sender.send(EventMessage{{{"seq", 2}}}));
    ASSERT_TRUE(sender.send(ResultMessage{{{"output", "done"}}}));

    TransportMessage message;
    ASSERT_EQ(receiver.recv(message), RecvStatus::OK);
    EXPECT_EQ(std::get<EventMessage>(message).payload["seq"], 1);
    EXPECT_FALSE(is_terminal(message));

    ASSERT_EQ(receiver.recv(message), RecvStatus::OK);
    EXPECT_EQ(std::get<EventMessage>(message).payload["seq"], 2);

    ASSERT_EQ(receiver.recv(message), RecvStatus::OK);
    EXPECT_TRUE(is_terminal(message));
    EXPECT_EQ(std::get<ResultMessage>(message).payload["output"], "done");
}

TEST(DeliveryChannelTest, RecvTimeoutExpiresWhenNothingArrives) {
    auto [sender, receiver] = make_channel();

    TransportMessage message;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(receiver.recv_timeout(message, 30ms), RecvStatus::TIMEOUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(DeliveryChannelTest, DroppedSenderDisconnectsAfterQueueDrains) {
    auto [sender, receiver] = make_channel();
    sender.send(ClosedMessage{"worker exited"});
    sender.reset();

    TransportMessage message;
    ASSERT_EQ(receiver.recv_timeout(message, 100ms), RecvStatus::OK);
    EXPECT_EQ(std::get<ClosedMessage>(message).reason, "worker exited");
    EXPECT_EQ(receiver.recv_timeout(message, 100ms), RecvStatus::DISCONNECTED);
}

TEST(DeliveryChannelTest, DroppedSenderWakesBlockedReceiver) {
    auto [sender, receiver] = make_channel();

    std::thread dropper([s = std::move(sender)]() mutable {
        std::this_thread::sleep_for(20ms);
        s.reset();
    });

    TransportMessage message;
    EXPECT_EQ(receiver.recv(message), RecvStatus::DISCONNECTED);
    dropper.join();
}

TEST(DeliveryChannelTest, SendAfterReceiverDroppedFails) {
    auto [sender, receiver] = make_channel();
    receiver.reset();

    EXPECT_FALSE(sender.send(ResultMessage{{{"late", true}}}));
}

TEST(DeliveryChannelTest, UnboundEndsAreInert) {
    ChannelSender sender;
    ChannelReceiver receiver;
    TransportMessage message;

    EXPECT_FALSE(sender.valid());
    EXPECT_FALSE(sender.send(EventMessage{}));
    EXPECT_FALSE(receiver.valid());
    EXPECT_EQ(receiver.recv(message), RecvStatus::DISCONNECTED);
}

TEST(DeliveryChannelTest, MovedReceiverKeepsChannel) {
    auto [sender, receiver] = make_channel();
    ChannelReceiver moved = std::move(receiver);

    EXPECT_FALSE(receiver.valid());
    ASSERT_TRUE(moved.valid());
    ASSERT_TRUE(sender.send(ResultMessage{{{"id", 1}}}));

    TransportMessage message;
    EXPECT_EQ(moved.recv_timeout(message, 100ms), RecvStatus::OK);
}
