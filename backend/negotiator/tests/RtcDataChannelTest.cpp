#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <rtc/rtc.hpp>

#include "dispatcher/Dispatcher.hpp"
#include "rtc/RtcDataChannel.hpp"

using negotiator::dispatch::Dispatcher;
using negotiator::rtc::RtcDataChannel;

class RtcDataChannelTest : public ::testing::Test {
protected:
    Dispatcher dispatcher;
    ::rtc::PeerConnection peerConnection;

    void SetUp() override { dispatcher.start(); }
    void TearDown() override { dispatcher.stop(); }

    void drainDispatcher() {
        std::promise<void> drained;
        dispatcher.post([&drained]() { drained.set_value(); });
        drained.get_future().wait();
    }
};

TEST_F(RtcDataChannelTest, ExposesUnderlyingChannel) {
    auto channel = peerConnection.createDataChannel("chat");
    auto wrapper = RtcDataChannel::wrap(dispatcher, channel);

    EXPECT_EQ(wrapper->label(), "chat");
    EXPECT_FALSE(wrapper->isOpen());
}

TEST_F(RtcDataChannelTest, CallbacksAfterWrapperDestroyedAreDropped) {
    auto channel = peerConnection.createDataChannel("chat");
    bool closeSeen = false;
    {
        auto wrapper = RtcDataChannel::wrap(dispatcher, channel);
        wrapper->onClose = [&closeSeen]() { closeSeen = true; };
    }

    channel->close();
    drainDispatcher();

    EXPECT_FALSE(closeSeen);
}
