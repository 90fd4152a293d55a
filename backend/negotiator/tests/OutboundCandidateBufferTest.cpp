#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "FakeTransport.hpp"
#include "session/OutboundCandidateBuffer.hpp"

using namespace negotiator;
using negotiator::session::CandidateListener;
using negotiator::session::OutboundCandidateBuffer;
using negotiator::test::candidate;

class OutboundCandidateBufferTest : public ::testing::Test {
protected:
    OutboundCandidateBuffer buffer;

    CandidateListener recorder(std::vector<std::string>& events) {
        return CandidateListener{
            [&events](const signaling::IceCandidate& c) { events.push_back(c.candidate); },
            [&events]() { events.push_back("done"); }
        };
    }
};

TEST_F(OutboundCandidateBufferTest, BuffersUntilFirstSubscriberAndReplaysInOrder) {
    buffer.onDiscovered(candidate("c1"));
    buffer.onDiscovered(candidate("c2"));
    buffer.onDiscovered(std::nullopt);
    EXPECT_EQ(buffer.buffered(), 3u);
    EXPECT_TRUE(buffer.gatheringDone());
    EXPECT_FALSE(buffer.hasListeners());

    std::vector<std::string> events;
    buffer.subscribe(recorder(events));
    EXPECT_TRUE(buffer.hasListeners());

    EXPECT_EQ(events, (std::vector<std::string>{"c1", "c2", "done"}));
    EXPECT_EQ(buffer.buffered(), 0u);
}

TEST_F(OutboundCandidateBufferTest, LiveEventsFollowReplayWithoutDuplicates) {
    buffer.onDiscovered(candidate("c1"));

    std::vector<std::string> events;
    buffer.subscribe(recorder(events));
    buffer.onDiscovered(candidate("c2"));
    buffer.onDiscovered(std::nullopt);

    EXPECT_EQ(events, (std::vector<std::string>{"c1", "c2", "done"}));
    EXPECT_EQ(buffer.buffered(), 0u);
}

TEST_F(OutboundCandidateBufferTest, LaterSubscribersReceiveLiveEventsOnly) {
    buffer.onDiscovered(candidate("c1"));

    std::vector<std::string> first;
    std::vector<std::string> second;
    buffer.subscribe(recorder(first));
    buffer.subscribe(recorder(second));
    buffer.onDiscovered(candidate("c2"));

    EXPECT_EQ(first, (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(second, std::vector<std::string>{"c2"});
}

TEST_F(OutboundCandidateBufferTest, ReplayFiltersByListenerKind) {
    buffer.onDiscovered(candidate("c1"));
    buffer.onDiscovered(std::nullopt);

    std::vector<std::string> events;
    buffer.subscribe(CandidateListener{{}, [&events]() { events.push_back("done"); }});

    EXPECT_EQ(events, std::vector<std::string>{"done"});
}

TEST_F(OutboundCandidateBufferTest, CompletionMarkerSkippedWhenGatheringRestarted) {
    buffer.onDiscovered(candidate("c1"));
    buffer.onDiscovered(std::nullopt);
    buffer.onDiscovered(candidate("c2"));
    EXPECT_FALSE(buffer.gatheringDone());

    std::vector<std::string> events;
    buffer.subscribe(recorder(events));

    EXPECT_EQ(events, (std::vector<std::string>{"c1", "c2"}));
}

TEST_F(OutboundCandidateBufferTest, RepeatedCompletionDeliveredOnce) {
    std::vector<std::string> events;
    buffer.subscribe(recorder(events));

    buffer.onDiscovered(std::nullopt);
    buffer.onDiscovered(std::nullopt);
    EXPECT_EQ(events, std::vector<std::string>{"done"});

    buffer.onDiscovered(candidate("restart"));
    EXPECT_FALSE(buffer.gatheringDone());
    buffer.onDiscovered(std::nullopt);
    EXPECT_EQ(events, (std::vector<std::string>{"done", "restart", "done"}));
    EXPECT_TRUE(buffer.gatheringDone());
}

TEST_F(OutboundCandidateBufferTest, RepeatedCompletionBufferedOnce) {
    buffer.onDiscovered(std::nullopt);
    buffer.onDiscovered(std::nullopt);
    EXPECT_EQ(buffer.buffered(), 1u);
}

TEST_F(OutboundCandidateBufferTest, ListenerSubscribingDuringDeliveryJoinsFromNextEvent) {
    std::vector<std::string> events;
    std::vector<std::string> late;
    buffer.subscribe(CandidateListener{
        [&](const signaling::IceCandidate& c) {
            events.push_back(c.candidate);
            if (late.empty() && events.size() == 1)
                buffer.subscribe(recorder(late));
        },
        {}
    });

    buffer.onDiscovered(candidate("c1"));
    buffer.onDiscovered(candidate("c2"));

    EXPECT_EQ(events, (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(late, std::vector<std::string>{"c2"});
}
