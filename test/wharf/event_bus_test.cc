#include <gtest/gtest.h>
#include "../../src/wharf/event_bus.h"

using namespace Wharf;

class EventBusTest : public ::testing::Test {
protected:
    EventBus bus_;
};

TEST_F(EventBusTest, PublishWithoutSubscribers) {
    EXPECT_EQ(bus_.SubscriberCount(EventBus::EventType::PAGE_REAPED), 0u);
    bus_.Publish(EventBus::EventType::PAGE_REAPED, PageReapedEvent{MessageOrigin::Here(), 1});
    SUCCEED();
}

TEST_F(EventBusTest, SubscriberReceivesPayload) {
    bool received = false;
    MessageOverweightEvent seen;
    bus_.Subscribe<MessageOverweightEvent>(
        EventBus::EventType::MESSAGE_OVERWEIGHT,
        [&](const MessageOverweightEvent& event) {
            received = true;
            seen = event;
        }
    );

    bus_.Publish(EventBus::EventType::MESSAGE_OVERWEIGHT,
                 MessageOverweightEvent{MessageOrigin::Sibling(3), 9, "too heavy"});

    EXPECT_TRUE(received);
    EXPECT_EQ(seen.origin, MessageOrigin::Sibling(3));
    EXPECT_EQ(seen.handle, 9u);
    EXPECT_EQ(seen.reason, "too heavy");
}

TEST_F(EventBusTest, MultipleSubscribers) {
    int call_count = 0;
    for (int i = 0; i < 3; ++i) {
        bus_.Subscribe<OverweightDiscardedEvent>(
            EventBus::EventType::OVERWEIGHT_DISCARDED,
            [&call_count](const OverweightDiscardedEvent& event) {
                call_count++;
                EXPECT_EQ(event.handle, 4u);
            }
        );
    }
    EXPECT_EQ(bus_.SubscriberCount(EventBus::EventType::OVERWEIGHT_DISCARDED), 3u);

    bus_.Publish(EventBus::EventType::OVERWEIGHT_DISCARDED, OverweightDiscardedEvent{4});
    EXPECT_EQ(call_count, 3);
}

TEST_F(EventBusTest, EventTypesAreIsolated) {
    int reaped = 0;
    bus_.Subscribe<PageReapedEvent>(
        EventBus::EventType::PAGE_REAPED,
        [&reaped](const PageReapedEvent&) { reaped++; }
    );

    bus_.Publish(EventBus::EventType::PAGE_QUARANTINED,
                 PageQuarantinedEvent{MessageOrigin::Parent(), 0, "bad"});
    EXPECT_EQ(reaped, 0);
}

TEST_F(EventBusTest, HandlerMaySubscribeDuringPublish) {
    int inner_calls = 0;
    bus_.Subscribe<PageReapedEvent>(
        EventBus::EventType::PAGE_REAPED,
        [&](const PageReapedEvent&) {
            bus_.Subscribe<PageReapedEvent>(
                EventBus::EventType::PAGE_REAPED,
                [&inner_calls](const PageReapedEvent&) { inner_calls++; }
            );
        }
    );

    bus_.Publish(EventBus::EventType::PAGE_REAPED, PageReapedEvent{MessageOrigin::Here(), 0});
    EXPECT_EQ(inner_calls, 0);
    EXPECT_EQ(bus_.SubscriberCount(EventBus::EventType::PAGE_REAPED), 2u);
}
