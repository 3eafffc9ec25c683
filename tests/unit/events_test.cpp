#include <gtest/gtest.h>
#include <stdexcept>
#include "bytepath/core/events.hpp"

class EventChannelTest : public ::testing::Test {
protected:
    EventChannel<GameEvent> channel;

    static GameEvent death(float x, float y) {
        return GameEvent{GameEventType::PlayerDeath, Vector(x, y)};
    }
};

TEST_F(EventChannelTest, EachReaderSeesEveryEventOnce) {
    ReaderId a = channel.registerReader();
    ReaderId b = channel.registerReader();

    channel.send(death(1.0f, 2.0f));
    channel.send(GameEvent{GameEventType::ProjectileDeath, Vector(3.0f, 4.0f)});

    auto fromA = channel.read(a);
    ASSERT_EQ(fromA.size(), 2u);
    EXPECT_EQ(fromA[0].type, GameEventType::PlayerDeath);
    EXPECT_EQ(fromA[1].type, GameEventType::ProjectileDeath);
    EXPECT_TRUE(channel.read(a).empty());

    EXPECT_EQ(channel.unreadCount(b), 2u);
    EXPECT_EQ(channel.read(b).size(), 2u);
}

TEST_F(EventChannelTest, ReaderStartsAtCurrentEnd) {
    channel.send(death(0.0f, 0.0f));
    ReaderId late = channel.registerReader();
    EXPECT_TRUE(channel.read(late).empty());

    channel.send(death(5.0f, 5.0f));
    auto events = channel.read(late);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FLOAT_EQ(events[0].position.x, 5.0f);
}

TEST_F(EventChannelTest, UpdateClearsBuffer) {
    ReaderId reader = channel.registerReader();
    channel.send(death(0.0f, 0.0f));
    channel.update();
    EXPECT_TRUE(channel.empty());
    EXPECT_TRUE(channel.read(reader).empty());

    channel.send(death(1.0f, 1.0f));
    EXPECT_EQ(channel.read(reader).size(), 1u);
}

TEST_F(EventChannelTest, UnregisteredReaderThrows) {
    ReaderId invalid;
    EXPECT_THROW(channel.read(invalid), std::logic_error);

    ReaderId foreign;
    foreign.index = 3;
    EXPECT_THROW(channel.unreadCount(foreign), std::logic_error);
}
