/// @file event_window_test.cpp
/// @brief Tests for the fixed-capacity event ring buffer

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "session/event_window.h"

namespace turnguard::session {
namespace {

TEST(EventWindowTest, StartsEmpty) {
    EventWindow<int, 4> window;

    EXPECT_TRUE(window.Empty());
    EXPECT_EQ(window.Size(), 0u);
    EXPECT_EQ(window.MaxSize(), 4u);
}

TEST(EventWindowTest, GrowsUntilFull) {
    EventWindow<int, 4> window;
    window.Push(1);
    window.Push(2);
    window.Push(3);

    ASSERT_EQ(window.Size(), 3u);
    EXPECT_EQ(window[0], 1);
    EXPECT_EQ(window[2], 3);
    EXPECT_EQ(window.Back(), 3);
}

TEST(EventWindowTest, OverwritesOldestWhenFull) {
    EventWindow<int, 3> window;
    for (int i = 1; i <= 7; ++i) {
        window.Push(i);
    }

    ASSERT_EQ(window.Size(), 3u);
    EXPECT_EQ(window[0], 5);
    EXPECT_EQ(window[1], 6);
    EXPECT_EQ(window[2], 7);
    EXPECT_EQ(window.Back(), 7);
}

TEST(EventWindowTest, AtChecksBounds) {
    EventWindow<int, 2> window;
    window.Push(10);

    EXPECT_EQ(window.At(0), 10);
    EXPECT_THROW(window.At(1), std::out_of_range);
}

TEST(EventWindowTest, EmptyWindowAtThrows) {
    EventWindow<int, 3> window;

    EXPECT_THROW(window.At(0), std::out_of_range);
    EXPECT_EQ(window.TailStart(5), 0u);
}

TEST(EventWindowTest, WrapsRepeatedlyWithFixedCapacity) {
    EventWindow<std::string, 4> window;
    for (int i = 0; i < 4 * 25 + 2; ++i) {
        window.Push("e" + std::to_string(i));
        ASSERT_LE(window.Size(), window.MaxSize());
    }

    ASSERT_EQ(window.Size(), 4u);
    EXPECT_EQ(window[0], "e98");
    EXPECT_EQ(window[1], "e99");
    EXPECT_EQ(window[2], "e100");
    EXPECT_EQ(window.Back(), "e101");
}

TEST(EventWindowTest, TailStart) {
    EventWindow<int, 10> window;
    for (int i = 0; i < 6; ++i) {
        window.Push(i);
    }

    EXPECT_EQ(window.TailStart(2), 4u);
    EXPECT_EQ(window.TailStart(6), 0u);
    EXPECT_EQ(window.TailStart(50), 0u);
    EXPECT_EQ(window[window.TailStart(2)], 4);
}

}  // namespace
}  // namespace turnguard::session
