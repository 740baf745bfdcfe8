#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "util/spsc_ring.hpp"

TEST(SpscRingTest, FullRingRejectsWithoutConsuming) {
    SpscRing<std::string, 4> ring;
    EXPECT_EQ(ring.capacity(), 3u);

    for (int i = 0; i < 3; ++i) {
        std::string frame = "f" + std::to_string(i);
        ASSERT_TRUE(ring.try_push(std::move(frame)));
    }
    std::string extra = "dropped";
    EXPECT_FALSE(ring.try_push(std::move(extra)));
    EXPECT_EQ(extra, "dropped");
    EXPECT_EQ(ring.size(), 3u);

    std::string out;
    ASSERT_TRUE(ring.try_pop(out));
    EXPECT_EQ(out, "f0");
    EXPECT_EQ(ring.size(), 2u);
}

TEST(SpscRingTest, WrapsAround) {
    SpscRing<int, 4> ring;
    int out = 0;
    for (int i = 0; i < 10; ++i) {
        int v = i;
        ASSERT_TRUE(ring.try_push(std::move(v)));
        ASSERT_TRUE(ring.try_pop(out));
        EXPECT_EQ(out, i);
    }
    EXPECT_TRUE(ring.empty());
    EXPECT_FALSE(ring.try_pop(out));
}

TEST(SpscRingTest, PreservesOrderAcrossThreads) {
    SpscRing<int, 64> ring;
    constexpr int kCount = 100000;

    std::thread producer([&] {
        for (int i = 0; i < kCount; ++i) {
            int v = i;
            while (!ring.try_push(std::move(v))) std::this_thread::yield();
        }
    });

    int expected = 0;
    int out = 0;
    while (expected < kCount) {
        if (ring.try_pop(out)) {
            EXPECT_EQ(out, expected);
            ++expected;
        }
    }
    producer.join();
}
