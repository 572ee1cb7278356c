#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>

#include "oscwire/Types.h"

using namespace oscwire;

namespace {
    constexpr uint32_t UNIX_EPOCH_NTP_SECONDS = 2208988800u;
}

TEST(TimeTag, Immediate) {
    TimeTag tag = TimeTag::immediate();
    EXPECT_TRUE(tag.isImmediate());
    EXPECT_EQ(tag.toNTP(), 1u);
    EXPECT_EQ(TimeTag(), tag);
    EXPECT_TRUE(TimeTag(uint64_t{1}).isImmediate());
    EXPECT_FALSE(TimeTag(uint64_t{0}).isImmediate());
}

TEST(TimeTag, NtpParts) {
    TimeTag tag(0x83AA7E80ABCDEF01ull);
    EXPECT_EQ(tag.seconds(), 0x83AA7E80u);
    EXPECT_EQ(tag.fraction(), 0xABCDEF01u);
    EXPECT_EQ(tag.toNTP(), 0x83AA7E80ABCDEF01ull);
    EXPECT_EQ(TimeTag(0x83AA7E80u, 0xABCDEF01u), tag);
}

TEST(TimeTag, Ordering) {
    TimeTag early(100, 0xFFFFFFFFu);
    TimeTag late(101, 0);

    EXPECT_LT(early, late);
    EXPECT_GT(late, early);
    EXPECT_LE(early, early);
    EXPECT_GE(late, early);
    EXPECT_NE(early, late);
    EXPECT_LT(TimeTag(100, 1), TimeTag(100, 2));
}

TEST(TimeTag, UnixEpochConversion) {
    std::chrono::system_clock::time_point epoch{};
    TimeTag tag(epoch);
    EXPECT_EQ(tag.seconds(), UNIX_EPOCH_NTP_SECONDS);
    EXPECT_EQ(tag.fraction(), 0u);
    EXPECT_EQ(tag.toTimePoint(), epoch);
}

TEST(TimeTag, HalfSecondFraction) {
    auto halfSecond = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    TimeTag tag(halfSecond);
    EXPECT_EQ(tag.seconds(), UNIX_EPOCH_NTP_SECONDS + 1);
    EXPECT_EQ(tag.fraction(), 0x80000000u);
    EXPECT_EQ(tag.toTimePoint(), halfSecond);
}

TEST(TimeTag, NowIsCloseToSystemClock) {
    auto before = std::chrono::system_clock::now();
    TimeTag tag = TimeTag::now();
    auto after = std::chrono::system_clock::now();

    EXPECT_FALSE(tag.isImmediate());
    EXPECT_GE(tag, TimeTag(before));
    auto roundTrip = tag.toTimePoint();
    EXPECT_LE(std::chrono::duration_cast<std::chrono::microseconds>(before - roundTrip).count(), 1);
    EXPECT_LE(std::chrono::duration_cast<std::chrono::microseconds>(roundTrip - after).count(), 1);
}
