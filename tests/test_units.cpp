#include "streamdl/units.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>

using namespace streamdl;

TEST(UnitsTest, BytesBelowOneKibAreWholeNumbers) {
    EXPECT_EQ(formatBytes(0), "  0 B");
    EXPECT_EQ(formatBytes(7), "  7 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
    EXPECT_EQ(formatBytes(512, true), "512 B/s");
}

TEST(UnitsTest, LargerSizesHaveOneDecimal) {
    EXPECT_EQ(formatBytes(1024), "  1.0 KiB");
    EXPECT_EQ(formatBytes(1536), "  1.5 KiB");
    EXPECT_EQ(formatBytes(1024 * 1024 - 1), "1024.0 KiB");
    EXPECT_EQ(formatBytes(1024 * 1024), "  1.0 MiB");
    EXPECT_EQ(formatBytes(5ULL * 1024 * 1024 + 512 * 1024), "  5.5 MiB");
    EXPECT_EQ(formatBytes(1024ULL * 1024 * 1024), "  1.0 GiB");
    EXPECT_EQ(formatBytes(3ULL * 1024 * 1024 * 1024, true), "  3.0 GiB/s");
}

TEST(UnitsTest, UnitThresholds) {
    const std::uint64_t samples[] = {1, 1023, 1024, 1048575, 1048576, 1073741823, 1073741824};
    for (const auto b : samples) {
        const std::string text = formatBytes(b);
        if (b < 1024) {
            EXPECT_NE(text.find(" B"), std::string::npos) << b;
            EXPECT_EQ(text.find('.'), std::string::npos) << b;
        } else if (b < 1024 * 1024) {
            EXPECT_NE(text.find("KiB"), std::string::npos) << b;
        } else if (b < 1024ULL * 1024 * 1024) {
            EXPECT_NE(text.find("MiB"), std::string::npos) << b;
        } else {
            EXPECT_NE(text.find("GiB"), std::string::npos) << b;
        }
        if (b >= 1024) {
            const auto dot = text.find('.');
            ASSERT_NE(dot, std::string::npos) << b;
            EXPECT_EQ(text[dot + 2], ' ') << b;
        }
    }
}

TEST(UnitsTest, SplitDurationRecomposes) {
    const std::uint64_t samples[] = {0, 1, 59, 60, 61, 3599, 3600, 3661, 86399, 86400, 90061, 1000000};
    for (const auto d : samples) {
        const DurationParts p = splitDuration(d);
        EXPECT_EQ(p.days * 86400 + p.hours * 3600u + p.minutes * 60u + p.seconds, d) << d;
        EXPECT_LT(p.hours, 24) << d;
        EXPECT_LT(p.minutes, 60) << d;
        EXPECT_LT(p.seconds, 60) << d;
    }

    const DurationParts p = splitDuration(90061);
    EXPECT_EQ(p.days, 1u);
    EXPECT_EQ(p.hours, 1);
    EXPECT_EQ(p.minutes, 1);
    EXPECT_EQ(p.seconds, 1);
}

TEST(UnitsTest, DurationDropsLeadingZeroComponents) {
    using std::chrono::seconds;
    EXPECT_EQ(formatDuration(seconds{0}), " 0s");
    EXPECT_EQ(formatDuration(seconds{15}), "15s");
    EXPECT_EQ(formatDuration(seconds{65}), " 1m  5s");
    EXPECT_EQ(formatDuration(seconds{3600}), " 1h  0m  0s");
    EXPECT_EQ(formatDuration(seconds{86400 + 5}), "  1d  0h  0m  5s");
    EXPECT_EQ(formatDuration(seconds{-3}), " 0s");
}
