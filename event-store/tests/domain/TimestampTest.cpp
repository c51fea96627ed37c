#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"

using eventstore::domain::Timestamp;

TEST(TimestampTest, FromString_WithMillis_RoundTripsToString) {
    auto ts = Timestamp::fromString("2025-12-16T10:30:00.123Z");

    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00.123Z");
    EXPECT_EQ(ts.toUnixMillis() % 1000, 123);
}

TEST(TimestampTest, FromString_WithoutFraction_ZeroMillis) {
    auto ts = Timestamp::fromString("1970-01-01T00:00:10Z");

    EXPECT_EQ(ts.toUnixMillis(), 10000);
}

TEST(TimestampTest, FromString_Garbage_Throws) {
    EXPECT_THROW(Timestamp::fromString("yesterday"), std::invalid_argument);
}

TEST(TimestampTest, Now_IsMillisecondTruncated) {
    auto ts = Timestamp::now();
    EXPECT_EQ(Timestamp::fromUnixMillis(ts.toUnixMillis()), ts);
}
