#include <gtest/gtest.h>

#include "speed/SpeedRating.h"

TEST(SpeedRatingTest, AverageSpeedBuckets)
{
    EXPECT_EQ(SpeedRating::forSpeed(950.0), "Excellent (USB3.0+)");
    EXPECT_EQ(SpeedRating::forSpeed(400.0), "Excellent (USB3.0+)");
    EXPECT_EQ(SpeedRating::forSpeed(399.9), "Very Good (USB3.0)");
    EXPECT_EQ(SpeedRating::forSpeed(200.0), "Very Good (USB3.0)");
    EXPECT_EQ(SpeedRating::forSpeed(60.0), "Good (USB2.0 High-Speed)");
    EXPECT_EQ(SpeedRating::forSpeed(37.5), "Moderate (USB2.0)");
    EXPECT_EQ(SpeedRating::forSpeed(10.0), "Moderate (USB2.0)");
    EXPECT_EQ(SpeedRating::forSpeed(1.0), "Slow (USB1.1)");
    EXPECT_EQ(SpeedRating::forSpeed(0.99), "Very Slow");
    EXPECT_EQ(SpeedRating::forSpeed(0.0), "Very Slow");
}

TEST(SpeedRatingTest, TheoreticalSpeedFromLinkLabel)
{
    EXPECT_DOUBLE_EQ(SpeedRating::theoreticalSpeedMbps("480 Mb/s"), 60.0);
    EXPECT_DOUBLE_EQ(SpeedRating::theoreticalSpeedMbps("5 Gb/s"), 625.0);
    EXPECT_DOUBLE_EQ(SpeedRating::theoreticalSpeedMbps("10 Gb/s"), 1250.0);
    EXPECT_DOUBLE_EQ(SpeedRating::theoreticalSpeedMbps("Super Speed (5 Gb/s)"), 625.0);
    EXPECT_DOUBLE_EQ(SpeedRating::theoreticalSpeedMbps("12 Mb/s"), 0.0);
}

TEST(SpeedRatingTest, CableQualityFromEfficiency)
{
    EXPECT_EQ(SpeedRating::cableQuality("480 Mb/s", 50.0), "Excellent Cable (>80% efficiency)");
    EXPECT_EQ(SpeedRating::cableQuality("480 Mb/s", 48.0), "Excellent Cable (>80% efficiency)");
    EXPECT_EQ(SpeedRating::cableQuality("480 Mb/s", 40.0), "Good Cable (60-80% efficiency)");
    EXPECT_EQ(SpeedRating::cableQuality("5 Gb/s", 300.0), "Moderate Cable (40-60% efficiency)");
    EXPECT_EQ(SpeedRating::cableQuality("10 Gb/s", 300.0), "Poor Cable (20-40% efficiency)");
    EXPECT_EQ(SpeedRating::cableQuality("10 Gb/s", 100.0), "Bad Cable (<20% efficiency)");
}

TEST(SpeedRatingTest, UnknownLinkGivesUnknownCable)
{
    EXPECT_EQ(SpeedRating::cableQuality("", 100.0), "Unknown");
    EXPECT_EQ(SpeedRating::cableQuality("1.5 Mb/s", 0.1), "Unknown");
}
