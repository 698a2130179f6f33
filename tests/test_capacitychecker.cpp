#include "capacitychecker.h"
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {
const qint64 kGb = Q_INT64_C(1024) * 1024 * 1024;
}

TEST(CapacityCheckerTest, InsufficientWhenEstimateExceedsFreeSpace)
{
    DiskSpaceReport report = CapacityChecker::classify(10 * kGb, 30 * kGb);
    EXPECT_EQ(report.verdict, DiskSpaceReport::Insufficient);
    EXPECT_TRUE(report.needsConfirmation());
}

TEST(CapacityCheckerTest, MarginalWithinFivePercent)
{
    EXPECT_EQ(CapacityChecker::classify(102 * kGb, 100 * kGb).verdict, DiskSpaceReport::Marginal);
    EXPECT_EQ(CapacityChecker::classify(100 * kGb, 100 * kGb).verdict, DiskSpaceReport::Marginal);
}

TEST(CapacityCheckerTest, OkWithHeadroom)
{
    DiskSpaceReport report = CapacityChecker::classify(200 * kGb, 100 * kGb);
    EXPECT_EQ(report.verdict, DiskSpaceReport::OK);
    EXPECT_FALSE(report.needsConfirmation());
}

TEST(CapacityCheckerTest, ZeroEstimateIsOk)
{
    EXPECT_EQ(CapacityChecker::classify(0, 0).verdict, DiskSpaceReport::OK);
}

TEST(CapacityCheckerTest, UnknownFreeSpaceNeedsConfirmation)
{
    DiskSpaceReport report = CapacityChecker::classify(-1, 10);
    EXPECT_EQ(report.verdict, DiskSpaceReport::Unknown);
    EXPECT_TRUE(report.needsConfirmation());
}

TEST(CapacityCheckerTest, ChecksVolumeOfMissingDestination)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    DiskSpaceReport report = CapacityChecker().check(dir.path() + "/not/yet/created", 1);
    EXPECT_GE(report.availableBytes, 0);
    EXPECT_NE(report.verdict, DiskSpaceReport::Unknown);
    EXPECT_FALSE(report.volumeRoot.isEmpty());
}

TEST(CapacityCheckerTest, HugeEstimateIsInsufficient)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    DiskSpaceReport report = CapacityChecker().check(dir.path(), Q_INT64_C(1) << 60);
    EXPECT_EQ(report.verdict, DiskSpaceReport::Insufficient);
    EXPECT_FALSE(CapacityChecker::verdictDescription(report).isEmpty());
}
