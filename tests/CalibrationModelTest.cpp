#include <gtest/gtest.h>

#include "calibration/CalibrationModel.h"
#include "TestData.h"

using testdata::openTime;
using testdata::point;

TEST(CalibrationModel, VolumePerShotFromMassDensityAndShots)
{
    EXPECT_DOUBLE_EQ(volumePerShotUl(point(1000, 50, 0.5), 1.0), 10.0);
    EXPECT_DOUBLE_EQ(volumePerShotUl(point(1000, 100, 0.5), 0.5), 10.0);
    EXPECT_DOUBLE_EQ(volumePerShotUl(point(1000, 0, 0.5), 1.0), 0.0);
    EXPECT_DOUBLE_EQ(volumePerShotUl(point(1000, 10, 0.5), 0.0), 0.0);
}

TEST(CalibrationModel, UpdateVolumePerShotsUsesTableDensity)
{
    CalibrationTable t;
    t.densityKgPerL = 2.0;
    t.points << point(1000, 10, 0.2);
    EXPECT_FALSE(t.volumesDerived());
    t.updateVolumePerShots();
    EXPECT_TRUE(t.volumesDerived());
    EXPECT_DOUBLE_EQ(t.points.first().volumePerShotUl, 10.0);
}

TEST(CalibrationModel, AtOrBelowFirstPointIsZero)
{
    const CalibrationTable t = testdata::linearTable();
    EXPECT_EQ(openTime(t, 0.0), 0);
    EXPECT_EQ(openTime(t, 0.5), 0);
    EXPECT_EQ(openTime(t, 1.0), 0);
}

TEST(CalibrationModel, InterpolatesWithinBracket)
{
    const CalibrationTable t = testdata::linearTable();
    EXPECT_EQ(openTime(t, 5.5), 5500);
    EXPECT_EQ(openTime(t, 10.0), 10000);
    EXPECT_EQ(openTime(t, 15.0), 15000);
    EXPECT_EQ(openTime(t, 12.5), 12500);
}

TEST(CalibrationModel, ExtrapolatesPastLastPoint)
{
    const CalibrationTable t = testdata::linearTable();
    EXPECT_EQ(openTime(t, 30.0), 30000);
}

TEST(CalibrationModel, PointOrderDoesNotMatter)
{
    CalibrationTable t;
    t.points << point(20000, 100, 2.0) << point(1000, 100, 0.1) << point(10000, 100, 1.0);
    t.updateVolumePerShots();
    EXPECT_EQ(openTime(t, 5.5), 5500);
    EXPECT_EQ(openTime(t, 30.0), 30000);
}

TEST(CalibrationModel, FlatTopReturnsLastOpenTime)
{
    CalibrationTable t;
    t.points << point(1000, 100, 0.1) << point(1000, 100, 0.2);
    t.updateVolumePerShots();
    EXPECT_EQ(openTime(t, 5.0), 1000);

    CalibrationTable single;
    single.points << point(4000, 100, 0.1);
    single.updateVolumePerShots();
    EXPECT_EQ(openTime(single, 3.0), 4000);
}

TEST(CalibrationModel, EmptyTableIsZero)
{
    CalibrationTable t;
    t.updateVolumePerShots();
    EXPECT_EQ(openTime(t, 10.0), 0);
}

TEST(CalibrationModel, RoundsToNearestMicrosecond)
{
    CalibrationTable t;
    t.points << point(1000, 100, 0.1) << point(1010, 100, 0.4);  // 1 and 4 uL
    t.updateVolumePerShots();
    // 1000 + 10 / 3
    EXPECT_EQ(openTime(t, 2.0), 1003);
    // 1000 + 20 / 3
    EXPECT_EQ(openTime(t, 3.0), 1007);
}

TEST(CalibrationModel, FreeFunctionMatchesMember)
{
    const CalibrationTable t = testdata::linearTable();
    int usecs = 0;
    ASSERT_TRUE(volumeToOpenTimeUsecs(t, 7.5, &usecs));
    EXPECT_EQ(usecs, 7500);
}

TEST(CalibrationModel, NearlyFlatTopOverflowIsConfigurationError)
{
    const CalibrationTable t = testdata::nearlyFlatTopTable();
    // Within the calibrated range the table still works
    EXPECT_EQ(openTime(t, 10.00005), 15000);

    int usecs = 123;
    DispenseError err;
    EXPECT_FALSE(t.volumeToOpenTimeUsecs(50.0, &usecs, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
    EXPECT_TRUE(err.message.contains("50")) << err.message.toStdString();
    EXPECT_EQ(usecs, 0);
}

TEST(CalibrationModel, NegativeExtrapolationIsConfigurationError)
{
    // Volume falls as open time grows: extrapolating upward goes negative
    CalibrationTable t;
    t.points << point(20000, 100, 0.1) << point(1000, 100, 0.2);
    t.updateVolumePerShots();

    DispenseError err;
    EXPECT_FALSE(t.volumeToOpenTimeUsecs(3.0, nullptr, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
}

TEST(CalibrationModel, CalibrationForValveUsesFirstTable)
{
    ActiveCalibrationData data = testdata::calibration({1});
    CalibrationTable other;
    other.fluidName = "DMSO";
    other.updateVolumePerShots();
    data.calibrations[0].calibrations << other;

    CalibrationTable t;
    DispenseError err;
    ASSERT_TRUE(data.calibrationForValve(1, &t, &err)) << err.toString().toStdString();
    EXPECT_EQ(t.fluidName, "Water");
}

TEST(CalibrationModel, MissingValveIsConfigurationError)
{
    const ActiveCalibrationData data = testdata::calibration({1});
    DispenseError err;
    EXPECT_FALSE(data.calibrationForValve(2, nullptr, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
    EXPECT_TRUE(err.message.contains("valve number 2"));
}

TEST(CalibrationModel, ChannelWithoutTablesIsConfigurationError)
{
    ActiveCalibrationData data;
    ChannelCalibration c;
    c.valveChannelNumber = 1;
    data.calibrations << c;
    DispenseError err;
    EXPECT_FALSE(data.calibrationForValve(1, nullptr, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
}

TEST(CalibrationModel, UnderivedTableIsRejected)
{
    ActiveCalibrationData data;
    ChannelCalibration c;
    c.valveChannelNumber = 1;
    CalibrationTable t;
    t.points << point(1000, 100, 0.1);
    c.calibrations << t;
    data.calibrations << c;

    DispenseError err;
    EXPECT_FALSE(data.calibrationForValve(1, nullptr, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Configuration);
}
