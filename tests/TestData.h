#ifndef TESTDATA_H
#define TESTDATA_H

#include <gtest/gtest.h>

#include "calibration/CalibrationModel.h"
#include "labware/PlateType.h"
#include "protocol/ProtocolData.h"

namespace testdata {

inline CalibrationPoint point(int openTimeUsecs, int shotCount, double massGrams)
{
    CalibrationPoint p;
    p.openTimeUsecs = openTimeUsecs;
    p.shotCount = shotCount;
    p.massGrams = massGrams;
    return p;
}

// 1, 10 and 20 uL per shot at 1000, 10000 and 20000 us (water, 100 shots)
inline CalibrationTable linearTable()
{
    CalibrationTable t;
    t.fluidName = "Water";
    t.points << point(1000, 100, 0.1) << point(10000, 100, 1.0) << point(20000, 100, 2.0);
    t.updateVolumePerShots();
    return t;
}

// 10 and 10.0001 uL per shot at 10000 and 20000 us. Extrapolating to tens of
// microlitres needs billions of microseconds.
inline CalibrationTable nearlyFlatTopTable()
{
    CalibrationTable t;
    t.fluidName = "Water";
    t.points << point(10000, 100, 1.0) << point(20000, 100, 1.00001);
    t.updateVolumePerShots();
    return t;
}

// Open time for a table expected to convert cleanly
inline int openTime(const CalibrationTable &table, double volumeUl)
{
    int usecs = -1;
    DispenseError err;
    EXPECT_TRUE(table.volumeToOpenTimeUsecs(volumeUl, &usecs, &err))
        << volumeUl << " uL: " << err.toString().toStdString();
    return usecs;
}

inline ActiveCalibrationData calibration(const QVector<int> &valves = {1, 2},
                                         const CalibrationTable &table = linearTable())
{
    ActiveCalibrationData data;
    for (int v : valves) {
        ChannelCalibration c;
        c.valveChannelNumber = v;
        c.calibrations << table;
        data.calibrations << c;
    }
    return data;
}

inline PlateType plate96()
{
    PlateType p;
    p.id = "plate-96";
    p.name = "SBS 96";
    p.wellCount = 96;
    p.wellPitchMm = 9.0;
    p.xOffsetA1Mm = 14.38;
    p.yOffsetA1Mm = 11.24;
    p.heightMm = 14.2;
    p.wellVolumeUl = 300.0;
    return p;
}

inline Protocol fullPlate(double valve1Ul, double valve2Ul = 0.0)
{
    QVector<WellVolumes> rows;
    for (int r = 0; r < 8; ++r) {
        for (int c = 0; c < 12; ++c)
            rows << WellVolumes{WellGeometry::wellName(r, c), valve1Ul, valve2Ul};
    }
    return Protocol::fromList(rows, "Full plate");
}

} // namespace testdata

#endif // TESTDATA_H
