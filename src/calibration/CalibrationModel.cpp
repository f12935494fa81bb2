#include "CalibrationModel.h"

#include <algorithm>
#include <climits>
#include <cmath>

namespace {

// Linear interpolation of time over volume. Degenerate span -> midpoint.
double interpolate(double t1, double t2, double v1, double v2, double v)
{
    if (v2 == v1)
        return (t1 + t2) / 2.0;
    return t1 + ((v - v1) * (t2 - t1)) / (v2 - v1);
}

bool roundToUsecs(double t, double volumeUl, int *usecs, DispenseError *err)
{
    if (!std::isfinite(t) || t < 0.0 || t > double(INT_MAX)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Calibration gives unusable open time %1 us for %2 uL")
                            .arg(t, 0, 'g', 12).arg(volumeUl));
    }
    const long long rounded = std::llround(t);
    if (usecs) *usecs = rounded > INT_MAX ? INT_MAX : int(rounded);
    return true;
}

} // namespace

double volumePerShotUl(const CalibrationPoint &point, double densityKgPerL)
{
    if (point.shotCount <= 0 || densityKgPerL <= 0.0)
        return 0.0;
    // kg/L == g/mL, so grams / density is millilitres
    const double totalUl = (point.massGrams / densityKgPerL) * 1000.0;
    return totalUl / point.shotCount;
}

void CalibrationTable::updateVolumePerShots()
{
    for (auto &p : points)
        p.volumePerShotUl = volumePerShotUl(p, densityKgPerL);
    volumesDerived_ = true;
}

bool CalibrationTable::volumeToOpenTimeUsecs(double volumeUl, int *usecs, DispenseError *err) const
{
    if (usecs) *usecs = 0;
    if (points.isEmpty())
        return true;

    QVector<CalibrationPoint> sorted = points;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CalibrationPoint &a, const CalibrationPoint &b) {
                         return a.volumePerShotUl < b.volumePerShotUl;
                     });

    const CalibrationPoint &first = sorted.first();
    if (volumeUl <= first.volumePerShotUl)
        return true;  // below scale, nothing is dispensed

    for (int i = 1; i < sorted.size(); ++i) {
        const CalibrationPoint &prev = sorted.at(i - 1);
        const CalibrationPoint &cur  = sorted.at(i);
        if (prev.volumePerShotUl <= volumeUl && volumeUl <= cur.volumePerShotUl) {
            return roundToUsecs(interpolate(prev.openTimeUsecs, cur.openTimeUsecs,
                                            prev.volumePerShotUl, cur.volumePerShotUl,
                                            volumeUl),
                                volumeUl, usecs, err);
        }
    }

    // Above scale: extrapolate with the flow rate of the top two points
    const CalibrationPoint &last = sorted.last();
    if (sorted.size() < 2)
        return roundToUsecs(last.openTimeUsecs, volumeUl, usecs, err);
    const CalibrationPoint &secondLast = sorted.at(sorted.size() - 2);

    const double timeDiff = double(last.openTimeUsecs) - double(secondLast.openTimeUsecs);
    if (timeDiff == 0.0)
        return roundToUsecs(last.openTimeUsecs, volumeUl, usecs, err);

    const double flowRate = (last.volumePerShotUl - secondLast.volumePerShotUl) / timeDiff;
    if (flowRate == 0.0)
        return roundToUsecs(last.openTimeUsecs, volumeUl, usecs, err);

    const double extraTime = (volumeUl - last.volumePerShotUl) / flowRate;
    return roundToUsecs(last.openTimeUsecs + extraTime, volumeUl, usecs, err);
}

bool volumeToOpenTimeUsecs(const CalibrationTable &table, double volumeUl,
                           int *usecs, DispenseError *err)
{
    return table.volumeToOpenTimeUsecs(volumeUl, usecs, err);
}

bool ActiveCalibrationData::calibrationForValve(int valveNumber,
                                                CalibrationTable *out,
                                                DispenseError *err) const
{
    for (const auto &channel : calibrations) {
        if (channel.valveChannelNumber != valveNumber)
            continue;
        if (channel.calibrations.isEmpty())
            break;
        const CalibrationTable &table = channel.calibrations.first();
        if (!table.volumesDerived()) {
            return failWith(err, DispenseError::Kind::Configuration,
                            QString("Calibration for valve %1 has no derived shot volumes")
                                .arg(valveNumber));
        }
        if (out) *out = table;
        return true;
    }
    return failWith(err, DispenseError::Kind::Configuration,
                    QString("Invalid or missing calibration for valve number %1").arg(valveNumber));
}
