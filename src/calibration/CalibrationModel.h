#ifndef CALIBRATIONMODEL_H
#define CALIBRATIONMODEL_H

#include <QString>
#include <QVector>

#include "common/DispenseError.h"

struct CalibrationPoint
{
    int openTimeUsecs = 0;
    int interShotTimeUsecs = 0;
    int shotCount = 0;
    double massGrams = 0.0;

    // Filled by CalibrationTable::updateVolumePerShots()
    double volumePerShotUl = 0.0;
};

class CalibrationTable
{
public:
    QVector<CalibrationPoint> points;
    double densityKgPerL = 1.0;
    QString fluidName;
    double pressureBar = 0.0;

    // Derives volumePerShotUl for every point from mass, density and shot
    // count. Must run after the points are loaded or edited.
    void updateVolumePerShots();
    bool volumesDerived() const { return volumesDerived_; }

    // Open time (us) needed for one shot of volumeUl. 0 for an empty table or
    // a volume at or below the first calibrated point. Fails when the
    // interpolated time is not a usable open time (negative, non-finite or
    // beyond int range).
    bool volumeToOpenTimeUsecs(double volumeUl, int *usecs, DispenseError *err = nullptr) const;

private:
    bool volumesDerived_ = false;
};

struct ChannelCalibration
{
    int valveChannelNumber = 0;
    QVector<CalibrationTable> calibrations;  // first entry is active
};

struct ActiveCalibrationData
{
    QVector<ChannelCalibration> calibrations;

    bool calibrationForValve(int valveNumber,
                             CalibrationTable *out,
                             DispenseError *err = nullptr) const;
};

bool volumeToOpenTimeUsecs(const CalibrationTable &table, double volumeUl,
                           int *usecs, DispenseError *err = nullptr);

double volumePerShotUl(const CalibrationPoint &point, double densityKgPerL);

#endif // CALIBRATIONMODEL_H
