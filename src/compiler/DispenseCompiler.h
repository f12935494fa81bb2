#ifndef DISPENSECOMPILER_H
#define DISPENSECOMPILER_H

#include <QString>
#include <QStringList>
#include <QVector>

#include "calibration/CalibrationModel.h"
#include "common/DispenseError.h"
#include "labware/PlateType.h"
#include "labware/WellGeometry.h"
#include "protocol/ProtocolData.h"

// Turns a protocol into the ordered VALVE_WELL command list the arms
// controller executes: one command per plate row per valve, serpentine.
class DispenseCompiler
{
public:
    static constexpr int kValveCount = 2;

    explicit DispenseCompiler(int armsControllerNumber = 1,
                              double minDispenseVolumeUl = 0.0);

    bool compile(const ActiveCalibrationData &calibration,
                 const Protocol &protocol,
                 const PlateType &plate,
                 QStringList *commands,
                 DispenseError *err = nullptr) const;

    // Open time for one shot of volumeUl; 0 when the volume is at or below
    // the minimum dispense volume. Fails when the calibration cannot produce
    // a usable open time.
    bool dispenseDurationUsecs(const CalibrationTable &table,
                               double volumeUl,
                               int *usecs,
                               DispenseError *err = nullptr) const;

    QString clearCommand() const;
    QString valveCommand(int valveNumber, int openTimeUsecs,
                         int shotCount, int interShotTimeUsecs) const;

    int armsControllerNumber() const { return armsControllerNumber_; }
    double minDispenseVolumeUl() const { return minDispenseVolumeUl_; }

private:
    struct WellParams {
        int xUm = 0;
        int yUm = 0;
        int approachDirection = -1;
        int openTimeUsecs = 0;
    };

    QString lineCommand(int valveNumber, int wellDeltaMicrons,
                        const QVector<WellParams> &wells) const;

    int armsControllerNumber_ = 1;
    double minDispenseVolumeUl_ = 0.0;
};

#endif // DISPENSECOMPILER_H
