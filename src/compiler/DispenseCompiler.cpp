#include "DispenseCompiler.h"

#include <algorithm>

#include <QDebug>
#include <QHash>

DispenseCompiler::DispenseCompiler(int armsControllerNumber, double minDispenseVolumeUl)
    : armsControllerNumber_(armsControllerNumber),
    minDispenseVolumeUl_(minDispenseVolumeUl)
{
}

QString DispenseCompiler::clearCommand() const
{
    return QString("CLR_VALVE_WELL,%1,0").arg(armsControllerNumber_);
}

QString DispenseCompiler::valveCommand(int valveNumber, int openTimeUsecs,
                                       int shotCount, int interShotTimeUsecs) const
{
    return QString("VALVE,%1,0,%2,%3,%4,%5")
        .arg(armsControllerNumber_)
        .arg(valveNumber)
        .arg(openTimeUsecs)
        .arg(shotCount)
        .arg(interShotTimeUsecs);
}

QString DispenseCompiler::lineCommand(int valveNumber, int wellDeltaMicrons,
                                      const QVector<WellParams> &wells) const
{
    QStringList parts;
    parts.reserve(wells.size() + 1);
    parts << QString("VALVE_WELL,%1,0,%2,%3,%4")
                 .arg(armsControllerNumber_)
                 .arg(valveNumber)
                 .arg(wellDeltaMicrons)
                 .arg(wells.size());
    // x,y,approach,openTime,shots
    for (const auto &w : wells) {
        parts << QString("%1,%2,%3,%4,1")
                     .arg(w.xUm)
                     .arg(w.yUm)
                     .arg(w.approachDirection)
                     .arg(w.openTimeUsecs);
    }
    return parts.join(',');
}

bool DispenseCompiler::dispenseDurationUsecs(const CalibrationTable &table,
                                             double volumeUl,
                                             int *usecs,
                                             DispenseError *err) const
{
    if (usecs) *usecs = 0;
    if (volumeUl <= minDispenseVolumeUl_)
        return true;
    return table.volumeToOpenTimeUsecs(volumeUl, usecs, err);
}

bool DispenseCompiler::compile(const ActiveCalibrationData &calibration,
                               const Protocol &protocol,
                               const PlateType &plate,
                               QStringList *commands,
                               DispenseError *err) const
{
    int rows = 0, cols = 0;
    if (!WellGeometry::checkedRowsAndColumns(plate.wellCount, &rows, &cols, err))
        return false;

    QStringList out;
    out << clearCommand();
    const int wellDelta = WellGeometry::dispenseWellDeltaMicrons(plate.wellCount);
    const QHash<QString, const ProtocolWell *> wellIndex = protocol.wellIndex();

    for (int valve = 1; valve <= kValveCount; ++valve) {
        // Only resolve the calibration when the valve has work to do
        bool needsCalibration = false;
        for (const auto &w : protocol.wells) {
            if (w.volumeUl(valve) > minDispenseVolumeUl_) { needsCalibration = true; break; }
        }
        if (!needsCalibration) {
            qDebug() << "[INFO] Valve" << valve << "has no dispense volumes";
            continue;
        }

        CalibrationTable table;
        if (!calibration.calibrationForValve(valve, &table, err))
            return false;

        bool reverseLine = false;
        int emitted = 0;
        for (auto line : WellGeometry::wellSequenceLines(plate.wellCount)) {
            if (line.isEmpty()) continue;

            int approach = -1;
            if (reverseLine) {
                approach = 1;
                std::reverse(line.begin(), line.end());
            }

            bool nonZeroOnLine = false;
            QVector<WellParams> params;
            params.reserve(line.size());
            for (const auto &well : line) {
                const WellXY xy = WellGeometry::wellPhysicalXY(plate, well);
                WellParams p;
                p.xUm = xy.xMicrons();
                p.yUm = xy.yMicrons();
                p.approachDirection = approach;
                const ProtocolWell *pw = wellIndex.value(WellGeometry::wellName(well), nullptr);
                const double volume = pw ? pw->volumeUl(valve) : 0.0;
                DispenseError e;
                if (!dispenseDurationUsecs(table, volume, &p.openTimeUsecs, &e)) {
                    return failWith(err, e.prefixed(QString("Valve %1 well %2")
                                                        .arg(valve)
                                                        .arg(WellGeometry::wellName(well))));
                }
                if (p.openTimeUsecs > 0)
                    nonZeroOnLine = true;
                params.push_back(p);
            }

            // An all-zero line is skipped and does not consume a direction flip
            if (!nonZeroOnLine) continue;

            out << lineCommand(valve, wellDelta, params);
            reverseLine = !reverseLine;
            ++emitted;
        }
        qDebug() << "[INFO] Valve" << valve << "compiled" << emitted << "lines";
    }

    if (commands) *commands = out;
    return true;
}
