#ifndef JSONRECORDS_H
#define JSONRECORDS_H

#include <QByteArray>
#include <QJsonObject>

#include "calibration/CalibrationModel.h"
#include "common/DispenseError.h"
#include "labware/PlateType.h"
#include "protocol/ProtocolData.h"

class JsonRecords
{
public:
    static bool parsePlateType(const QJsonObject &o, PlateType *out, DispenseError *err = nullptr);
    static bool parseCalibration(const QJsonObject &o, ActiveCalibrationData *out, DispenseError *err = nullptr);
    static bool parseProtocol(const QJsonObject &o, Protocol *out, DispenseError *err = nullptr);

    static QJsonObject plateTypeToJson(const PlateType &plate);
    static QJsonObject calibrationToJson(const ActiveCalibrationData &cal);
    static QJsonObject protocolToJson(const Protocol &protocol);

    // Parses a payload that must be a JSON object.
    static bool objectFromBytes(const QByteArray &bytes,
                                const QString &what,
                                QJsonObject *out,
                                DispenseError *err = nullptr);
};

#endif // JSONRECORDS_H
