#ifndef DATAACCESS_H
#define DATAACCESS_H

#include <QString>

#include "calibration/CalibrationModel.h"
#include "common/DispenseError.h"
#include "labware/PlateType.h"
#include "protocol/ProtocolData.h"

// Source of plate types, calibration profiles and protocols. Implementations
// must be callable from a worker thread.
class DataAccess
{
public:
    virtual ~DataAccess() = default;

    virtual bool getPlateTypeData(const QString &guid,
                                  PlateType *out,
                                  DispenseError *err = nullptr) = 0;
    virtual bool getActiveCalibrationData(const QString &deviceSerialId,
                                          ActiveCalibrationData *out,
                                          DispenseError *err = nullptr) = 0;
    virtual bool getProtocol(const QString &protocolId,
                             Protocol *out,
                             DispenseError *err = nullptr) = 0;
};

#endif // DATAACCESS_H
