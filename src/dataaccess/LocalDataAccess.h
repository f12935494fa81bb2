#ifndef LOCALDATAACCESS_H
#define LOCALDATAACCESS_H

#include <QString>

#include "DataAccess.h"

// Offline store: <root>/platetypes/<guid>.json, <root>/calibrations/<serial>.json,
// <root>/protocols/<id>.json
class LocalDataAccess : public DataAccess
{
public:
    explicit LocalDataAccess(const QString &rootDir);

    bool getPlateTypeData(const QString &guid, PlateType *out, DispenseError *err = nullptr) override;
    bool getActiveCalibrationData(const QString &deviceSerialId, ActiveCalibrationData *out,
                                  DispenseError *err = nullptr) override;
    bool getProtocol(const QString &protocolId, Protocol *out, DispenseError *err = nullptr) override;

    bool saveProtocol(const Protocol &protocol, DispenseError *err = nullptr) const;

private:
    QString recordPath(const QString &collection, const QString &key) const;
    bool loadObject(const QString &collection, const QString &key,
                    QJsonObject *out, DispenseError *err) const;

    QString rootDir_;
};

#endif // LOCALDATAACCESS_H
