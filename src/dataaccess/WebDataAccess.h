#ifndef WEBDATAACCESS_H
#define WEBDATAACCESS_H

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "DataAccess.h"

// Blocking client for the dispenser web service. Each call owns its own
// QNetworkAccessManager, so it can run on any thread.
class WebDataAccess : public DataAccess
{
public:
    explicit WebDataAccess(const QUrl &baseUrl, int requestTimeoutMs = 30000);

    bool getPlateTypeData(const QString &guid, PlateType *out, DispenseError *err = nullptr) override;
    bool getActiveCalibrationData(const QString &deviceSerialId, ActiveCalibrationData *out,
                                  DispenseError *err = nullptr) override;
    bool getProtocol(const QString &protocolId, Protocol *out, DispenseError *err = nullptr) override;

    QUrl resourceUrl(const QString &collection, const QString &key) const;

private:
    bool fetchObject(const QString &collection, const QString &key,
                     QJsonObject *out, DispenseError *err);

    QUrl baseUrl_;
    int requestTimeoutMs_ = 30000;
};

#endif // WEBDATAACCESS_H
