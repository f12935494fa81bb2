#ifndef DISPENSESETTINGS_H
#define DISPENSESETTINGS_H

#include <QJsonObject>
#include <QString>

#include "DispenseError.h"

struct DispenseSettings
{
    // Controller addressing
    int armsControllerNumber = 1;
    int zControllerNumber = 2;
    int zAxisNumber = 1;

    // Dispense policy
    double minDispenseVolumeUl = 0.0;
    double dispenseClearanceMm = 1.0;
    double flushHeightMm = 10.0;

    // Waits (milliseconds)
    int pollIntervalMs = 100;
    int settlePollIntervalMs = 100;
    int parkSettleDelayMs = 500;
    int homingTimeoutMs = 40000;
    int moveTimeoutMs = 30000;
    int parkTimeoutMs = 20000;
    int dispenseTimeoutMarginMs = 30000;
    int flushTimeoutMarginMs = 250;

    // Serial link
    QString serialPort;
    int baudRate = 115200;
    int responseTimeoutMs = 2000;

    // Data service
    QString serviceBaseUrl;
    int requestTimeoutMs = 30000;
    QString dataDirectory;

    static bool loadFromFile(const QString &path,
                             DispenseSettings *out,
                             DispenseError *err = nullptr);
    static DispenseSettings fromJson(const QJsonObject &root);
    QJsonObject toJson() const;
};

#endif // DISPENSESETTINGS_H
