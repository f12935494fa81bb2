#include "WebDataAccess.h"

#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include "JsonRecords.h"

WebDataAccess::WebDataAccess(const QUrl &baseUrl, int requestTimeoutMs)
    : baseUrl_(baseUrl),
    requestTimeoutMs_(requestTimeoutMs)
{
}

QUrl WebDataAccess::resourceUrl(const QString &collection, const QString &key) const
{
    QString base = baseUrl_.toString();
    while (base.endsWith('/')) base.chop(1);
    return QUrl(QString("%1/%2/%3").arg(base, collection,
                                        QString::fromLatin1(QUrl::toPercentEncoding(key.trimmed()))));
}

bool WebDataAccess::fetchObject(const QString &collection, const QString &key,
                                QJsonObject *out, DispenseError *err)
{
    if (!baseUrl_.isValid() || baseUrl_.isEmpty()) {
        return failWith(err, DispenseError::Kind::Configuration, "No data service URL configured");
    }
    if (key.trimmed().isEmpty()) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Empty %1 id").arg(collection));
    }

    const QUrl url = resourceUrl(collection, key);
    QNetworkAccessManager nam;
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    QNetworkReply *reply = nam.get(req);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(requestTimeoutMs_);
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Request %1 timed out after %2 ms").arg(url.toString()).arg(requestTimeoutMs_));
    }

    const QByteArray body = reply->readAll();
    const auto netError = reply->error();
    const QString netErrorText = reply->errorString();
    reply->deleteLater();

    if (netError != QNetworkReply::NoError) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Lookup %1 failed: %2").arg(url.toString(), netErrorText));
    }

    qDebug() << "[INFO] Fetched" << url.toString() << body.size() << "bytes";
    return JsonRecords::objectFromBytes(body, url.toString(), out, err);
}

bool WebDataAccess::getPlateTypeData(const QString &guid, PlateType *out, DispenseError *err)
{
    QJsonObject o;
    if (!fetchObject("platetypes", guid, &o, err))
        return false;
    return JsonRecords::parsePlateType(o, out, err);
}

bool WebDataAccess::getActiveCalibrationData(const QString &deviceSerialId,
                                             ActiveCalibrationData *out, DispenseError *err)
{
    QJsonObject o;
    if (!fetchObject("calibrations/active", deviceSerialId, &o, err))
        return false;
    return JsonRecords::parseCalibration(o, out, err);
}

bool WebDataAccess::getProtocol(const QString &protocolId, Protocol *out, DispenseError *err)
{
    QJsonObject o;
    if (!fetchObject("protocols", protocolId, &o, err))
        return false;
    return JsonRecords::parseProtocol(o, out, err);
}
