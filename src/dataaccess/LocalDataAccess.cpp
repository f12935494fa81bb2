#include "LocalDataAccess.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

#include "JsonRecords.h"

LocalDataAccess::LocalDataAccess(const QString &rootDir)
    : rootDir_(rootDir)
{
}

QString LocalDataAccess::recordPath(const QString &collection, const QString &key) const
{
    return QDir(rootDir_).filePath(QString("%1/%2.json").arg(collection, key.trimmed()));
}

bool LocalDataAccess::loadObject(const QString &collection, const QString &key,
                                 QJsonObject *out, DispenseError *err) const
{
    const QString k = key.trimmed();
    if (k.isEmpty() || k.contains('/') || k.contains('\\')) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Invalid %1 id '%2'").arg(collection, key));
    }
    QFile f(recordPath(collection, k));
    if (!f.open(QIODevice::ReadOnly)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("No %1 record '%2' in %3").arg(collection, k, rootDir_));
    }
    return JsonRecords::objectFromBytes(f.readAll(), f.fileName(), out, err);
}

bool LocalDataAccess::getPlateTypeData(const QString &guid, PlateType *out, DispenseError *err)
{
    QJsonObject o;
    if (!loadObject("platetypes", guid, &o, err))
        return false;
    return JsonRecords::parsePlateType(o, out, err);
}

bool LocalDataAccess::getActiveCalibrationData(const QString &deviceSerialId,
                                               ActiveCalibrationData *out, DispenseError *err)
{
    QJsonObject o;
    if (!loadObject("calibrations", deviceSerialId, &o, err))
        return false;
    return JsonRecords::parseCalibration(o, out, err);
}

bool LocalDataAccess::getProtocol(const QString &protocolId, Protocol *out, DispenseError *err)
{
    QJsonObject o;
    if (!loadObject("protocols", protocolId, &o, err))
        return false;
    return JsonRecords::parseProtocol(o, out, err);
}

bool LocalDataAccess::saveProtocol(const Protocol &protocol, DispenseError *err) const
{
    if (protocol.id.trimmed().isEmpty()) {
        return failWith(err, DispenseError::Kind::Configuration, "Protocol has no id");
    }
    const QString path = recordPath("protocols", protocol.id);
    QDir().mkpath(QFileInfo(path).dir().path());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Cannot open %1 for write").arg(path));
    }
    const QByteArray bytes = QJsonDocument(JsonRecords::protocolToJson(protocol)).toJson(QJsonDocument::Indented);
    if (f.write(bytes) != bytes.size()) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Failed writing %1: %2").arg(path, f.errorString()));
    }
    return true;
}
