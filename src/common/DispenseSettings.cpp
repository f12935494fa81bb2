#include "DispenseSettings.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

int readInt(const QJsonObject &o, const char *key, int def)
{
    const QJsonValue v = o.value(key);
    if (v.isDouble()) return v.toInt(def);
    if (v.isString()) {
        bool ok = false;
        const int n = v.toString().trimmed().toInt(&ok);
        return ok ? n : def;
    }
    return def;
}

double readDouble(const QJsonObject &o, const char *key, double def)
{
    const QJsonValue v = o.value(key);
    if (v.isDouble()) return v.toDouble(def);
    if (v.isString()) {
        bool ok = false;
        const double d = v.toString().trimmed().toDouble(&ok);
        return ok ? d : def;
    }
    return def;
}

} // namespace

DispenseSettings DispenseSettings::fromJson(const QJsonObject &root)
{
    DispenseSettings s;

    const QJsonObject ctl = root.value("controller").toObject();
    s.armsControllerNumber = readInt(ctl, "armsControllerNumber", s.armsControllerNumber);
    s.zControllerNumber    = readInt(ctl, "zControllerNumber", s.zControllerNumber);
    s.zAxisNumber          = readInt(ctl, "zAxisNumber", s.zAxisNumber);

    const QJsonObject d = root.value("dispense").toObject();
    s.minDispenseVolumeUl     = readDouble(d, "minDispenseVolumeUl", s.minDispenseVolumeUl);
    s.dispenseClearanceMm     = readDouble(d, "dispenseClearanceMm", s.dispenseClearanceMm);
    s.flushHeightMm           = readDouble(d, "flushHeightMm", s.flushHeightMm);
    s.pollIntervalMs          = readInt(d, "pollIntervalMs", s.pollIntervalMs);
    s.settlePollIntervalMs    = readInt(d, "settlePollIntervalMs", s.settlePollIntervalMs);
    s.parkSettleDelayMs       = readInt(d, "parkSettleDelayMs", s.parkSettleDelayMs);
    s.homingTimeoutMs         = readInt(d, "homingTimeoutMs", s.homingTimeoutMs);
    s.moveTimeoutMs           = readInt(d, "moveTimeoutMs", s.moveTimeoutMs);
    s.parkTimeoutMs           = readInt(d, "parkTimeoutMs", s.parkTimeoutMs);
    s.dispenseTimeoutMarginMs = readInt(d, "dispenseTimeoutMarginMs", s.dispenseTimeoutMarginMs);
    s.flushTimeoutMarginMs    = readInt(d, "flushTimeoutMarginMs", s.flushTimeoutMarginMs);

    const QJsonObject ser = root.value("serial").toObject();
    s.serialPort        = ser.value("port").toString(s.serialPort).trimmed();
    s.baudRate          = readInt(ser, "baudRate", s.baudRate);
    s.responseTimeoutMs = readInt(ser, "responseTimeoutMs", s.responseTimeoutMs);

    const QJsonObject svc = root.value("service").toObject();
    s.serviceBaseUrl   = svc.value("baseUrl").toString(s.serviceBaseUrl).trimmed();
    s.requestTimeoutMs = readInt(svc, "requestTimeoutMs", s.requestTimeoutMs);
    s.dataDirectory    = svc.value("dataDirectory").toString(s.dataDirectory).trimmed();

    return s;
}

QJsonObject DispenseSettings::toJson() const
{
    QJsonObject ctl;
    ctl["armsControllerNumber"] = armsControllerNumber;
    ctl["zControllerNumber"]    = zControllerNumber;
    ctl["zAxisNumber"]          = zAxisNumber;

    QJsonObject d;
    d["minDispenseVolumeUl"]     = minDispenseVolumeUl;
    d["dispenseClearanceMm"]     = dispenseClearanceMm;
    d["flushHeightMm"]           = flushHeightMm;
    d["pollIntervalMs"]          = pollIntervalMs;
    d["settlePollIntervalMs"]    = settlePollIntervalMs;
    d["parkSettleDelayMs"]       = parkSettleDelayMs;
    d["homingTimeoutMs"]         = homingTimeoutMs;
    d["moveTimeoutMs"]           = moveTimeoutMs;
    d["parkTimeoutMs"]           = parkTimeoutMs;
    d["dispenseTimeoutMarginMs"] = dispenseTimeoutMarginMs;
    d["flushTimeoutMarginMs"]    = flushTimeoutMarginMs;

    QJsonObject ser;
    ser["port"]              = serialPort;
    ser["baudRate"]          = baudRate;
    ser["responseTimeoutMs"] = responseTimeoutMs;

    QJsonObject svc;
    svc["baseUrl"]          = serviceBaseUrl;
    svc["requestTimeoutMs"] = requestTimeoutMs;
    svc["dataDirectory"]    = dataDirectory;

    QJsonObject root;
    root["controller"] = ctl;
    root["dispense"]   = d;
    root["serial"]     = ser;
    root["service"]    = svc;
    return root;
}

bool DispenseSettings::loadFromFile(const QString &path,
                                    DispenseSettings *out,
                                    DispenseError *err)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Cannot open settings file %1").arg(path));
    }

    QJsonParseError perr;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Settings file %1 is not a JSON object: %2")
                            .arg(path, perr.errorString()));
    }

    const DispenseSettings s = fromJson(doc.object());
    if (s.pollIntervalMs <= 0 || s.settlePollIntervalMs <= 0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        "Poll intervals must be positive");
    }
    if (s.minDispenseVolumeUl < 0.0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        "minDispenseVolumeUl must not be negative");
    }

    qDebug() << "[INFO] Loaded settings from" << path;
    if (out) *out = s;
    return true;
}
