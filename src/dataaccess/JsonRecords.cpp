#include "JsonRecords.h"

#include <cmath>
#include <initializer_list>
#include <limits>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

// First present key wins; numbers may arrive as strings
QJsonValue pick(const QJsonObject &o, std::initializer_list<const char *> keys)
{
    for (const char *k : keys) {
        if (o.contains(k)) return o.value(k);
    }
    return QJsonValue();
}

double readDouble(const QJsonObject &o, std::initializer_list<const char *> keys, double def = 0.0)
{
    const QJsonValue v = pick(o, keys);
    if (v.isDouble()) return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        const double d = v.toString().trimmed().toDouble(&ok);
        if (ok) return d;
    }
    return def;
}

// Values that do not fit an int read as the default
int readInt(const QJsonObject &o, std::initializer_list<const char *> keys, int def = 0)
{
    const double d = readDouble(o, keys, def);
    if (!std::isfinite(d)
        || d < double(std::numeric_limits<int>::min())
        || d > double(std::numeric_limits<int>::max()))
        return def;
    return int(d);
}

QString readString(const QJsonObject &o, std::initializer_list<const char *> keys)
{
    const QJsonValue v = pick(o, keys);
    if (v.isDouble()) return QString::number(v.toDouble(), 'g', 15);
    return v.toString().trimmed();
}

} // namespace

bool JsonRecords::objectFromBytes(const QByteArray &bytes,
                                  const QString &what,
                                  QJsonObject *out,
                                  DispenseError *err)
{
    QJsonParseError perr;
    const auto doc = QJsonDocument::fromJson(bytes, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("%1 is not a JSON object: %2").arg(what, perr.errorString()));
    }
    if (out) *out = doc.object();
    return true;
}

bool JsonRecords::parsePlateType(const QJsonObject &o, PlateType *out, DispenseError *err)
{
    PlateType p;
    p.id           = readString(o, {"Id", "id", "_id"});
    p.name         = readString(o, {"Name", "name"});
    p.wellCount    = readInt(o, {"WellCount", "wellCount"});
    p.wellPitchMm  = readDouble(o, {"WellPitch", "wellPitch", "wellPitchMm"});
    p.xOffsetA1Mm  = readDouble(o, {"XOffsetA1", "xOffsetA1", "xOffsetA1Mm"});
    p.yOffsetA1Mm  = readDouble(o, {"YOffsetA1", "yOffsetA1", "yOffsetA1Mm"});
    p.heightMm     = readDouble(o, {"Height", "height", "heightMm"});
    p.wellVolumeUl = readDouble(o, {"WellVolume", "wellVolume", "wellVolumeUl"});

    if (p.wellCount <= 0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Plate type '%1' has no valid well count").arg(p.id));
    }
    if (p.wellPitchMm <= 0.0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Plate type '%1' has no valid well pitch").arg(p.id));
    }
    if (out) *out = p;
    return true;
}

bool JsonRecords::parseCalibration(const QJsonObject &o, ActiveCalibrationData *out, DispenseError *err)
{
    ActiveCalibrationData data;
    const QJsonArray channels = pick(o, {"calibrations", "Calibrations"}).toArray();
    for (const auto &cv : channels) {
        const QJsonObject co = cv.toObject();
        ChannelCalibration channel;
        channel.valveChannelNumber = readInt(co, {"valveChannelNumber", "ValveChannelNumber"});
        if (channel.valveChannelNumber < 1) {
            return failWith(err, DispenseError::Kind::Configuration,
                            "Calibration channel without a valid valve number");
        }

        for (const auto &tv : pick(co, {"calibrations", "Calibrations"}).toArray()) {
            const QJsonObject to = tv.toObject();
            CalibrationTable table;
            table.densityKgPerL = readDouble(to, {"density", "Density"}, 1.0);
            table.fluidName     = readString(to, {"fluidName", "FluidName"});
            table.pressureBar   = readDouble(to, {"pressure", "Pressure"});
            for (const auto &pv : pick(to, {"points", "Points"}).toArray()) {
                const QJsonObject po = pv.toObject();
                CalibrationPoint pt;
                pt.openTimeUsecs      = readInt(po, {"openTimeUSecs", "OpenTimeUSecs"});
                pt.interShotTimeUsecs = readInt(po, {"interShotTimeUSecs", "InterShotTimeUSecs"});
                pt.shotCount          = readInt(po, {"shotCount", "ShotCount"});
                pt.massGrams          = readDouble(po, {"massGrams", "MassGrams"});
                if (pt.openTimeUsecs < 0 || pt.interShotTimeUsecs < 0 || pt.shotCount < 0) {
                    return failWith(err, DispenseError::Kind::Configuration,
                                    QString("Negative value in calibration point for valve %1")
                                        .arg(channel.valveChannelNumber));
                }
                table.points.push_back(pt);
            }
            table.updateVolumePerShots();
            channel.calibrations.push_back(table);
        }
        data.calibrations.push_back(channel);
    }

    if (out) *out = data;
    return true;
}

bool JsonRecords::parseProtocol(const QJsonObject &o, Protocol *out, DispenseError *err)
{
    Protocol p;
    p.id   = readString(o, {"id", "Id", "_id"});
    p.name = readString(o, {"name", "Name"});

    for (const auto &wv : pick(o, {"wells", "Wells"}).toArray()) {
        const QJsonObject wo = wv.toObject();
        const QString name = readString(wo, {"wellName", "WellName", "well"});
        if (WellGeometry::normalizeWellName(name).isEmpty()) {
            return failWith(err, DispenseError::Kind::Configuration,
                            QString("Protocol '%1' has a bad well name '%2'").arg(p.id, name));
        }
        ProtocolWell &w = p.wellForEdit(name);

        const QJsonObject volumes = pick(wo, {"volumes", "Volumes"}).toObject();
        for (auto it = volumes.begin(); it != volumes.end(); ++it) {
            bool ok = false;
            const int valve = it.key().toInt(&ok);
            if (!ok) continue;
            w.setVolumeUl(valve, it.value().toDouble());
        }
        // flat list form
        if (wo.contains("valve1_ul")) w.setVolumeUl(1, readDouble(wo, {"valve1_ul"}));
        if (wo.contains("valve2_ul")) w.setVolumeUl(2, readDouble(wo, {"valve2_ul"}));
    }

    if (out) *out = p;
    return true;
}

QJsonObject JsonRecords::plateTypeToJson(const PlateType &plate)
{
    QJsonObject o;
    o["Id"]         = plate.id;
    o["Name"]       = plate.name;
    o["WellCount"]  = plate.wellCount;
    o["WellPitch"]  = plate.wellPitchMm;
    o["XOffsetA1"]  = plate.xOffsetA1Mm;
    o["YOffsetA1"]  = plate.yOffsetA1Mm;
    o["Height"]     = plate.heightMm;
    o["WellVolume"] = plate.wellVolumeUl;
    return o;
}

QJsonObject JsonRecords::calibrationToJson(const ActiveCalibrationData &cal)
{
    QJsonArray channels;
    for (const auto &channel : cal.calibrations) {
        QJsonArray tables;
        for (const auto &table : channel.calibrations) {
            QJsonArray points;
            for (const auto &pt : table.points) {
                QJsonObject po;
                po["openTimeUSecs"]      = pt.openTimeUsecs;
                po["interShotTimeUSecs"] = pt.interShotTimeUsecs;
                po["shotCount"]          = pt.shotCount;
                po["massGrams"]          = pt.massGrams;
                points.append(po);
            }
            QJsonObject to;
            to["density"]   = table.densityKgPerL;
            to["fluidName"] = table.fluidName;
            to["pressure"]  = table.pressureBar;
            to["points"]    = points;
            tables.append(to);
        }
        QJsonObject co;
        co["valveChannelNumber"] = channel.valveChannelNumber;
        co["calibrations"]       = tables;
        channels.append(co);
    }
    QJsonObject o;
    o["calibrations"] = channels;
    return o;
}

QJsonObject JsonRecords::protocolToJson(const Protocol &protocol)
{
    QJsonArray wells;
    for (const auto &w : protocol.wells) {
        QJsonObject volumes;
        for (auto it = w.volumesUl.cbegin(); it != w.volumesUl.cend(); ++it)
            volumes[QString::number(it.key())] = it.value();
        QJsonObject wo;
        wo["wellName"] = w.wellName;
        wo["volumes"]  = volumes;
        wells.append(wo);
    }
    QJsonObject o;
    o["id"]    = protocol.id;
    o["name"]  = protocol.name;
    o["wells"] = wells;
    return o;
}
