#include "ProtocolData.h"

#include <QUuid>

namespace {

// Canonical key for a well name; names that do not parse fall back to a
// trimmed upper-case form so they still match themselves.
QString wellKey(const QString &wellName)
{
    const QString norm = WellGeometry::normalizeWellName(wellName);
    return norm.isEmpty() ? wellName.trimmed().toUpper() : norm;
}

} // namespace

const ProtocolWell *Protocol::findWell(const QString &wellName) const
{
    const QString key = wellKey(wellName);
    for (const auto &w : wells) {
        // Stored names are usually already canonical
        if (w.wellName == key || wellKey(w.wellName) == key)
            return &w;
    }
    return nullptr;
}

QHash<QString, const ProtocolWell *> Protocol::wellIndex() const
{
    QHash<QString, const ProtocolWell *> index;
    index.reserve(wells.size());
    for (const auto &w : wells) {
        const QString key = wellKey(w.wellName);
        if (!index.contains(key))
            index.insert(key, &w);
    }
    return index;
}

ProtocolWell &Protocol::wellForEdit(const QString &wellName)
{
    const QString key = wellKey(wellName);
    for (auto &w : wells) {
        if (w.wellName == key || wellKey(w.wellName) == key)
            return w;
    }
    ProtocolWell pw;
    const QString norm = WellGeometry::normalizeWellName(wellName);
    pw.wellName = norm.isEmpty() ? wellName.trimmed() : norm;
    wells.push_back(pw);
    return wells.last();
}

double Protocol::dispenseVolumeUl(const WellAddress &well, int valveNumber) const
{
    return dispenseVolumeUl(WellGeometry::wellName(well), valveNumber);
}

double Protocol::dispenseVolumeUl(const QString &wellName, int valveNumber) const
{
    const ProtocolWell *w = findWell(wellName);
    return w ? w->volumeUl(valveNumber) : 0.0;
}

Protocol Protocol::fromList(const QVector<WellVolumes> &rows, const QString &name)
{
    Protocol p;
    p.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    p.name = name;
    for (const auto &r : rows) {
        ProtocolWell &w = p.wellForEdit(r.wellName);
        w.setVolumeUl(1, r.valve1Ul);
        w.setVolumeUl(2, r.valve2Ul);
    }
    return p;
}

QVector<WellVolumes> Protocol::toList(const Protocol &protocol)
{
    QVector<WellVolumes> rows;
    rows.reserve(protocol.wells.size());
    for (const auto &w : protocol.wells) {
        WellVolumes r;
        r.wellName = w.wellName;
        r.valve1Ul = w.volumeUl(1);
        r.valve2Ul = w.volumeUl(2);
        rows.push_back(r);
    }
    return rows;
}
