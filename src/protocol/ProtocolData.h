#ifndef PROTOCOLDATA_H
#define PROTOCOLDATA_H

#include <QHash>
#include <QMap>
#include <QString>
#include <QVector>

#include "labware/WellGeometry.h"

struct ProtocolWell
{
    QString wellName;
    QMap<int, double> volumesUl;  // valve number -> volume

    double volumeUl(int valveNumber) const { return volumesUl.value(valveNumber, 0.0); }
    void setVolumeUl(int valveNumber, double ul) { volumesUl.insert(valveNumber, ul); }
};

// Flat per-well row used by the list builders, one column per valve.
struct WellVolumes
{
    QString wellName;
    double valve1Ul = 0.0;
    double valve2Ul = 0.0;
};

class Protocol
{
public:
    QString id;
    QString name;
    QVector<ProtocolWell> wells;

    // Case-insensitive; "a01" matches "A1". nullptr when absent.
    const ProtocolWell *findWell(const QString &wellName) const;
    ProtocolWell &wellForEdit(const QString &wellName);

    // Normalized well name -> well, for repeated lookups over one protocol.
    // The first well wins when two names normalize alike. Pointers are valid
    // until wells is modified.
    QHash<QString, const ProtocolWell *> wellIndex() const;

    // Zero for wells the protocol does not mention.
    double dispenseVolumeUl(const WellAddress &well, int valveNumber) const;
    double dispenseVolumeUl(const QString &wellName, int valveNumber) const;

    bool isEmpty() const { return wells.isEmpty(); }

    static Protocol fromList(const QVector<WellVolumes> &rows,
                             const QString &name = QStringLiteral("Dynamic Protocol"));
    static QVector<WellVolumes> toList(const Protocol &protocol);
};

#endif // PROTOCOLDATA_H
