#ifndef PROTOCOLCSV_H
#define PROTOCOLCSV_H

#include <QString>
#include <QStringList>

#include "ProtocolData.h"
#include "common/DispenseError.h"

// Well,Valve1 (ul),Valve2 (ul)
class ProtocolCsv
{
public:
    static QString header();

    static bool importFile(const QString &path,
                           Protocol *out,
                           DispenseError *err = nullptr);
    static bool exportFile(const Protocol &protocol,
                           const QString &path,
                           DispenseError *err = nullptr);

    static bool parseLines(const QStringList &lines,
                           Protocol *out,
                           DispenseError *err = nullptr);
    static QStringList renderLines(const Protocol &protocol);
};

#endif // PROTOCOLCSV_H
