#include "ProtocolCsv.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace {

QString volumeText(double ul)
{
    return QString::number(ul, 'g', 15);
}

bool parseVolume(const QString &cell, double *out)
{
    const QString t = cell.trimmed();
    if (t.isEmpty()) { *out = 0.0; return true; }
    bool ok = false;
    const double v = t.toDouble(&ok);
    if (!ok || v < 0.0) return false;
    *out = v;
    return true;
}

} // namespace

QString ProtocolCsv::header()
{
    return QStringLiteral("Well,Valve1 (ul),Valve2 (ul)");
}

QStringList ProtocolCsv::renderLines(const Protocol &protocol)
{
    QStringList L;
    L << header();
    for (const auto &r : Protocol::toList(protocol)) {
        L << QString("%1,%2,%3")
                 .arg(r.wellName, volumeText(r.valve1Ul), volumeText(r.valve2Ul));
    }
    return L;
}

bool ProtocolCsv::parseLines(const QStringList &lines, Protocol *out, DispenseError *err)
{
    int i = 0;
    while (i < lines.size() && lines.at(i).trimmed().isEmpty()) ++i;
    if (i == lines.size()) {
        return failWith(err, DispenseError::Kind::Configuration, "Protocol CSV is empty");
    }

    const QStringList head = lines.at(i).split(',');
    if (head.size() < 3 || head.at(0).trimmed().compare("Well", Qt::CaseInsensitive) != 0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Unexpected protocol CSV header '%1', expected '%2'")
                            .arg(lines.at(i).trimmed(), header()));
    }
    ++i;

    QVector<WellVolumes> rows;
    for (; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty()) continue;

        const QStringList cells = line.split(',');
        const int lineNo = i + 1;
        if (cells.size() < 3) {
            return failWith(err, DispenseError::Kind::Configuration,
                            QString("Protocol CSV line %1: expected 3 columns").arg(lineNo));
        }

        WellVolumes r;
        r.wellName = WellGeometry::normalizeWellName(cells.at(0));
        if (r.wellName.isEmpty()) {
            return failWith(err, DispenseError::Kind::Configuration,
                            QString("Protocol CSV line %1: bad well name '%2'")
                                .arg(lineNo).arg(cells.at(0).trimmed()));
        }
        if (!parseVolume(cells.at(1), &r.valve1Ul) || !parseVolume(cells.at(2), &r.valve2Ul)) {
            return failWith(err, DispenseError::Kind::Configuration,
                            QString("Protocol CSV line %1: bad volume").arg(lineNo));
        }
        rows.push_back(r);
    }

    if (out) *out = Protocol::fromList(rows);
    return true;
}

bool ProtocolCsv::importFile(const QString &path, Protocol *out, DispenseError *err)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Cannot open protocol CSV %1").arg(path));
    }

    QStringList lines;
    QTextStream ts(&f);
    while (!ts.atEnd())
        lines << ts.readLine();

    Protocol p;
    if (!parseLines(lines, &p, err))
        return false;
    p.name = QFileInfo(path).completeBaseName();

    qDebug() << "[INFO] Imported protocol" << p.name << "with" << p.wells.size() << "wells";
    if (out) *out = p;
    return true;
}

bool ProtocolCsv::exportFile(const Protocol &protocol, const QString &path, DispenseError *err)
{
    QDir().mkpath(QFileInfo(path).dir().path());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Cannot open %1 for write").arg(path));
    }
    QTextStream ts(&f);
    for (const auto &ln : renderLines(protocol)) ts << ln << "\n";
    return true;
}
