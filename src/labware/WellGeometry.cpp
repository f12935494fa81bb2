#include "WellGeometry.h"

#include <cmath>

#include <QDebug>

int WellXY::xMicrons() const { return WellGeometry::millimetresToMicrons(xMm); }
int WellXY::yMicrons() const { return WellGeometry::millimetresToMicrons(yMm); }

QPair<int, int> WellGeometry::rowsAndColumnsForWellCount(int wellCount, bool *exact)
{
    if (exact) *exact = true;
    switch (wellCount) {
    case 6:    return {2, 3};
    case 12:   return {3, 4};
    case 24:   return {4, 6};
    case 48:   return {6, 8};
    case 96:   return {8, 12};
    case 384:  return {16, 24};
    case 1536: return {32, 48};
    default:
        break;
    }

    // Not an SBS format: square approximation
    if (exact) *exact = false;
    const int d = wellCount > 0 ? int(std::lround(std::sqrt(double(wellCount)))) : 0;
    return {d, d};
}

bool WellGeometry::checkedRowsAndColumns(int wellCount,
                                         int *rows,
                                         int *columns,
                                         DispenseError *err)
{
    if (wellCount <= 0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Invalid well count for plate: %1").arg(wellCount));
    }
    bool exact = true;
    const auto rc = rowsAndColumnsForWellCount(wellCount, &exact);
    if (!exact) {
        qWarning("[WARN] Well count %d is not an SBS format, using %dx%d",
                 wellCount, rc.first, rc.second);
    }
    if (rows) *rows = rc.first;
    if (columns) *columns = rc.second;
    return true;
}

QString WellGeometry::rowName(int row)
{
    QString name;
    int n = row;
    while (n >= 0) {
        name.prepend(QChar('A' + n % 26));
        n = n / 26 - 1;
    }
    return name;
}

QString WellGeometry::wellName(int row, int column)
{
    return QString("%1%2").arg(rowName(row)).arg(column + 1);
}

QString WellGeometry::wellName(const WellAddress &well)
{
    return wellName(well.row, well.column);
}

bool WellGeometry::parseWellName(const QString &name, WellAddress *out)
{
    const QString t = name.trimmed().toUpper();
    int i = 0;
    int row = 0;
    while (i < t.size() && t.at(i) >= QChar('A') && t.at(i) <= QChar('Z')) {
        if (i == kMaxRowLetters)
            return false;
        row = row * 26 + (t.at(i).unicode() - 'A' + 1);
        ++i;
    }
    if (i == 0 || i == t.size())
        return false;

    bool ok = false;
    const int col = t.mid(i).toInt(&ok);
    if (!ok || col < 1)
        return false;

    if (out) {
        out->row = row - 1;
        out->column = col - 1;
    }
    return true;
}

QString WellGeometry::normalizeWellName(const QString &name)
{
    WellAddress w;
    if (!parseWellName(name, &w))
        return QString();
    return wellName(w);
}

WellXY WellGeometry::wellPhysicalXY(const PlateType &plate, const WellAddress &well)
{
    WellXY xy;
    xy.xMm = plate.xOffsetA1Mm + plate.wellPitchMm * well.column;
    xy.yMm = plate.yOffsetA1Mm + plate.wellPitchMm * well.row;
    return xy;
}

QVector<QVector<WellAddress>> WellGeometry::wellSequenceLines(int wellCount)
{
    const auto rc = rowsAndColumnsForWellCount(wellCount);
    QVector<QVector<WellAddress>> lines;
    lines.reserve(rc.first);
    for (int r = 0; r < rc.first; ++r) {
        QVector<WellAddress> line;
        line.reserve(rc.second);
        for (int c = 0; c < rc.second; ++c)
            line.push_back(WellAddress{r, c});
        lines.push_back(line);
    }
    return lines;
}

int WellGeometry::dispenseWellDeltaMicrons(int wellCount)
{
    return wellCount > 384 ? 250 : 750;
}

int WellGeometry::millimetresToMicrons(double mm)
{
    return int(std::lround(mm * 1000.0));
}
