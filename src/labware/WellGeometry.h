#ifndef WELLGEOMETRY_H
#define WELLGEOMETRY_H

#include <QPair>
#include <QString>
#include <QVector>

#include "PlateType.h"
#include "common/DispenseError.h"

struct WellAddress
{
    int row = 0;     // 0 = A
    int column = 0;  // 0 = column 1

    bool operator==(const WellAddress &o) const { return row == o.row && column == o.column; }
    bool operator!=(const WellAddress &o) const { return !(*this == o); }
};

struct WellXY
{
    double xMm = 0.0;
    double yMm = 0.0;

    int xMicrons() const;
    int yMicrons() const;
};

class WellGeometry
{
public:
    // Longest row name parseWellName accepts ("ZZZZ")
    static constexpr int kMaxRowLetters = 4;

    // SBS layouts for 6..1536 wells. Other counts fall back to
    // round(sqrt(n)) x round(sqrt(n)) and return false in *exact.
    static QPair<int, int> rowsAndColumnsForWellCount(int wellCount, bool *exact = nullptr);

    // Fails for counts that cannot describe a plate (<= 0).
    static bool checkedRowsAndColumns(int wellCount,
                                      int *rows,
                                      int *columns,
                                      DispenseError *err = nullptr);

    // A, B, ... Z, AA, AB ... (bijective base 26)
    static QString rowName(int row);
    static QString wellName(int row, int column);
    static QString wellName(const WellAddress &well);

    // "A1", "h12", "AA3" -> address. False for malformed names, row names
    // longer than kMaxRowLetters or columns beyond int range.
    static bool parseWellName(const QString &name, WellAddress *out);

    // Canonical upper-case form, e.g. "a01" -> "A1". Empty for malformed names.
    static QString normalizeWellName(const QString &name);

    static WellXY wellPhysicalXY(const PlateType &plate, const WellAddress &well);

    // One line per row, wells left to right.
    static QVector<QVector<WellAddress>> wellSequenceLines(int wellCount);

    // Minimum stepping distance the firmware uses between wells of a line.
    static int dispenseWellDeltaMicrons(int wellCount);

    static int millimetresToMicrons(double mm);
};

#endif // WELLGEOMETRY_H
