#ifndef PLATETYPE_H
#define PLATETYPE_H

#include <QString>

struct PlateType
{
    QString id;
    QString name;
    int wellCount = 0;
    double wellPitchMm = 0.0;
    double xOffsetA1Mm = 0.0;
    double yOffsetA1Mm = 0.0;
    double heightMm = 0.0;
    double wellVolumeUl = 0.0;
};

#endif // PLATETYPE_H
