#ifndef DEVICERESULT_H
#define DEVICERESULT_H

#include <QString>
#include <QStringList>

// Uniform contract for every acknowledged device call.
template <typename T>
struct DeviceResult
{
    bool success = false;
    T value{};
    QString errorMessage;

    static DeviceResult ok(const T &v) { return DeviceResult{true, v, QString()}; }
    static DeviceResult failed(const QString &msg) { return DeviceResult{false, T{}, msg}; }
};

// Raw reply to one command line.
struct DeviceResponse
{
    bool success = false;
    QStringList parameters;
    QString errorMessage;

    bool intParameter(int index, qint64 *out) const
    {
        if (index < 0 || index >= parameters.size()) return false;
        bool ok = false;
        const qint64 v = parameters.at(index).trimmed().toLongLong(&ok);
        if (ok && out) *out = v;
        return ok;
    }

    QString stringParameter(int index) const
    {
        return parameters.value(index).trimmed();
    }
};

#endif // DEVICERESULT_H
