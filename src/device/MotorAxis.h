#ifndef MOTORAXIS_H
#define MOTORAXIS_H

#include <QString>

#include "ControlConnection.h"
#include "common/CancellationToken.h"
#include "common/DispenseError.h"

// Handle on one axis of a motor controller. Does not own the connection.
class MotorAxis
{
public:
    MotorAxis() = default;
    MotorAxis(ControlConnection *connection, int controllerNumber, int axisNumber,
              const QString &label);

    bool writeParam(const QString &param, qint64 value, DispenseError *err = nullptr);
    bool readBool(const QString &param, bool *value, DispenseError *err = nullptr);

    bool clearErrorCode(DispenseError *err = nullptr);
    bool isHomed(bool *homed, DispenseError *err = nullptr);
    bool home(DispenseError *err = nullptr);
    bool disable(DispenseError *err = nullptr);

    bool waitForIsHomed(int timeoutMs, int pollIntervalMs,
                        const CancellationToken *cancel = nullptr,
                        DispenseError *err = nullptr);
    bool waitForPositionSettledAndInRange(int timeoutMs, int pollIntervalMs,
                                          const CancellationToken *cancel = nullptr,
                                          DispenseError *err = nullptr);

private:
    bool command(const QString &text, DeviceResponse *reply, DispenseError *err);

    ControlConnection *connection_ = nullptr;
    int controllerNumber_ = 0;
    int axisNumber_ = 0;
    QString label_;
};

#endif // MOTORAXIS_H
