#ifndef CONTROLCONNECTION_H
#define CONTROLCONNECTION_H

#include <QString>

#include "DeviceResult.h"

// Half-duplex command transport to the motor controllers: one request,
// one reply. Framing belongs to the implementation.
class ControlConnection
{
public:
    virtual ~ControlConnection() = default;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;

    // expectAck == false sends the line and returns without reading a reply.
    virtual DeviceResponse sendMessageRaw(const QString &command, bool expectAck = true) = 0;

    // Out-of-band line (ABORT); never waits for the device.
    virtual bool sendWithoutAck(const QString &command) = 0;

    // Acknowledged command whose reply carries an integer in parameter 0.
    DeviceResult<qint64> queryInt(const QString &command)
    {
        const DeviceResponse r = sendMessageRaw(command, true);
        if (!r.success)
            return DeviceResult<qint64>::failed(r.errorMessage);
        qint64 v = 0;
        if (!r.intParameter(0, &v)) {
            return DeviceResult<qint64>::failed(
                QString("No integer in reply to %1").arg(command.section(',', 0, 0)));
        }
        return DeviceResult<qint64>::ok(v);
    }

    DeviceResponse sendMessage(const QString &name, int controller, int axis)
    {
        return sendMessageRaw(QString("%1,%2,%3").arg(name).arg(controller).arg(axis));
    }

    DeviceResponse sendMessage(const QString &name, int controller, int axis, qint64 value)
    {
        return sendMessageRaw(QString("%1,%2,%3,%4").arg(name).arg(controller).arg(axis).arg(value));
    }
};

#endif // CONTROLCONNECTION_H
