#include "MotorAxis.h"

#include <QDebug>
#include <QDeadlineTimer>
#include <QThread>

MotorAxis::MotorAxis(ControlConnection *connection, int controllerNumber, int axisNumber,
                     const QString &label)
    : connection_(connection),
    controllerNumber_(controllerNumber),
    axisNumber_(axisNumber),
    label_(label)
{
}

bool MotorAxis::command(const QString &text, DeviceResponse *reply, DispenseError *err)
{
    if (!connection_ || !connection_->isOpen()) {
        return failWith(err, DispenseError::Kind::Connection,
                        QString("%1: control connection is not open").arg(label_));
    }
    const DeviceResponse r = connection_->sendMessageRaw(text, true);
    if (!r.success) {
        return failWith(err, DispenseError::Kind::Transport,
                        QString("%1: '%2' failed: %3").arg(label_, text, r.errorMessage));
    }
    if (reply) *reply = r;
    return true;
}

bool MotorAxis::writeParam(const QString &param, qint64 value, DispenseError *err)
{
    return command(QString("WRITE,%1,%2,%3,%4")
                       .arg(controllerNumber_).arg(axisNumber_).arg(param).arg(value),
                   nullptr, err);
}

bool MotorAxis::readBool(const QString &param, bool *value, DispenseError *err)
{
    DeviceResponse r;
    const QString text = QString("READ,%1,%2,%3").arg(controllerNumber_).arg(axisNumber_).arg(param);
    if (!command(text, &r, err))
        return false;
    qint64 v = 0;
    if (!r.intParameter(0, &v)) {
        return failWith(err, DispenseError::Kind::Transport,
                        QString("%1: no value in reply to %2").arg(label_, param));
    }
    if (value) *value = (v != 0);
    return true;
}

bool MotorAxis::clearErrorCode(DispenseError *err)
{
    return writeParam("ERROR_CODE", 0, err);
}

bool MotorAxis::isHomed(bool *homed, DispenseError *err)
{
    return readBool("IS_HOMED", homed, err);
}

bool MotorAxis::home(DispenseError *err)
{
    return command(QString("HOME,%1,%2").arg(controllerNumber_).arg(axisNumber_), nullptr, err);
}

bool MotorAxis::disable(DispenseError *err)
{
    return command(QString("SET_MODE,%1,%2,DISABLED").arg(controllerNumber_).arg(axisNumber_),
                   nullptr, err);
}

bool MotorAxis::waitForIsHomed(int timeoutMs, int pollIntervalMs,
                               const CancellationToken *cancel, DispenseError *err)
{
    QDeadlineTimer deadline(timeoutMs);
    while (true) {
        if (cancel && cancel->isCancelled())
            return failWith(err, DispenseError::Kind::Cancelled, QString("%1: homing cancelled").arg(label_));

        bool homed = false;
        if (!isHomed(&homed, err))
            return false;
        if (homed)
            return true;
        if (deadline.hasExpired()) {
            return failWith(err, DispenseError::Kind::Timeout,
                            QString("%1: not homed within %2 ms").arg(label_).arg(timeoutMs));
        }
        QThread::msleep(pollIntervalMs);
    }
}

bool MotorAxis::waitForPositionSettledAndInRange(int timeoutMs, int pollIntervalMs,
                                                 const CancellationToken *cancel,
                                                 DispenseError *err)
{
    QDeadlineTimer deadline(timeoutMs);
    while (true) {
        if (cancel && cancel->isCancelled())
            return failWith(err, DispenseError::Kind::Cancelled, QString("%1: move cancelled").arg(label_));

        bool settled = false, inRange = false;
        if (!readBool("IS_POSITION_SETTLED", &settled, err))
            return false;
        if (settled && !readBool("IS_POSITION_IN_RANGE", &inRange, err))
            return false;
        if (settled && inRange)
            return true;
        if (deadline.hasExpired()) {
            return failWith(err, DispenseError::Kind::Timeout,
                            QString("%1: position not settled within %2 ms").arg(label_).arg(timeoutMs));
        }
        QThread::msleep(pollIntervalMs);
    }
}
