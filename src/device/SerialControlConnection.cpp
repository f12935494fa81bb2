#include "SerialControlConnection.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>

namespace {
constexpr int kStaleReplyWaitMs = 50;
}

SerialControlConnection::SerialControlConnection(int responseTimeoutMs)
    : responseTimeoutMs_(responseTimeoutMs)
{
}

SerialControlConnection::~SerialControlConnection()
{
    close();
}

bool SerialControlConnection::open(const QString &portName, int baudRate, DispenseError *err)
{
    QMutexLocker lock(&mutex_);
    if (port_ && port_->isOpen())
        port_->close();

    port_ = std::make_unique<QSerialPort>();
    port_->setPortName(portName);
    port_->setBaudRate(baudRate);
    port_->setDataBits(QSerialPort::Data8);
    port_->setParity(QSerialPort::NoParity);
    port_->setStopBits(QSerialPort::OneStop);
    port_->setFlowControl(QSerialPort::NoFlowControl);

    if (!port_->open(QIODevice::ReadWrite)) {
        const QString why = port_->errorString();
        port_.reset();
        return failWith(err, DispenseError::Kind::Connection,
                        QString("Cannot open serial port %1: %2").arg(portName, why));
    }
    port_->clear();
    unreadReplies_ = 0;
    qInfo() << "[INFO] Opened" << portName << "at" << baudRate << "baud";
    return true;
}

bool SerialControlConnection::isOpen() const
{
    QMutexLocker lock(&mutex_);
    return port_ && port_->isOpen();
}

void SerialControlConnection::close()
{
    QMutexLocker lock(&mutex_);
    if (port_) {
        if (port_->isOpen()) port_->close();
        port_.reset();
    }
}

DeviceResponse SerialControlConnection::parseReply(const QByteArray &line)
{
    DeviceResponse r;
    const QString text = QString::fromLatin1(line).trimmed();
    if (text.isEmpty()) {
        r.errorMessage = "Empty reply";
        return r;
    }

    QStringList fields = text.split(',');
    const QString status = fields.takeFirst().trimmed().toUpper();
    if (status == "OK") {
        r.success = true;
        r.parameters = fields;
    } else if (status == "ERR") {
        r.errorMessage = fields.isEmpty() ? QString("Device reported an error")
                                          : fields.join(',').trimmed();
    } else {
        r.errorMessage = QString("Unrecognised reply '%1'").arg(text);
    }
    return r;
}

bool SerialControlConnection::writeLine(const QString &command)
{
    const QByteArray bytes = command.toLatin1() + '\n';
    if (port_->write(bytes) != bytes.size())
        return false;
    return port_->waitForBytesWritten(responseTimeoutMs_);
}

bool SerialControlConnection::readLine(int timeoutMs, QByteArray *line)
{
    QElapsedTimer timer;
    timer.start();
    while (!port_->canReadLine()) {
        const int remaining = timeoutMs - int(timer.elapsed());
        if (remaining <= 0 || !port_->waitForReadyRead(remaining))
            return false;
    }
    *line = port_->readLine();
    return true;
}

void SerialControlConnection::discardUnreadReplies()
{
    QByteArray stale;
    while (unreadReplies_ > 0 && readLine(kStaleReplyWaitMs, &stale)) {
        qDebug() << "[SERIAL] Discarded reply" << stale.trimmed();
        --unreadReplies_;
    }
    unreadReplies_ = 0;
}

DeviceResponse SerialControlConnection::sendMessageRaw(const QString &command, bool expectAck)
{
    QMutexLocker lock(&mutex_);
    DeviceResponse r;
    if (!port_ || !port_->isOpen()) {
        r.errorMessage = "Serial port is not open";
        return r;
    }

    discardUnreadReplies();

    if (!writeLine(command)) {
        r.errorMessage = QString("Write failed: %1").arg(port_->errorString());
        return r;
    }
    if (!expectAck) {
        ++unreadReplies_;
        r.success = true;
        return r;
    }

    QByteArray line;
    if (!readLine(responseTimeoutMs_, &line)) {
        // A late reply must not be taken as the answer to the next command
        ++unreadReplies_;
        r.errorMessage = QString("No reply to '%1' within %2 ms")
                             .arg(command.section(',', 0, 0))
                             .arg(responseTimeoutMs_);
        return r;
    }
    return parseReply(line);
}

bool SerialControlConnection::sendWithoutAck(const QString &command)
{
    QMutexLocker lock(&mutex_);
    if (!port_ || !port_->isOpen())
        return false;
    if (!writeLine(command))
        return false;
    ++unreadReplies_;
    return true;
}
