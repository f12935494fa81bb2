#ifndef SERIALCONTROLCONNECTION_H
#define SERIALCONTROLCONNECTION_H

#include <memory>

#include <QMutex>
#include <QSerialPort>
#include <QString>

#include "ControlConnection.h"
#include "common/DispenseError.h"

// Line protocol over a serial port:
//   request  "<command>\n"
//   reply    "OK[,p0,p1,...]\n" or "ERR[,message]\n"
class SerialControlConnection : public ControlConnection
{
public:
    explicit SerialControlConnection(int responseTimeoutMs = 2000);
    ~SerialControlConnection() override;

    bool open(const QString &portName, int baudRate = 115200, DispenseError *err = nullptr);

    bool isOpen() const override;
    void close() override;

    DeviceResponse sendMessageRaw(const QString &command, bool expectAck = true) override;
    bool sendWithoutAck(const QString &command) override;

    static DeviceResponse parseReply(const QByteArray &line);

private:
    bool writeLine(const QString &command);
    bool readLine(int timeoutMs, QByteArray *line);
    void discardUnreadReplies();

    std::unique_ptr<QSerialPort> port_;
    mutable QMutex mutex_;
    int responseTimeoutMs_ = 2000;
    int unreadReplies_ = 0;
};

#endif // SERIALCONTROLCONNECTION_H
