#ifndef FAKECONTROLCONNECTION_H
#define FAKECONTROLCONNECTION_H

#include <QMap>
#include <QQueue>
#include <QString>
#include <QStringList>

#include "device/ControlConnection.h"

// Scripted stand-in for the serial link. Replies are chosen by the longest
// matching command prefix: queued one-shot replies first, then sticky ones.
// Anything unscripted is acknowledged with no parameters.
class FakeControlConnection : public ControlConnection
{
public:
    FakeControlConnection()
    {
        setReply("READ,", ok({"1"}));
        setReply("READ_STRING,", ok({"D2-0001"}));
        setReply("DISPENSE,", ok({"0"}));
        setReply("GET_DISPENSE_STATE,", ok({"1"}));
        setReply("GET_VALVE_STATE,", ok({"0"}));
    }

    static DeviceResponse ok(const QStringList &params = QStringList())
    {
        DeviceResponse r;
        r.success = true;
        r.parameters = params;
        return r;
    }

    static DeviceResponse nack(const QString &message)
    {
        DeviceResponse r;
        r.errorMessage = message;
        return r;
    }

    void setReply(const QString &prefix, const DeviceResponse &reply) { sticky_[prefix] = reply; }
    void queueReply(const QString &prefix, const DeviceResponse &reply) { queued_[prefix].enqueue(reply); }
    void failOn(const QString &prefix, const QString &message = "ERR") { setReply(prefix, nack(message)); }

    bool isOpen() const override { return open_; }
    void close() override { open_ = false; }

    DeviceResponse sendMessageRaw(const QString &command, bool expectAck = true) override
    {
        sent_ << command;
        if (!open_) return nack("closed");
        if (!expectAck) return ok();

        QString best;
        for (auto it = queued_.cbegin(); it != queued_.cend(); ++it) {
            if (!it.value().isEmpty() && command.startsWith(it.key()) && it.key().size() > best.size())
                best = it.key();
        }
        if (!best.isEmpty())
            return queued_[best].dequeue();

        for (auto it = sticky_.cbegin(); it != sticky_.cend(); ++it) {
            if (command.startsWith(it.key()) && it.key().size() > best.size())
                best = it.key();
        }
        return best.isEmpty() ? ok() : sticky_.value(best);
    }

    bool sendWithoutAck(const QString &command) override
    {
        unacked_ << command;
        return open_;
    }

    const QStringList &sent() const { return sent_; }
    const QStringList &unacked() const { return unacked_; }

    QStringList sentWithPrefix(const QString &prefix) const
    {
        QStringList out;
        for (const QString &c : sent_) {
            if (c.startsWith(prefix)) out << c;
        }
        return out;
    }

    int indexOf(const QString &command) const { return sent_.indexOf(command); }

    int lastIndexWithPrefix(const QString &prefix) const
    {
        for (int i = sent_.size() - 1; i >= 0; --i) {
            if (sent_.at(i).startsWith(prefix)) return i;
        }
        return -1;
    }

private:
    bool open_ = true;
    QMap<QString, DeviceResponse> sticky_;
    QMap<QString, QQueue<DeviceResponse>> queued_;
    QStringList sent_;
    QStringList unacked_;
};

#endif // FAKECONTROLCONNECTION_H
