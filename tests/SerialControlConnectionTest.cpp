#include <gtest/gtest.h>

#include <QtGlobal>

#ifdef Q_OS_LINUX
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>
#endif

#include "device/SerialControlConnection.h"

#ifdef Q_OS_LINUX
namespace {

// Pseudo-terminal pair; the test plays the device on the master side.
class PseudoTerminal
{
public:
    PseudoTerminal()
    {
        master_ = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0)
            return;
        if (grantpt(master_) != 0 || unlockpt(master_) != 0) {
            ::close(master_);
            master_ = -1;
            return;
        }
        const char *name = ptsname(master_);
        if (name)
            slaveName_ = QString::fromLocal8Bit(name);
    }

    ~PseudoTerminal()
    {
        if (master_ >= 0)
            ::close(master_);
    }

    PseudoTerminal(const PseudoTerminal &) = delete;
    PseudoTerminal &operator=(const PseudoTerminal &) = delete;

    bool isValid() const { return master_ >= 0 && !slaveName_.isEmpty(); }
    QString slaveName() const { return slaveName_; }

    bool reply(const QByteArray &bytes)
    {
        return ::write(master_, bytes.constData(), size_t(bytes.size())) == bytes.size();
    }

private:
    int master_ = -1;
    QString slaveName_;
};

} // namespace
#endif

TEST(SerialControlConnection, ParsesAcknowledgement)
{
    const DeviceResponse r = SerialControlConnection::parseReply("OK,1234, 5\r\n");
    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.parameters.size(), 2);
    qint64 v = 0;
    EXPECT_TRUE(r.intParameter(0, &v));
    EXPECT_EQ(v, 1234);
    EXPECT_TRUE(r.intParameter(1, &v));
    EXPECT_EQ(v, 5);
    EXPECT_FALSE(r.intParameter(2, &v));
}

TEST(SerialControlConnection, ParsesBareOk)
{
    const DeviceResponse r = SerialControlConnection::parseReply("ok\n");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.parameters.isEmpty());
}

TEST(SerialControlConnection, ParsesErrorWithMessage)
{
    const DeviceResponse r = SerialControlConnection::parseReply("ERR,Axis not homed, code 7\n");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorMessage, "Axis not homed, code 7");

    EXPECT_FALSE(SerialControlConnection::parseReply("ERR\n").errorMessage.isEmpty());
}

TEST(SerialControlConnection, RejectsGarbage)
{
    EXPECT_FALSE(SerialControlConnection::parseReply("").success);
    const DeviceResponse r = SerialControlConnection::parseReply("HELLO");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.errorMessage.contains("HELLO"));
}

TEST(SerialControlConnection, UnopenedPortFailsRequests)
{
    SerialControlConnection conn(50);
    EXPECT_FALSE(conn.isOpen());
    EXPECT_FALSE(conn.sendMessageRaw("READ,1,1,IS_HOMED").success);
    EXPECT_FALSE(conn.sendWithoutAck("ABORT,1,0"));
}

TEST(SerialControlConnection, OpeningMissingPortIsConnectionError)
{
    SerialControlConnection conn(50);
    DispenseError err;
    EXPECT_FALSE(conn.open("/dev/does-not-exist-d2", 115200, &err));
    EXPECT_EQ(err.kind, DispenseError::Kind::Connection);
}

#ifdef Q_OS_LINUX
TEST(SerialControlConnection, LateReplyIsNotTakenForTheNextCommand)
{
    PseudoTerminal device;
    if (!device.isValid())
        GTEST_SKIP() << "No pseudo-terminal available";

    SerialControlConnection conn(100);
    DispenseError err;
    if (!conn.open(device.slaveName(), 115200, &err))
        GTEST_SKIP() << err.toString().toStdString();

    const DeviceResponse first = conn.sendMessageRaw("READ,2,1,POSITION");
    EXPECT_FALSE(first.success);
    EXPECT_TRUE(first.errorMessage.contains("READ")) << first.errorMessage.toStdString();

    // The answer to the timed-out request arrives, then the one to the next
    ASSERT_TRUE(device.reply("OK,1\n"));
    ASSERT_TRUE(device.reply("OK,2\n"));

    const DeviceResponse second = conn.sendMessageRaw("READ,2,1,IS_HOMED");
    ASSERT_TRUE(second.success) << second.errorMessage.toStdString();
    EXPECT_EQ(second.parameters, QStringList{"2"});
}

TEST(SerialControlConnection, RepliesPairWithTheirCommands)
{
    PseudoTerminal device;
    if (!device.isValid())
        GTEST_SKIP() << "No pseudo-terminal available";

    SerialControlConnection conn(500);
    DispenseError err;
    if (!conn.open(device.slaveName(), 115200, &err))
        GTEST_SKIP() << err.toString().toStdString();

    ASSERT_TRUE(device.reply("ERR,Axis not homed\n"));
    const DeviceResponse r = conn.sendMessageRaw("MOVE_Z,2,1,1000");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorMessage, "Axis not homed");
}
#endif
