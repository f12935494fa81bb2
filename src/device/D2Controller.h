#ifndef D2CONTROLLER_H
#define D2CONTROLLER_H

#include <memory>

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "ControlConnection.h"
#include "MotorAxis.h"
#include "calibration/CalibrationModel.h"
#include "common/CancellationToken.h"
#include "common/DispenseError.h"
#include "common/DispenseSettings.h"
#include "compiler/DispenseCompiler.h"
#include "dataaccess/DataAccess.h"
#include "labware/PlateType.h"
#include "protocol/ProtocolData.h"

// Session with one D2 dispenser: the arms controller (two arm axes, both
// valves) and the Z controller (Z axis, plate clamp) on one serial link.
//
// All hardware calls block the calling thread and must come from the thread
// that opened the session. Long operations take a CancellationToken; a
// cancelled wait sends ABORT without acknowledgment and fails with
// DispenseError::Kind::Cancelled, after which the operation's own cleanup runs.
class D2Controller : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Disconnected,
        Idle,
        Homing,
        Moving,
        Dispensing,
        Flushing,
        Error
    };
    Q_ENUM(State)

    enum class DispenseState { Error = -1, Running = 0, Ended = 1 };
    enum class ValveCommandState { Idle = 0, Pending = 1 };

    static constexpr int kValveCount = DispenseCompiler::kValveCount;

    // Protocol and calibration are fetched when not supplied.
    struct DispenseRequest {
        QString protocolId;
        const Protocol *protocol = nullptr;
        const ActiveCalibrationData *calibration = nullptr;
        QString plateTypeGuid;
    };

    struct DispenseRunResult {
        qint64 estimatedDurationMs = 0;
        qint64 elapsedMs = 0;
        int commandCount = 0;
    };

    explicit D2Controller(const DispenseSettings &settings,
                          std::shared_ptr<DataAccess> dataAccess,
                          QObject *parent = nullptr);
    ~D2Controller() override;

    // ---- connection ------------------------------------------------------
    bool openComms(const QString &portName, int baudRate = 115200,
                   DispenseError *err = nullptr);
    bool attachConnection(std::unique_ptr<ControlConnection> connection,
                          DispenseError *err = nullptr);
    void dispose();
    bool isConnected() const;
    State state() const { return state_; }
    const DispenseSettings &settings() const { return settings_; }

    bool readSerialId(QString *serialId, DispenseError *err = nullptr);

    // ---- motion ----------------------------------------------------------
    bool clearMotorErrorFlags(DispenseError *err = nullptr);
    bool homeZAxis(const CancellationToken *cancel = nullptr, DispenseError *err = nullptr);
    bool moveZToHeight(double heightMm, const CancellationToken *cancel = nullptr,
                       DispenseError *err = nullptr);
    bool setClamp(bool engaged, DispenseError *err = nullptr);
    bool parkArms(const CancellationToken *cancel = nullptr, DispenseError *err = nullptr);
    bool unparkArms(const CancellationToken *cancel = nullptr, DispenseError *err = nullptr);
    bool disableArms(DispenseError *err = nullptr);
    bool disableZ(DispenseError *err = nullptr);
    bool disableAllMotors(DispenseError *err = nullptr);

    // ---- valves and dispensing -------------------------------------------
    QString createValveCommand(int valveNumber, int openTimeUsecs,
                               int shotCount, int interShotTimeUsecs) const;
    bool fireValve(int valveNumber, int openTimeUsecs, DispenseError *err = nullptr);
    bool compileDispense(const ActiveCalibrationData &calibration,
                         const Protocol &protocol,
                         const PlateType &plate,
                         QStringList *commands,
                         DispenseError *err = nullptr) const;
    bool startDispense(qint64 *estimatedDurationMs, DispenseError *err = nullptr);
    bool getDispenseState(DispenseState *state, DispenseError *err = nullptr);
    bool waitForDispenseComplete(qint64 estimatedDurationMs,
                                 const CancellationToken *cancel = nullptr,
                                 DispenseError *err = nullptr);
    bool getValveState(ValveCommandState *state, DispenseError *err = nullptr);
    bool awaitIdleValveState(int timeoutMs, const CancellationToken *cancel = nullptr,
                             DispenseError *err = nullptr);

    bool runDispense(const DispenseRequest &request,
                     const CancellationToken *cancel = nullptr,
                     DispenseRunResult *result = nullptr,
                     DispenseError *err = nullptr);
    bool runDispense(const QString &protocolId, const QString &plateTypeGuid,
                     const CancellationToken *cancel = nullptr,
                     DispenseRunResult *result = nullptr,
                     DispenseError *err = nullptr);
    bool runDispenseFromList(const QVector<WellVolumes> &wells,
                             const QString &plateTypeGuid,
                             const ActiveCalibrationData *calibration = nullptr,
                             const CancellationToken *cancel = nullptr,
                             DispenseRunResult *result = nullptr,
                             DispenseError *err = nullptr);
    bool runDispenseFromCsv(const QString &csvPath,
                            const QString &plateTypeGuid,
                            const CancellationToken *cancel = nullptr,
                            DispenseRunResult *result = nullptr,
                            DispenseError *err = nullptr);

    bool flush(int valveNumber, double volumeUl,
               const ActiveCalibrationData *calibration = nullptr,
               const CancellationToken *cancel = nullptr,
               DispenseError *err = nullptr);

    // Best effort, no acknowledgment. Leaves motors and clamp alone.
    bool abort();

    // No hardware involved; needs only the data service.
    bool exportProtocolToCsv(const QString &protocolId, const QString &csvPath,
                             DispenseError *err = nullptr);

signals:
    void stateChanged(D2Controller::State state);

private:
    bool requireConnection(const QString &operation, DispenseError *err) const;
    bool sendChecked(const QString &command, DeviceResponse *reply, DispenseError *err);
    bool checkCancelled(const CancellationToken *cancel, const QString &during, DispenseError *err);
    void abortIfCancelled(const DispenseError &error);
    bool requireValveNumber(int valveNumber, DispenseError *err) const;
    bool resolveCalibration(const ActiveCalibrationData *supplied,
                            ActiveCalibrationData *out, DispenseError *err);
    bool runDispenseSteps(const DispenseRequest &request,
                          const CancellationToken *cancel,
                          DispenseRunResult *result,
                          DispenseError *err);
    bool flushSteps(int valveNumber, double volumeUl,
                    const ActiveCalibrationData *calibration,
                    const CancellationToken *cancel,
                    DispenseError *err);
    bool unparkOrPark(bool park, const CancellationToken *cancel, DispenseError *err);
    void releaseHardware(const QString &operation);
    void setState(State state);

    DispenseSettings settings_;
    std::shared_ptr<DataAccess> dataAccess_;
    std::unique_ptr<ControlConnection> connection_;
    MotorAxis zAxis_;
    MotorAxis arm1_;
    MotorAxis arm2_;
    State state_ = State::Disconnected;
};

#endif // D2CONTROLLER_H
