#include "D2Controller.h"

#include <QDebug>
#include <QDeadlineTimer>
#include <QElapsedTimer>
#include <QFuture>
#include <QThread>
#include <QtConcurrent/QtConcurrent>

#include "SerialControlConnection.h"
#include "labware/WellGeometry.h"
#include "protocol/ProtocolCsv.h"

namespace {

const char *kDispenseErrorGuidance =
    "A dispense error occurred. Check arms for obstructions, plate height, "
    "and hose length. See https://ukrobotics.tech/docs/d2dispenser/troubleshooting/";

// Result of the data/compile half of runDispense.
struct CompileOutcome {
    bool ok = false;
    QStringList commands;
    DispenseError error;
};

} // namespace

D2Controller::D2Controller(const DispenseSettings &settings,
                           std::shared_ptr<DataAccess> dataAccess,
                           QObject *parent)
    : QObject(parent),
    settings_(settings),
    dataAccess_(std::move(dataAccess))
{
}

D2Controller::~D2Controller()
{
    dispose();
}

// ============================ connection ================================

bool D2Controller::openComms(const QString &portName, int baudRate, DispenseError *err)
{
    auto serial = std::make_unique<SerialControlConnection>(settings_.responseTimeoutMs);
    if (!serial->open(portName.trimmed(), baudRate, err))
        return false;
    return attachConnection(std::move(serial), err);
}

bool D2Controller::attachConnection(std::unique_ptr<ControlConnection> connection,
                                    DispenseError *err)
{
    if (!connection || !connection->isOpen()) {
        return failWith(err, DispenseError::Kind::Connection, "Control connection is not open");
    }
    dispose();
    connection_ = std::move(connection);

    ControlConnection *c = connection_.get();
    zAxis_ = MotorAxis(c, settings_.zControllerNumber, settings_.zAxisNumber, "Z");
    arm1_  = MotorAxis(c, settings_.armsControllerNumber, 1, "Arm1");
    arm2_  = MotorAxis(c, settings_.armsControllerNumber, 2, "Arm2");
    setState(State::Idle);
    return true;
}

void D2Controller::dispose()
{
    if (connection_) {
        connection_->close();
        connection_.reset();
        qInfo() << "[INFO] Control connection closed";
    }
    zAxis_ = MotorAxis();
    arm1_  = MotorAxis();
    arm2_  = MotorAxis();
    setState(State::Disconnected);
}

bool D2Controller::isConnected() const
{
    return connection_ && connection_->isOpen();
}

bool D2Controller::requireConnection(const QString &operation, DispenseError *err) const
{
    if (isConnected())
        return true;
    return failWith(err, DispenseError::Kind::Connection,
                    QString("%1: not connected to the dispenser").arg(operation));
}

bool D2Controller::sendChecked(const QString &command, DeviceResponse *reply, DispenseError *err)
{
    if (!requireConnection(command.section(',', 0, 0), err))
        return false;
    const DeviceResponse r = connection_->sendMessageRaw(command, true);
    if (!r.success) {
        return failWith(err, DispenseError::Kind::Transport,
                        QString("'%1' failed: %2").arg(command.left(64), r.errorMessage));
    }
    if (reply) *reply = r;
    return true;
}

void D2Controller::setState(State state)
{
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state);
}

bool D2Controller::readSerialId(QString *serialId, DispenseError *err)
{
    DeviceResponse r;
    if (!sendChecked(QString("READ_STRING,%1,0,SERIAL_ID").arg(settings_.armsControllerNumber), &r, err))
        return false;
    const QString id = r.stringParameter(0);
    if (id.isEmpty()) {
        return failWith(err, DispenseError::Kind::Transport, "Device returned an empty serial id");
    }
    if (serialId) *serialId = id;
    return true;
}

// ============================ cancellation ==============================

bool D2Controller::checkCancelled(const CancellationToken *cancel, const QString &during,
                                  DispenseError *err)
{
    if (!cancel || !cancel->isCancelled())
        return false;
    abort();
    failWith(err, DispenseError::Kind::Cancelled, QString("Cancelled during %1").arg(during));
    return true;
}

void D2Controller::abortIfCancelled(const DispenseError &error)
{
    if (error.kind == DispenseError::Kind::Cancelled)
        abort();
}

bool D2Controller::abort()
{
    if (!isConnected()) {
        qWarning() << "[WARN] ABORT requested without a connection";
        return false;
    }
    const bool sent = connection_->sendWithoutAck(QString("ABORT,%1,0").arg(settings_.armsControllerNumber));
    qWarning() << "[ABORT]" << (sent ? "ABORT sent" : "ABORT could not be written");
    return sent;
}

// ============================== motion ==================================

bool D2Controller::clearMotorErrorFlags(DispenseError *err)
{
    if (!requireConnection("clear error flags", err))
        return false;
    return zAxis_.clearErrorCode(err)
           && arm1_.clearErrorCode(err)
           && arm2_.clearErrorCode(err);
}

bool D2Controller::homeZAxis(const CancellationToken *cancel, DispenseError *err)
{
    if (!requireConnection("home Z", err))
        return false;

    const State previous = state_;
    setState(State::Homing);
    qInfo() << "[Z] Homing Z axis...";

    DispenseError e;
    if (!zAxis_.home(&e)
        || !zAxis_.waitForIsHomed(settings_.homingTimeoutMs, settings_.settlePollIntervalMs, cancel, &e)) {
        abortIfCancelled(e);
        setState(State::Error);
        return failWith(err, e.prefixed("Homing Z axis"));
    }

    qInfo() << "[Z] Homing complete";
    setState(previous == State::Homing ? State::Idle : previous);
    return true;
}

bool D2Controller::moveZToHeight(double heightMm, const CancellationToken *cancel, DispenseError *err)
{
    if (!requireConnection("move Z", err))
        return false;
    if (heightMm < 0.0) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Invalid Z height %1 mm").arg(heightMm));
    }

    const State previous = state_;
    bool homed = false;
    DispenseError e;
    if (!zAxis_.isHomed(&homed, &e)) {
        setState(State::Error);
        return failWith(err, e.prefixed("Reading Z homed state"));
    }
    if (!homed && !homeZAxis(cancel, err))
        return false;

    setState(State::Moving);
    const int heightMicrons = WellGeometry::millimetresToMicrons(heightMm);
    qInfo() << "[Z] Moving to" << heightMm << "mm (" << heightMicrons << "um)";

    const DeviceResponse r = connection_->sendMessage("MOVE_Z", settings_.zControllerNumber,
                                                      settings_.zAxisNumber, heightMicrons);
    if (!r.success) {
        setState(State::Error);
        return failWith(err, DispenseError::Kind::Transport,
                        QString("MOVE_Z to %1 um failed: %2").arg(heightMicrons).arg(r.errorMessage));
    }
    if (!zAxis_.waitForPositionSettledAndInRange(settings_.moveTimeoutMs,
                                                 settings_.settlePollIntervalMs, cancel, &e)) {
        abortIfCancelled(e);
        setState(State::Error);
        return failWith(err, e.prefixed(QString("Moving Z to %1 mm").arg(heightMm)));
    }

    qInfo() << "[Z] Move to" << heightMm << "mm complete";
    setState(previous == State::Moving || previous == State::Homing ? State::Idle : previous);
    return true;
}

bool D2Controller::setClamp(bool engaged, DispenseError *err)
{
    if (!requireConnection("clamp", err))
        return false;
    const DeviceResponse r = connection_->sendMessage("CLAMP", settings_.zControllerNumber, 0,
                                                      engaged ? 1 : 0);
    if (!r.success) {
        return failWith(err, DispenseError::Kind::Transport,
                        QString("CLAMP %1 failed: %2").arg(engaged ? "on" : "off", r.errorMessage));
    }
    qDebug() << "[CLAMP]" << (engaged ? "engaged" : "released");
    return true;
}

bool D2Controller::parkArms(const CancellationToken *cancel, DispenseError *err)
{
    if (!unparkOrPark(true, cancel, err))
        return false;
    if (!disableArms(err))
        return false;
    qInfo() << "[ARMS] Arms parked";
    return true;
}

bool D2Controller::unparkArms(const CancellationToken *cancel, DispenseError *err)
{
    if (!unparkOrPark(false, cancel, err))
        return false;
    qInfo() << "[ARMS] Arms unparked";
    return true;
}

bool D2Controller::unparkOrPark(bool park, const CancellationToken *cancel, DispenseError *err)
{
    const QString name = park ? "PARK" : "UNPARK";
    if (!requireConnection(name, err))
        return false;

    DispenseError e;
    if (!clearMotorErrorFlags(&e))
        return failWith(err, e.prefixed(name));

    const State previous = state_;
    setState(State::Moving);
    const DeviceResponse r = connection_->sendMessage(name, settings_.armsControllerNumber, 0);
    if (!r.success) {
        setState(State::Error);
        return failWith(err, DispenseError::Kind::Transport,
                        QString("%1 failed: %2").arg(name, r.errorMessage));
    }

    // Give the controller time to start the move before polling settled state
    QThread::msleep(settings_.parkSettleDelayMs);

    if (!arm1_.waitForPositionSettledAndInRange(settings_.parkTimeoutMs, settings_.settlePollIntervalMs, cancel, &e)
        || !arm2_.waitForPositionSettledAndInRange(settings_.parkTimeoutMs, settings_.settlePollIntervalMs, cancel, &e)) {
        abortIfCancelled(e);
        setState(State::Error);
        return failWith(err, e.prefixed(name));
    }
    setState(previous == State::Moving ? State::Idle : previous);
    return true;
}

bool D2Controller::disableArms(DispenseError *err)
{
    if (!requireConnection("disable arms", err))
        return false;
    return arm1_.disable(err) && arm2_.disable(err);
}

bool D2Controller::disableZ(DispenseError *err)
{
    if (!requireConnection("disable Z", err))
        return false;
    return zAxis_.disable(err);
}

bool D2Controller::disableAllMotors(DispenseError *err)
{
    return disableZ(err) && disableArms(err);
}

// ========================= valves and dispensing ========================

QString D2Controller::createValveCommand(int valveNumber, int openTimeUsecs,
                                         int shotCount, int interShotTimeUsecs) const
{
    return DispenseCompiler(settings_.armsControllerNumber)
        .valveCommand(valveNumber, openTimeUsecs, shotCount, interShotTimeUsecs);
}

bool D2Controller::requireValveNumber(int valveNumber, DispenseError *err) const
{
    if (valveNumber >= 1 && valveNumber <= kValveCount)
        return true;
    return failWith(err, DispenseError::Kind::Configuration,
                    QString("Invalid valve number %1").arg(valveNumber));
}

bool D2Controller::fireValve(int valveNumber, int openTimeUsecs, DispenseError *err)
{
    if (!requireValveNumber(valveNumber, err))
        return false;
    return sendChecked(createValveCommand(valveNumber, openTimeUsecs, 1, 0), nullptr, err);
}

bool D2Controller::compileDispense(const ActiveCalibrationData &calibration,
                                   const Protocol &protocol,
                                   const PlateType &plate,
                                   QStringList *commands,
                                   DispenseError *err) const
{
    const DispenseCompiler compiler(settings_.armsControllerNumber, settings_.minDispenseVolumeUl);
    return compiler.compile(calibration, protocol, plate, commands, err);
}

bool D2Controller::startDispense(qint64 *estimatedDurationMs, DispenseError *err)
{
    if (!requireConnection("DISPENSE", err))
        return false;
    const DeviceResult<qint64> r =
        connection_->queryInt(QString("DISPENSE,%1,0").arg(settings_.armsControllerNumber));
    if (!r.success) {
        return failWith(err, DispenseError::Kind::Transport,
                        QString("Failed to start dispense or get duration estimate: %1").arg(r.errorMessage));
    }
    const qint64 ms = qMax<qint64>(0, r.value);
    qInfo() << "[DISPENSE] Started, firmware estimate" << ms << "ms";
    if (estimatedDurationMs) *estimatedDurationMs = ms;
    return true;
}

bool D2Controller::getDispenseState(DispenseState *state, DispenseError *err)
{
    DeviceResponse r;
    if (!sendChecked(QString("GET_DISPENSE_STATE,%1,0").arg(settings_.armsControllerNumber), &r, err))
        return false;

    // Anything unknown is a transition: keep polling
    DispenseState s = DispenseState::Running;
    qint64 v = 0;
    if (r.intParameter(0, &v)) {
        if (v == -1) s = DispenseState::Error;
        else if (v == 1) s = DispenseState::Ended;
    } else {
        qDebug() << "[DISPENSE] Unparsable dispense state" << r.parameters;
    }
    if (state) *state = s;
    return true;
}

bool D2Controller::waitForDispenseComplete(qint64 estimatedDurationMs,
                                           const CancellationToken *cancel,
                                           DispenseError *err)
{
    const qint64 timeoutMs = qMax<qint64>(0, estimatedDurationMs) + settings_.dispenseTimeoutMarginMs;
    QDeadlineTimer deadline(timeoutMs);

    while (!deadline.hasExpired()) {
        if (checkCancelled(cancel, "dispense", err))
            return false;

        DispenseState s = DispenseState::Running;
        if (!getDispenseState(&s, err))
            return false;
        if (s == DispenseState::Error)
            return failWith(err, DispenseError::Kind::Hardware, kDispenseErrorGuidance);
        if (s == DispenseState::Ended)
            return true;
        QThread::msleep(settings_.pollIntervalMs);
    }
    return failWith(err, DispenseError::Kind::Timeout,
                    QString("Timeout waiting for dispense to finish (%1 ms)").arg(timeoutMs));
}

bool D2Controller::getValveState(ValveCommandState *state, DispenseError *err)
{
    DeviceResponse r;
    if (!sendChecked(QString("GET_VALVE_STATE,%1,0").arg(settings_.armsControllerNumber), &r, err))
        return false;
    qint64 v = 1;
    const bool parsed = r.intParameter(0, &v);
    if (state) *state = (parsed && v == 0) ? ValveCommandState::Idle : ValveCommandState::Pending;
    return true;
}

bool D2Controller::awaitIdleValveState(int timeoutMs, const CancellationToken *cancel,
                                       DispenseError *err)
{
    QDeadlineTimer deadline(timeoutMs);
    while (true) {
        if (checkCancelled(cancel, "valve fire", err))
            return false;

        ValveCommandState s = ValveCommandState::Pending;
        if (!getValveState(&s, err))
            return false;
        if (s == ValveCommandState::Idle)
            return true;
        if (deadline.hasExpired()) {
            return failWith(err, DispenseError::Kind::Timeout,
                            QString("Timeout waiting for valve idle state (%1 ms)").arg(timeoutMs));
        }
        QThread::msleep(settings_.pollIntervalMs);
    }
}

bool D2Controller::resolveCalibration(const ActiveCalibrationData *supplied,
                                      ActiveCalibrationData *out, DispenseError *err)
{
    if (supplied) {
        *out = *supplied;
        return true;
    }
    if (!dataAccess_)
        return failWith(err, DispenseError::Kind::Configuration, "No data access configured");

    QString serialId;
    if (!readSerialId(&serialId, err))
        return false;
    return dataAccess_->getActiveCalibrationData(serialId, out, err);
}

// ============================== dispense ================================

bool D2Controller::runDispense(const QString &protocolId, const QString &plateTypeGuid,
                               const CancellationToken *cancel,
                               DispenseRunResult *result,
                               DispenseError *err)
{
    DispenseRequest request;
    request.protocolId = protocolId;
    request.plateTypeGuid = plateTypeGuid;
    return runDispense(request, cancel, result, err);
}

bool D2Controller::runDispenseFromList(const QVector<WellVolumes> &wells,
                                       const QString &plateTypeGuid,
                                       const ActiveCalibrationData *calibration,
                                       const CancellationToken *cancel,
                                       DispenseRunResult *result,
                                       DispenseError *err)
{
    const Protocol protocol = Protocol::fromList(wells);
    DispenseRequest request;
    request.protocol = &protocol;
    request.calibration = calibration;
    request.plateTypeGuid = plateTypeGuid;
    return runDispense(request, cancel, result, err);
}

bool D2Controller::runDispenseFromCsv(const QString &csvPath,
                                      const QString &plateTypeGuid,
                                      const CancellationToken *cancel,
                                      DispenseRunResult *result,
                                      DispenseError *err)
{
    Protocol protocol;
    if (!ProtocolCsv::importFile(csvPath, &protocol, err))
        return false;
    DispenseRequest request;
    request.protocol = &protocol;
    request.plateTypeGuid = plateTypeGuid;
    return runDispense(request, cancel, result, err);
}

bool D2Controller::runDispense(const DispenseRequest &request,
                               const CancellationToken *cancel,
                               DispenseRunResult *result,
                               DispenseError *err)
{
    if (!requireConnection("dispense", err))
        return false;

    QElapsedTimer elapsed;
    elapsed.start();

    DispenseRunResult run;
    DispenseError runErr;
    const bool ok = runDispenseSteps(request, cancel, &run, &runErr);

    releaseHardware("dispense");

    if (!ok) {
        qWarning() << "[DISPENSE] Failed:" << runErr.toString();
        setState(State::Error);
        return failWith(err, runErr);
    }

    run.elapsedMs = elapsed.elapsed();
    qInfo() << "[DISPENSE] Complete in" << run.elapsedMs << "ms (estimate"
            << run.estimatedDurationMs << "ms)";
    setState(State::Idle);
    if (result) *result = run;
    return true;
}

bool D2Controller::runDispenseSteps(const DispenseRequest &request,
                                    const CancellationToken *cancel,
                                    DispenseRunResult *result,
                                    DispenseError *err)
{
    const QString plateGuid = request.plateTypeGuid.trimmed();
    const QString protocolId = request.protocolId.trimmed();

    if (!request.protocol && protocolId.isEmpty())
        return failWith(err, DispenseError::Kind::Configuration, "No protocol given");
    if (plateGuid.isEmpty())
        return failWith(err, DispenseError::Kind::Configuration, "No plate type given");
    if (!dataAccess_)
        return failWith(err, DispenseError::Kind::Configuration, "No data access configured");

    DispenseError e;
    if (!clearMotorErrorFlags(&e))
        return failWith(err, e.prefixed("Clearing motor error flags"));

    // Serial reads stay on this thread; the worker never touches the link
    QString serialId;
    if (!request.calibration && !readSerialId(&serialId, &e))
        return failWith(err, e.prefixed("Reading device serial id"));

    PlateType plate;
    if (!dataAccess_->getPlateTypeData(plateGuid, &plate, &e))
        return failWith(err, e.prefixed(QString("Plate type %1").arg(plateGuid)));

    // (a) data fetch + compile on a worker
    std::shared_ptr<DataAccess> dataAccess = dataAccess_;
    const DispenseCompiler compiler(settings_.armsControllerNumber, settings_.minDispenseVolumeUl);
    const bool haveProtocol = request.protocol != nullptr;
    const Protocol suppliedProtocol = haveProtocol ? *request.protocol : Protocol();
    const bool haveCalibration = request.calibration != nullptr;
    const ActiveCalibrationData suppliedCalibration =
        haveCalibration ? *request.calibration : ActiveCalibrationData();

    QFuture<CompileOutcome> compileTask = QtConcurrent::run([=]() {
        CompileOutcome out;
        ActiveCalibrationData calibration = suppliedCalibration;
        if (!haveCalibration
            && !dataAccess->getActiveCalibrationData(serialId, &calibration, &out.error)) {
            return out;
        }
        Protocol protocol = suppliedProtocol;
        if (!haveProtocol && !dataAccess->getProtocol(protocolId, &protocol, &out.error))
            return out;
        out.ok = compiler.compile(calibration, protocol, plate, &out.commands, &out.error);
        return out;
    });

    // (b) Z to dispense height and clamp, on this thread
    DispenseError positionErr;
    const double dispenseHeightMm = plate.heightMm + settings_.dispenseClearanceMm;
    const bool positioned = moveZToHeight(dispenseHeightMm, cancel, &positionErr)
                            && setClamp(true, &positionErr);

    // A cancelled move already sent ABORT; the worker is left to finish on its own
    if (!positioned && positionErr.kind == DispenseError::Kind::Cancelled)
        return failWith(err, positionErr.prefixed("positioning"));

    // The worker owns copies of everything it touches, so it can be abandoned
    while (!compileTask.isFinished()) {
        if (checkCancelled(cancel, "data-compilation", err))
            return false;
        QThread::msleep(static_cast<unsigned long>(settings_.pollIntervalMs));
    }
    const CompileOutcome compiled = compileTask.result();

    if (!positioned && !compiled.ok) {
        return failWith(err, DispenseError(positionErr.kind,
                                           QString("positioning: %1; data-compilation: %2")
                                               .arg(positionErr.message, compiled.error.toString())));
    }
    if (!positioned)
        return failWith(err, positionErr.prefixed("positioning"));
    if (!compiled.ok)
        return failWith(err, compiled.error.prefixed("data-compilation"));

    setState(State::Dispensing);
    qInfo() << "[DISPENSE] Sending" << compiled.commands.size() << "commands";
    for (int i = 0; i < compiled.commands.size(); ++i) {
        if (checkCancelled(cancel, "command transmission", err))
            return false;
        const QString &command = compiled.commands.at(i);
        const DeviceResponse r = connection_->sendMessageRaw(command, true);
        if (!r.success) {
            return failWith(err, DispenseError::Kind::Transport,
                            QString("Failed to send dispense command %1/%2 (%3): %4")
                                .arg(i + 1).arg(compiled.commands.size())
                                .arg(command.section(',', 0, 0), r.errorMessage));
        }
    }

    qint64 estimateMs = 0;
    if (!startDispense(&estimateMs, err))
        return false;
    if (!waitForDispenseComplete(estimateMs, cancel, err))
        return false;

    if (result) {
        result->estimatedDurationMs = estimateMs;
        result->commandCount = compiled.commands.size();
    }
    return true;
}

void D2Controller::releaseHardware(const QString &operation)
{
    DispenseError e;
    if (!disableAllMotors(&e))
        qWarning() << "[WARN]" << operation << "cleanup: error disabling motors:" << e.toString();
    e = DispenseError();
    if (!setClamp(false, &e))
        qWarning() << "[WARN]" << operation << "cleanup: error releasing clamp:" << e.toString();
}

// ================================ flush =================================

bool D2Controller::flush(int valveNumber, double volumeUl,
                         const ActiveCalibrationData *calibration,
                         const CancellationToken *cancel,
                         DispenseError *err)
{
    if (!requireConnection("flush", err))
        return false;
    if (!requireValveNumber(valveNumber, err))
        return false;

    setState(State::Flushing);
    DispenseError flushErr;
    const bool ok = flushSteps(valveNumber, volumeUl, calibration, cancel, &flushErr);

    releaseHardware("flush");

    if (!ok) {
        qWarning() << "[FLUSH] Failed:" << flushErr.toString();
        setState(State::Error);
        return failWith(err, flushErr);
    }
    setState(State::Idle);
    return true;
}

bool D2Controller::flushSteps(int valveNumber, double volumeUl,
                              const ActiveCalibrationData *calibration,
                              const CancellationToken *cancel,
                              DispenseError *err)
{
    DispenseError e;
    if (!clearMotorErrorFlags(&e))
        return failWith(err, e.prefixed("Clearing motor error flags"));
    if (!parkArms(cancel, err))
        return false;
    if (!moveZToHeight(settings_.flushHeightMm, cancel, err))
        return false;
    setState(State::Flushing);
    if (!disableAllMotors(err))
        return false;

    ActiveCalibrationData active;
    if (!resolveCalibration(calibration, &active, &e))
        return failWith(err, e.prefixed("Flush calibration"));
    CalibrationTable table;
    if (!active.calibrationForValve(valveNumber, &table, err))
        return false;

    int openTimeUsecs = 0;
    if (!table.volumeToOpenTimeUsecs(volumeUl, &openTimeUsecs, &e))
        return failWith(err, e.prefixed(QString("Flush valve %1").arg(valveNumber)));
    if (openTimeUsecs == 0)
        qWarning() << "[FLUSH]" << volumeUl << "uL is below the calibrated range of valve" << valveNumber;
    qInfo() << "[FLUSH] Valve" << valveNumber << volumeUl << "uL ->" << openTimeUsecs << "us";

    if (!fireValve(valveNumber, openTimeUsecs, err))
        return false;
    return awaitIdleValveState(openTimeUsecs / 1000 + settings_.flushTimeoutMarginMs, cancel, err);
}

// ================================ export ================================

bool D2Controller::exportProtocolToCsv(const QString &protocolId, const QString &csvPath,
                                       DispenseError *err)
{
    if (!dataAccess_)
        return failWith(err, DispenseError::Kind::Configuration, "No data access configured");
    Protocol protocol;
    if (!dataAccess_->getProtocol(protocolId.trimmed(), &protocol, err))
        return false;
    return ProtocolCsv::exportFile(protocol, csvPath, err);
}
