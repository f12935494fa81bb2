#include "common/CancellationToken.h"
#include "common/DispenseSettings.h"
#include "compiler/DispenseCompiler.h"
#include "dataaccess/JsonRecords.h"
#include "dataaccess/LocalDataAccess.h"
#include "dataaccess/WebDataAccess.h"
#include "device/D2Controller.h"
#include "protocol/ProtocolCsv.h"

#include <csignal>
#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSerialPortInfo>
#include <QTextStream>

namespace {

CancellationToken g_cancel;

void onInterrupt(int)
{
    g_cancel.cancel();
}

int fail(const DispenseError &err)
{
    qCritical().noquote() << "[ERROR]" << err.toString();
    return err.kind == DispenseError::Kind::Cancelled ? 130 : 1;
}

bool loadCalibrationFile(const QString &path, ActiveCalibrationData *out, DispenseError *err)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return failWith(err, DispenseError::Kind::Configuration,
                        QString("Cannot open calibration file %1: %2").arg(path, file.errorString()));
    }
    QJsonObject root;
    if (!JsonRecords::objectFromBytes(file.readAll(), path, &root, err))
        return false;
    return JsonRecords::parseCalibration(root, out, err);
}

std::shared_ptr<DataAccess> makeDataAccess(const DispenseSettings &settings)
{
    if (!settings.dataDirectory.isEmpty())
        return std::make_shared<LocalDataAccess>(settings.dataDirectory);
    if (!settings.serviceBaseUrl.isEmpty())
        return std::make_shared<WebDataAccess>(QUrl(settings.serviceBaseUrl), settings.requestTimeoutMs);
    return nullptr;
}

int listPorts()
{
    QTextStream out(stdout);
    const auto ports = QSerialPortInfo::availablePorts();
    if (ports.isEmpty()) {
        out << "No serial ports found\n";
        return 0;
    }
    for (const QSerialPortInfo &info : ports) {
        out << info.portName() << "\t" << info.description();
        if (!info.serialNumber().isEmpty())
            out << "\t" << info.serialNumber();
        out << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("d2dispense-cli");
    QCoreApplication::setApplicationVersion("0.1");
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Drive a D2 two-valve dispenser.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command",
                                 "dispense | flush | park | unpark | move-z | compile | "
                                 "export-csv | serial-id | ports");

    const QCommandLineOption configOpt({"c", "config"}, "Settings JSON file.", "file");
    const QCommandLineOption portOpt({"p", "port"}, "Serial port name.", "port");
    const QCommandLineOption baudOpt("baud", "Serial baud rate.", "rate");
    const QCommandLineOption urlOpt("service-url", "Data service base URL.", "url");
    const QCommandLineOption dataDirOpt("data-dir", "Local data directory.", "dir");
    const QCommandLineOption plateOpt("plate", "Plate type GUID.", "guid");
    const QCommandLineOption protocolOpt("protocol", "Protocol id.", "id");
    const QCommandLineOption csvOpt("csv", "Protocol CSV file.", "file");
    const QCommandLineOption calibrationOpt("calibration", "Calibration JSON file.", "file");
    const QCommandLineOption valveOpt("valve", "Valve number (1 or 2).", "n", "1");
    const QCommandLineOption volumeOpt("volume", "Flush volume in uL.", "ul");
    const QCommandLineOption heightOpt("height", "Z height in mm.", "mm");
    const QCommandLineOption outOpt({"o", "out"}, "Output file.", "file");
    parser.addOptions({configOpt, portOpt, baudOpt, urlOpt, dataDirOpt, plateOpt, protocolOpt,
                       csvOpt, calibrationOpt, valveOpt, volumeOpt, heightOpt, outOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1)
        parser.showHelp(2);
    const QString command = args.first();

    if (command == "ports")
        return listPorts();

    DispenseSettings settings;
    DispenseError err;
    if (parser.isSet(configOpt) && !DispenseSettings::loadFromFile(parser.value(configOpt), &settings, &err))
        return fail(err);
    if (parser.isSet(portOpt)) settings.serialPort = parser.value(portOpt);
    if (parser.isSet(baudOpt)) settings.baudRate = parser.value(baudOpt).toInt();
    if (parser.isSet(urlOpt)) settings.serviceBaseUrl = parser.value(urlOpt);
    if (parser.isSet(dataDirOpt)) settings.dataDirectory = parser.value(dataDirOpt);

    std::shared_ptr<DataAccess> dataAccess = makeDataAccess(settings);
    D2Controller controller(settings, dataAccess);

    ActiveCalibrationData calibration;
    const bool haveCalibration = parser.isSet(calibrationOpt);
    if (haveCalibration && !loadCalibrationFile(parser.value(calibrationOpt), &calibration, &err))
        return fail(err);

    if (command == "export-csv") {
        if (!parser.isSet(protocolOpt) || !parser.isSet(outOpt)) {
            qCritical() << "[ERROR] export-csv needs --protocol and --out";
            return 2;
        }
        if (!controller.exportProtocolToCsv(parser.value(protocolOpt), parser.value(outOpt), &err))
            return fail(err);
        qInfo() << "[INFO] Wrote" << parser.value(outOpt);
        return 0;
    }

    if (command == "compile") {
        if (!haveCalibration || !parser.isSet(plateOpt) || !dataAccess) {
            qCritical() << "[ERROR] compile needs --calibration, --plate and a data source";
            return 2;
        }
        Protocol protocol;
        if (parser.isSet(csvOpt)) {
            if (!ProtocolCsv::importFile(parser.value(csvOpt), &protocol, &err))
                return fail(err);
        } else if (!dataAccess->getProtocol(parser.value(protocolOpt), &protocol, &err)) {
            return fail(err);
        }
        PlateType plate;
        if (!dataAccess->getPlateTypeData(parser.value(plateOpt), &plate, &err))
            return fail(err);
        QStringList commands;
        if (!controller.compileDispense(calibration, protocol, plate, &commands, &err))
            return fail(err);
        QTextStream out(stdout);
        for (const QString &line : commands)
            out << line << "\n";
        return 0;
    }

    // Everything below talks to the hardware
    if (settings.serialPort.isEmpty()) {
        qCritical() << "[ERROR] No serial port given (--port or serial.port in settings)";
        return 2;
    }

    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);

    if (!controller.openComms(settings.serialPort, settings.baudRate, &err))
        return fail(err);

    bool ok = false;
    if (command == "serial-id") {
        QString serialId;
        ok = controller.readSerialId(&serialId, &err);
        if (ok) QTextStream(stdout) << serialId << "\n";
    } else if (command == "park") {
        ok = controller.parkArms(&g_cancel, &err);
    } else if (command == "unpark") {
        ok = controller.unparkArms(&g_cancel, &err);
    } else if (command == "move-z") {
        bool valid = false;
        const double height = parser.value(heightOpt).toDouble(&valid);
        if (!valid) {
            qCritical() << "[ERROR] move-z needs --height";
            return 2;
        }
        ok = controller.moveZToHeight(height, &g_cancel, &err);
        if (!controller.disableZ(ok ? &err : nullptr))
            ok = false;
    } else if (command == "flush") {
        bool valid = false;
        const double volume = parser.value(volumeOpt).toDouble(&valid);
        if (!valid) {
            qCritical() << "[ERROR] flush needs --volume";
            return 2;
        }
        ok = controller.flush(parser.value(valveOpt).toInt(), volume,
                              haveCalibration ? &calibration : nullptr, &g_cancel, &err);
    } else if (command == "dispense") {
        D2Controller::DispenseRunResult result;
        if (parser.isSet(csvOpt)) {
            Protocol protocol;
            ok = ProtocolCsv::importFile(parser.value(csvOpt), &protocol, &err);
            if (ok) {
                D2Controller::DispenseRequest request;
                request.protocol = &protocol;
                request.calibration = haveCalibration ? &calibration : nullptr;
                request.plateTypeGuid = parser.value(plateOpt);
                ok = controller.runDispense(request, &g_cancel, &result, &err);
            }
        } else {
            D2Controller::DispenseRequest request;
            request.protocolId = parser.value(protocolOpt);
            request.calibration = haveCalibration ? &calibration : nullptr;
            request.plateTypeGuid = parser.value(plateOpt);
            ok = controller.runDispense(request, &g_cancel, &result, &err);
        }
        if (ok) {
            QTextStream(stdout) << "commands=" << result.commandCount
                                << " estimate_ms=" << result.estimatedDurationMs
                                << " elapsed_ms=" << result.elapsedMs << "\n";
        }
    } else {
        qCritical().noquote() << "[ERROR] Unknown command" << command;
        controller.dispose();
        return 2;
    }

    controller.dispose();
    return ok ? 0 : fail(err);
}
