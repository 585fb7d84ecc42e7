/*
* ========================================================================== *
*                                                                            *
*    This file is part of the USB Monitor QT version                         *
*                                                                            *
*    Copyright (C) 2024   USB Monitor contributors                           *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#include "core/MonitorSettings.h"
#include "core/LogHandler.h"
#include "core/DebugConsole.h"
#include "device/DeviceMonitor.h"
#include "device/platform/DeviceSourceFactory.h"
#include "serial/PortMonitor.h"
#include "speed/SpeedProber.h"
#include "speed/SpeedRating.h"
#include "speed/StorageVolumes.h"
#include "version.h"

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <QTimer>
#include <csignal>
#include <functional>
#include <memory>

Q_LOGGING_CATEGORY(log_core_cli, "usbmon.core.cli")

namespace {

volatile std::sig_atomic_t s_interrupted = 0;

void handleInterrupt(int)
{
    s_interrupted = 1;
}

// Monitor callbacks print from the polling threads
QMutex s_outputMutex;

void printLine(const QString &line)
{
    QMutexLocker locker(&s_outputMutex);
    QTextStream out(stdout);
    out << line << Qt::endl;
}

QString describeDevice(const UsbDevice &device)
{
    QString text = QString("%1 [%2:%3]").arg(device.name, device.vendorId, device.productId);
    if (!device.manufacturer.isEmpty()) {
        text += QString(" %1").arg(device.manufacturer);
    }
    if (!device.transferSpeed.isEmpty()) {
        text += QString(" (%1)").arg(device.transferSpeed);
    }
    text += QString(" - %1").arg(device.connectionStatus);
    return text;
}

QString describePort(const ComPort &port)
{
    QString text = QString("%1 (%2)").arg(port.portName, port.portType());
    if (!port.description.isEmpty()) {
        text += QString(" %1").arg(port.description);
    }
    text += port.isAvailable ? " - Available" : " - Unavailable";
    if (port.isOpen) {
        text += QString(" - Open %1 %2%3%4").arg(port.baudRate).arg(port.dataBits).arg(port.parity).arg(port.stopBits);
    }
    return text;
}

// Polls the interrupt flag from the event loop, where quitting is safe
void watchForInterrupt(QCoreApplication &app, std::function<void()> onInterrupt)
{
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    QTimer *timer = new QTimer(&app);
    QObject::connect(timer, &QTimer::timeout, &app, [onInterrupt]() {
        if (s_interrupted) {
            s_interrupted = 0;
            onInterrupt();
        }
    });
    timer->start(200);
}

int listEntities(DeviceMonitor &deviceMonitor, PortMonitor &portMonitor)
{
    deviceMonitor.refreshDevices();
    portMonitor.refreshPorts();

    const QList<UsbDevice> devices = deviceMonitor.visibleDevices();
    printLine(QString("USB devices (%1):").arg(devices.size()));
    for (const auto &device : devices) {
        printLine("  " + describeDevice(device));
    }

    const QList<ComPort> ports = portMonitor.allPorts();
    printLine(QString("Serial ports (%1):").arg(ports.size()));
    for (const auto &port : ports) {
        printLine("  " + describePort(port));
    }
    return 0;
}

int watchEntities(QCoreApplication &app, DeviceMonitor &deviceMonitor, PortMonitor &portMonitor, int durationSeconds)
{
    deviceMonitor.setOnDeviceConnected([](const UsbDevice &device) {
        printLine("CONNECTED    " + describeDevice(device));
    });
    deviceMonitor.setOnDeviceDisconnected([](const UsbDevice &device) {
        printLine("DISCONNECTED " + describeDevice(device));
    });
    portMonitor.setOnPortAdded([](const ComPort &port) {
        printLine("PORT ADDED   " + describePort(port));
    });
    portMonitor.setOnPortStatusChanged([](const ComPort &port) {
        printLine("PORT STATUS  " + describePort(port));
    });

    watchForInterrupt(app, [&app]() { app.quit(); });
    if (durationSeconds > 0) {
        QTimer::singleShot(durationSeconds * 1000, &app, &QCoreApplication::quit);
    }

    deviceMonitor.startMonitoring();
    portMonitor.startMonitoring();
    if (!deviceMonitor.isMonitoring() && !portMonitor.isMonitoring()) {
        qCCritical(log_core_cli) << "Nothing to monitor on this platform";
        return 1;
    }

    printLine("Watching USB devices and serial ports, press Ctrl+C to stop");
    int result = app.exec();

    deviceMonitor.stopMonitoring();
    portMonitor.stopMonitoring();
    return result;
}

int exportDevices(DeviceMonitor &deviceMonitor, const QString &filePath)
{
    deviceMonitor.refreshDevices();
    if (!deviceMonitor.exportDevices(filePath)) {
        qCCritical(log_core_cli) << "Could not export devices to" << filePath;
        return 1;
    }
    printLine(QString("Exported %1 devices to %2").arg(deviceMonitor.allDevices().size()).arg(filePath));
    return 0;
}

int exportPorts(PortMonitor &portMonitor, const QString &filePath)
{
    portMonitor.refreshPorts();
    if (!portMonitor.exportPorts(filePath)) {
        qCCritical(log_core_cli) << "Could not export ports to" << filePath;
        return 1;
    }
    printLine(QString("Exported %1 ports to %2").arg(portMonitor.allPorts().size()).arg(filePath));
    return 0;
}

int listVolumes()
{
    const QList<StorageVolume> volumes = StorageVolumes::testableVolumes();
    if (volumes.isEmpty()) {
        printLine("No USB storage volumes found");
        return 0;
    }
    for (const auto &volume : volumes) {
        printLine(QString("%1\t%2").arg(volume.rootPath, volume.displayName));
    }
    return 0;
}

int runSpeedTest(QCoreApplication &app, const QString &path, const QString &label, double sizeMb,
                 const QString &linkSpeed)
{
    SpeedProber prober;

    prober.setOnProgress([](const QString &name, double percent) {
        printLine(QString("%1: %2%").arg(name).arg(percent, 0, 'f', 0));
    });

    QObject::connect(&prober, &SpeedProber::probeCompleted, &app,
                     [&app, linkSpeed](const SpeedTestResult &result) {
        if (!result.success) {
            printLine(QString("Speed test failed: %1").arg(result.errorMessage));
            app.exit(1);
            return;
        }

        printLine(QString("Write:   %1 MB/s").arg(result.writeSpeedMbps, 0, 'f', 2));
        printLine(QString("Read:    %1 MB/s").arg(result.readSpeedMbps, 0, 'f', 2));
        printLine(QString("Average: %1 MB/s").arg(result.averageSpeedMbps, 0, 'f', 2));
        printLine(QString("Rating:  %1").arg(SpeedRating::forSpeed(result.averageSpeedMbps)));
        if (!linkSpeed.isEmpty()) {
            printLine(QString("Cable:   %1").arg(SpeedRating::cableQuality(linkSpeed, result.averageSpeedMbps)));
        }
        printLine(QString::fromUtf8(QJsonDocument(result.toJson()).toJson(QJsonDocument::Compact)));
        app.exit(0);
    });

    watchForInterrupt(app, [&prober]() { prober.stopProbe(); });

    prober.startProbe(path, label, sizeMb);
    return app.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("USB-Monitor");
    QCoreApplication::setOrganizationName("UsbMonitor");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Monitors USB devices and serial ports and measures USB storage throughput.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption listOption("list", "List the USB devices and serial ports currently attached.");
    QCommandLineOption watchOption("watch", "Print connect and disconnect events until interrupted.");
    QCommandLineOption durationOption("duration", "Stop watching after <seconds>.", "seconds");
    QCommandLineOption exportDevicesOption("export-devices", "Export the USB device list to <file>.", "file");
    QCommandLineOption exportPortsOption("export-ports", "Export the serial port list to <file>.", "file");
    QCommandLineOption speedTestOption("speed-test", "Measure write and read speed of the volume at <path>.", "path");
    QCommandLineOption sizeOption("size", "Speed test payload in MB.", "mb");
    QCommandLineOption labelOption("label", "Name reported for the speed test.", "name");
    QCommandLineOption linkSpeedOption("link-speed", "Bus speed label such as \"480 Mb/s\" for the cable check.", "label");
    QCommandLineOption volumesOption("volumes", "List mounted volumes that can take a speed test.");
    QCommandLineOption settingsOption("settings", "Read settings from the INI <file>.", "file");
    QCommandLineOption verboseOption("verbose", "Enable debug output for every category.");

    parser.addOptions({listOption, watchOption, durationOption, exportDevicesOption, exportPortsOption,
                       speedTestOption, sizeOption, labelOption, linkSpeedOption, volumesOption,
                       settingsOption, verboseOption});
    parser.process(app);

    std::unique_ptr<MonitorSettings> settings = parser.isSet(settingsOption)
        ? std::make_unique<MonitorSettings>(parser.value(settingsOption))
        : std::make_unique<MonitorSettings>();

    DebugConsole console;
    LogHandler logHandler(settings.get(), &console);
    logHandler.install();
    if (parser.isSet(verboseOption)) {
        logHandler.setVerbose(true);
    }

    qCDebug(log_core_cli) << "Start usbmon" << QCoreApplication::applicationVersion()
                          << "on" << DeviceSourceFactory::getCurrentPlatform();

    if (parser.isSet(volumesOption)) {
        return listVolumes();
    }

    if (parser.isSet(speedTestOption)) {
        double sizeMb = settings->defaultSpeedTestSizeMb();
        if (parser.isSet(sizeOption)) {
            bool ok = false;
            sizeMb = parser.value(sizeOption).toDouble(&ok);
            if (!ok || sizeMb <= 0) {
                qCCritical(log_core_cli) << "Invalid speed test size:" << parser.value(sizeOption);
                return 2;
            }
        }
        QString path = parser.value(speedTestOption);
        QString label = parser.isSet(labelOption) ? parser.value(labelOption) : path;
        return runSpeedTest(app, path, label, sizeMb, parser.value(linkSpeedOption));
    }

    DeviceMonitor deviceMonitor(DeviceSourceFactory::createDeviceSource(), settings.get());
    PortMonitor portMonitor(DeviceSourceFactory::createPortSource(), settings.get());

    if (parser.isSet(watchOption)) {
        int duration = 0;
        if (parser.isSet(durationOption)) {
            bool ok = false;
            duration = parser.value(durationOption).toInt(&ok);
            if (!ok || duration < 0) {
                qCCritical(log_core_cli) << "Invalid watch duration:" << parser.value(durationOption);
                return 2;
            }
        }
        return watchEntities(app, deviceMonitor, portMonitor, duration);
    }

    int result = 0;
    bool exported = false;
    if (parser.isSet(exportDevicesOption)) {
        result |= exportDevices(deviceMonitor, parser.value(exportDevicesOption));
        exported = true;
    }
    if (parser.isSet(exportPortsOption)) {
        result |= exportPorts(portMonitor, parser.value(exportPortsOption));
        exported = true;
    }

    if (!exported || parser.isSet(listOption)) {
        result |= listEntities(deviceMonitor, portMonitor);
    }
    return result;
}
