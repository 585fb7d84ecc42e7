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

#include "PortMonitor.h"
#include "../core/MonitorSettings.h"
#include "../monitor/EntityJson.h"
#include "../monitor/PollingWorker.h"

#include <QJsonArray>
#include <QMutexLocker>
#include <exception>

Q_LOGGING_CATEGORY(log_serial_monitor, "usbmon.serial.monitor")

namespace {

struct PortTraits
{
    static bool isPresent(const ComPort& port) { return port.isAvailable; }
    static void setPresent(ComPort& port, bool present) { port.setAvailable(present); }
    static void stampCreated(ComPort& port, const QDateTime& now) { port.createdAt = now; }
    static void stampSeen(ComPort&, const QDateTime&) {}
};

bool toDataBits(int value, QSerialPort::DataBits& dataBits)
{
    switch (value) {
    case 5: dataBits = QSerialPort::Data5; return true;
    case 6: dataBits = QSerialPort::Data6; return true;
    case 7: dataBits = QSerialPort::Data7; return true;
    case 8: dataBits = QSerialPort::Data8; return true;
    default: return false;
    }
}

bool toStopBits(double value, QSerialPort::StopBits& stopBits)
{
    if (value == 1.0) {
        stopBits = QSerialPort::OneStop;
    } else if (value == 1.5) {
        stopBits = QSerialPort::OneAndHalfStop;
    } else if (value == 2.0) {
        stopBits = QSerialPort::TwoStop;
    } else {
        return false;
    }
    return true;
}

bool toParity(const QString& value, QSerialPort::Parity& parity)
{
    QString upper = value.toUpper();
    if (upper == "N") {
        parity = QSerialPort::NoParity;
    } else if (upper == "E") {
        parity = QSerialPort::EvenParity;
    } else if (upper == "O") {
        parity = QSerialPort::OddParity;
    } else {
        return false;
    }
    return true;
}

bool toFlowControl(const QString& value, QSerialPort::FlowControl& flowControl)
{
    if (value == "None") {
        flowControl = QSerialPort::NoFlowControl;
    } else if (value == "XON/XOFF") {
        flowControl = QSerialPort::SoftwareControl;
    } else if (value == "RTS/CTS") {
        flowControl = QSerialPort::HardwareControl;
    } else {
        return false;
    }
    return true;
}

} // namespace

QJsonObject PortMonitor::Statistics::toJson() const
{
    QJsonObject types;
    for (auto it = portTypes.constBegin(); it != portTypes.constEnd(); ++it) {
        types[it.key()] = it.value();
    }

    QJsonObject object;
    object["total_ports"] = totalPorts;
    object["available_ports"] = availablePorts;
    object["unavailable_ports"] = unavailablePorts;
    object["open_ports"] = openPorts;
    object["port_types"] = types;
    object["last_scan"] = EntityJson::fromDateTime(lastScan);
    return object;
}

PortMonitor::PortMonitor(std::unique_ptr<AbstractPortSource> source,
                         MonitorSettings* settings,
                         QObject* parent)
    : QObject(parent)
    , m_source(std::move(source))
    , m_settings(settings)
    , m_worker(nullptr)
{
    qRegisterMetaType<ComPort>("ComPort");

    m_worker = new PollingWorker("PortMonitor", [this]() { refreshPorts(); }, monitorIntervalMs(), this);

    if (!m_source) {
        qCWarning(log_serial_monitor) << "Port monitor created without a port source";
    }
}

PortMonitor::~PortMonitor()
{
    if (!m_worker->stopPolling()) {
        m_worker->wait();
    }

    for (auto it = m_sessions.begin(); it != m_sessions.end(); ++it) {
        if (it.value()) {
            it.value()->close();
            delete it.value().data();
        }
    }
    m_sessions.clear();
}

void PortMonitor::setOnPortAdded(PortCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onAdded = std::move(callback);
}

void PortMonitor::setOnPortStatusChanged(PortCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onStatusChanged = std::move(callback);
}

void PortMonitor::startMonitoring()
{
    if (m_worker->isPolling()) {
        qCDebug(log_serial_monitor) << "Port monitoring already running";
        return;
    }

    if (!m_source) {
        qCWarning(log_serial_monitor) << "Cannot start port monitoring - no port source";
        return;
    }

    m_worker->setIntervalMs(monitorIntervalMs());
    m_worker->startPolling();

    emit monitoringStarted();
    qCInfo(log_serial_monitor) << "COM port monitoring started with interval" << m_worker->intervalMs() << "ms";
}

void PortMonitor::stopMonitoring()
{
    if (!m_worker->isPolling()) {
        return;
    }

    m_worker->stopPolling();

    emit monitoringStopped();
    qCInfo(log_serial_monitor) << "COM port monitoring stopped";
}

bool PortMonitor::isMonitoring() const
{
    return m_worker->isPolling();
}

int PortMonitor::monitorIntervalMs() const
{
    return m_settings ? m_settings->portIntervalMs() : MonitorSettings::DEFAULT_PORT_INTERVAL_MS;
}

bool PortMonitor::refreshPorts()
{
    if (!m_source) {
        qCWarning(log_serial_monitor) << "No port source available, skipping refresh";
        return false;
    }

    QMutexLocker tickLocker(&m_tickMutex);

    QList<ComPort> snapshot;
    try {
        snapshot = m_source->fetchPorts();
    } catch (const std::exception& e) {
        QString error = QString("Failed to enumerate serial ports: %1").arg(e.what());
        qCWarning(log_serial_monitor) << error;
        emit errorOccurred(error);
        return false;
    } catch (...) {
        QString error = QString("Failed to enumerate serial ports: unknown error");
        qCWarning(log_serial_monitor) << error;
        emit errorOccurred(error);
        return false;
    }

    if (snapshot.isEmpty()) {
        qCDebug(log_serial_monitor) << "Port source returned an empty snapshot, keeping current state";
        return false;
    }

    applySnapshot(snapshot);
    return true;
}

void PortMonitor::reconcile(const QList<ComPort>& snapshot)
{
    QMutexLocker tickLocker(&m_tickMutex);
    applySnapshot(snapshot);
}

void PortMonitor::applySnapshot(const QList<ComPort>& snapshot)
{
    QList<EntityChange<ComPort>> changes;
    {
        QMutexLocker locker(&m_stateMutex);
        QDateTime now = QDateTime::currentDateTime();
        changes = reconcileEntities<ComPort, PortTraits>(m_ports, m_history, snapshot, now);
        m_lastScan = now;
    }

    for (const auto& change : changes) {
        if (!change.entity.isAvailable) {
            releaseSession(change.entity.portName);
        }
    }

    dispatch(changes);
}

void PortMonitor::dispatch(const QList<EntityChange<ComPort>>& changes)
{
    PortCallback onAdded;
    PortCallback onStatusChanged;
    {
        QMutexLocker locker(&m_callbackMutex);
        onAdded = m_onAdded;
        onStatusChanged = m_onStatusChanged;
    }

    for (const auto& change : changes) {
        const ComPort& port = change.entity;
        switch (change.kind) {
        case EntityChange<ComPort>::Added:
            qCInfo(log_serial_monitor) << "New COM port found:" << port.portName;
            invoke(onAdded, port, "added");
            emit portAdded(port);
            break;
        case EntityChange<ComPort>::StateChanged:
            qCInfo(log_serial_monitor) << "COM port" << port.portName << (port.isAvailable ? "available again" : "reported unavailable");
            invoke(onStatusChanged, port, "status changed");
            emit portStatusChanged(port);
            break;
        case EntityChange<ComPort>::Refreshed:
            break;
        case EntityChange<ComPort>::Vanished:
            qCInfo(log_serial_monitor) << "COM port no longer available:" << port.portName;
            invoke(onStatusChanged, port, "status changed");
            emit portStatusChanged(port);
            break;
        }
    }
}

void PortMonitor::notifyStatusChanged(const ComPort& port)
{
    PortCallback onStatusChanged;
    {
        QMutexLocker locker(&m_callbackMutex);
        onStatusChanged = m_onStatusChanged;
    }
    invoke(onStatusChanged, port, "status changed");
    emit portStatusChanged(port);
}

void PortMonitor::invoke(const PortCallback& callback, const ComPort& port, const char* slotName)
{
    if (!callback) {
        return;
    }

    try {
        callback(port);
    } catch (const std::exception& e) {
        qCWarning(log_serial_monitor) << "Exception in" << slotName << "callback for" << port.portName << ":" << e.what();
    } catch (...) {
        qCWarning(log_serial_monitor) << "Unknown exception in" << slotName << "callback for" << port.portName;
    }
}

void PortMonitor::releaseSession(const QString& portName)
{
    QPointer<QSerialPort> session = m_sessions.take(portName);
    if (session) {
        qCDebug(log_serial_monitor) << "Releasing session for" << portName;
        session->deleteLater();
    }
}

QList<ComPort> PortMonitor::availablePorts() const
{
    QMutexLocker locker(&m_stateMutex);
    QList<ComPort> result;
    for (const auto& port : m_ports) {
        if (port.isAvailable) {
            result.append(port);
        }
    }
    return result;
}

QList<ComPort> PortMonitor::unavailablePorts() const
{
    QMutexLocker locker(&m_stateMutex);
    QList<ComPort> result;
    for (const auto& port : m_ports) {
        if (!port.isAvailable) {
            result.append(port);
        }
    }
    return result;
}

QList<ComPort> PortMonitor::allPorts() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_ports;
}

std::optional<ComPort> PortMonitor::portByName(const QString& portName) const
{
    QMutexLocker locker(&m_stateMutex);
    for (const auto& port : m_ports) {
        if (port.portName == portName) {
            return port;
        }
    }
    return std::nullopt;
}

QList<ComPort> PortMonitor::history() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_history;
}

void PortMonitor::clearHistory()
{
    QMutexLocker locker(&m_stateMutex);
    m_history.clear();
    qCInfo(log_serial_monitor) << "Port history cleared";
}

PortMonitor::Statistics PortMonitor::statistics() const
{
    QMutexLocker locker(&m_stateMutex);

    Statistics stats;
    stats.totalPorts = m_ports.size();
    for (const auto& port : m_ports) {
        if (port.isAvailable) {
            ++stats.availablePorts;
        } else {
            ++stats.unavailablePorts;
        }
        if (port.isOpen) {
            ++stats.openPorts;
        }
        stats.portTypes[port.portType()]++;
    }
    stats.lastScan = m_lastScan;
    return stats;
}

ComPort PortMonitor::resolveSessionSettings(const ComPort& port, const PortOpenOptions& options) const
{
    ComPort resolved = port;
    if (m_settings) {
        resolved.baudRate = m_settings->defaultBaudRate();
        resolved.dataBits = m_settings->defaultDataBits();
        resolved.stopBits = m_settings->defaultStopBits();
        resolved.parity = m_settings->defaultParity();
        resolved.flowControl = m_settings->defaultFlowControl();
    } else {
        ComPort defaults;
        resolved.baudRate = defaults.baudRate;
        resolved.dataBits = defaults.dataBits;
        resolved.stopBits = defaults.stopBits;
        resolved.parity = defaults.parity;
        resolved.flowControl = defaults.flowControl;
    }

    if (options.baudRate) resolved.baudRate = *options.baudRate;
    if (options.dataBits) resolved.dataBits = *options.dataBits;
    if (options.stopBits) resolved.stopBits = *options.stopBits;
    if (options.parity) resolved.parity = options.parity->toUpper();
    if (options.flowControl) resolved.flowControl = *options.flowControl;
    return resolved;
}

QPointer<QSerialPort> PortMonitor::openPort(const QString& portName, const PortOpenOptions& options)
{
    QMutexLocker tickLocker(&m_tickMutex);

    std::optional<ComPort> port = portByName(portName);
    if (!port) {
        qCWarning(log_serial_monitor) << "Cannot open unknown port" << portName;
        return nullptr;
    }
    if (!port->isAvailable) {
        qCWarning(log_serial_monitor) << "Cannot open port" << portName << "- not available";
        return nullptr;
    }

    QPointer<QSerialPort> existing = m_sessions.value(portName);
    if (existing && existing->isOpen()) {
        qCDebug(log_serial_monitor) << "Port" << portName << "already open";
        return existing;
    }

    ComPort resolved = resolveSessionSettings(*port, options);

    QSerialPort::DataBits dataBits;
    QSerialPort::StopBits stopBits;
    QSerialPort::Parity parity;
    QSerialPort::FlowControl flowControl;
    if (resolved.baudRate <= 0 ||
        !toDataBits(resolved.dataBits, dataBits) ||
        !toStopBits(resolved.stopBits, stopBits) ||
        !toParity(resolved.parity, parity) ||
        !toFlowControl(resolved.flowControl, flowControl)) {
        qCWarning(log_serial_monitor) << "Invalid session settings for" << portName << ":"
                                      << resolved.baudRate << resolved.dataBits << resolved.stopBits
                                      << resolved.parity << resolved.flowControl;
        return nullptr;
    }

    auto session = std::make_unique<QSerialPort>();
    session->setPortName(portName);
    session->setBaudRate(resolved.baudRate);
    session->setDataBits(dataBits);
    session->setStopBits(stopBits);
    session->setParity(parity);
    session->setFlowControl(flowControl);

    if (!session->open(QIODevice::ReadWrite)) {
        qCWarning(log_serial_monitor) << "Error opening port" << portName << ":" << session->errorString();
        return nullptr;
    }

    ComPort updated;
    {
        QMutexLocker locker(&m_stateMutex);
        for (auto& record : m_ports) {
            if (record.portName == portName) {
                record.baudRate = resolved.baudRate;
                record.dataBits = resolved.dataBits;
                record.stopBits = resolved.stopBits;
                record.parity = resolved.parity;
                record.flowControl = resolved.flowControl;
                record.isOpen = true;
                record.lastUsed = QDateTime::currentDateTime();
                updated = record;
                break;
            }
        }
    }

    releaseSession(portName);
    QPointer<QSerialPort> opened(session.release());
    m_sessions.insert(portName, opened);

    qCInfo(log_serial_monitor) << "Opened port" << portName << "at" << resolved.baudRate << "baud";
    notifyStatusChanged(updated);
    return opened;
}

bool PortMonitor::closePort(const QString& portName)
{
    QMutexLocker tickLocker(&m_tickMutex);

    ComPort updated;
    bool found = false;
    {
        QMutexLocker locker(&m_stateMutex);
        for (auto& record : m_ports) {
            if (record.portName == portName) {
                record.isOpen = false;
                updated = record;
                found = true;
                break;
            }
        }
    }

    if (!found) {
        qCWarning(log_serial_monitor) << "Cannot close unknown port" << portName;
        return false;
    }

    QPointer<QSerialPort> session = m_sessions.take(portName);
    if (session) {
        session->close();
        session->deleteLater();
    }

    qCInfo(log_serial_monitor) << "Closed port" << portName;
    notifyStatusChanged(updated);
    return true;
}

bool PortMonitor::testPort(const QString& portName, int baudRate)
{
    QSerialPort probe;
    probe.setPortName(portName);
    probe.setBaudRate(baudRate);
    if (!probe.open(QIODevice::ReadWrite)) {
        qCDebug(log_serial_monitor) << "Port test failed for" << portName << ":" << probe.errorString();
        return false;
    }
    probe.close();
    return true;
}

bool PortMonitor::exportPorts(const QString& filePath) const
{
    QJsonArray records;
    for (const auto& port : allPorts()) {
        records.append(port.toJson());
    }

    if (!EntityJson::writeArray(filePath, records)) {
        qCWarning(log_serial_monitor) << "Failed to export port list to" << filePath;
        return false;
    }

    qCInfo(log_serial_monitor) << "Exported" << records.size() << "ports to" << filePath;
    return true;
}

std::optional<QList<ComPort>> PortMonitor::importPorts(const QString& filePath)
{
    std::optional<QJsonArray> records = EntityJson::readArray(filePath);
    if (!records) {
        return std::nullopt;
    }

    QList<ComPort> ports;
    for (const QJsonValue& value : *records) {
        if (!value.isObject()) {
            qCWarning(log_serial_monitor) << "Skipping non-object entry in" << filePath;
            continue;
        }
        ports.append(ComPort::fromJson(value.toObject()));
    }
    return ports;
}

QList<int> PortMonitor::baudRates()
{
    return MonitorSettings::standardBaudRates();
}

QList<int> PortMonitor::dataBits()
{
    return MonitorSettings::supportedDataBits();
}

QList<double> PortMonitor::stopBits()
{
    return MonitorSettings::supportedStopBits();
}

QStringList PortMonitor::parityOptions()
{
    return MonitorSettings::parityOptions();
}
