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

#ifndef PORTMONITOR_H
#define PORTMONITOR_H

#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QLoggingCategory>
#include <QMap>
#include <QMutex>
#include <QPointer>
#include <QRecursiveMutex>
#include <QSerialPort>
#include <functional>
#include <memory>
#include <optional>

#include "ComPort.h"
#include "AbstractPortSource.h"
#include "../monitor/EntityReconciler.h"

Q_DECLARE_LOGGING_CATEGORY(log_serial_monitor)

class MonitorSettings;
class PollingWorker;

// Explicit values for openPort(); unset fields take the configured defaults
struct PortOpenOptions {
    std::optional<int> baudRate;
    std::optional<int> dataBits;
    std::optional<double> stopBits;
    std::optional<QString> parity;
    std::optional<QString> flowControl;
};

/**
 * @brief Tracks serial ports by name and owns the sessions opened through it.
 *
 * A port seen for the first time fires the added callback; an availability flip in
 * either direction fires the status callback. Opening and closing a session also fires
 * the status callback. A port that disappears loses its session in the same pass, so
 * a record is never open while unavailable.
 *
 * Sessions are QSerialPort objects living in the thread that called openPort(). They are
 * released with deleteLater(), which needs an event loop in that thread.
 */
class PortMonitor : public QObject
{
    Q_OBJECT

public:
    using PortCallback = std::function<void(const ComPort&)>;

    struct Statistics {
        int totalPorts = 0;
        int availablePorts = 0;
        int unavailablePorts = 0;
        int openPorts = 0;
        QMap<QString, int> portTypes;
        QDateTime lastScan;

        QJsonObject toJson() const;
    };

    explicit PortMonitor(std::unique_ptr<AbstractPortSource> source,
                         MonitorSettings* settings = nullptr,
                         QObject* parent = nullptr);
    ~PortMonitor();

    void setOnPortAdded(PortCallback callback);
    void setOnPortStatusChanged(PortCallback callback);

    void startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const;
    int monitorIntervalMs() const;

    bool refreshPorts();
    void reconcile(const QList<ComPort>& snapshot);

    QList<ComPort> availablePorts() const;
    QList<ComPort> unavailablePorts() const;
    QList<ComPort> allPorts() const;
    std::optional<ComPort> portByName(const QString& portName) const;

    QList<ComPort> history() const;
    void clearHistory();

    Statistics statistics() const;

    // The session stays owned by the monitor and the pointer goes null once it is released
    // by closePort(), a disappearance or the monitor's destruction. Null on failure.
    QPointer<QSerialPort> openPort(const QString& portName, const PortOpenOptions& options = PortOpenOptions());
    bool closePort(const QString& portName);
    bool testPort(const QString& portName, int baudRate = 9600);

    // Configured defaults overlaid with the explicit options, as openPort() applies them
    ComPort resolveSessionSettings(const ComPort& port, const PortOpenOptions& options) const;

    bool exportPorts(const QString& filePath) const;
    static std::optional<QList<ComPort>> importPorts(const QString& filePath);

    static QList<int> baudRates();
    static QList<int> dataBits();
    static QList<double> stopBits();
    static QStringList parityOptions();

signals:
    void portAdded(const ComPort& port);
    void portStatusChanged(const ComPort& port);
    void monitoringStarted();
    void monitoringStopped();
    void errorOccurred(const QString& error);

private:
    void applySnapshot(const QList<ComPort>& snapshot);
    void dispatch(const QList<EntityChange<ComPort>>& changes);
    void notifyStatusChanged(const ComPort& port);
    void invoke(const PortCallback& callback, const ComPort& port, const char* slotName);
    void releaseSession(const QString& portName);

    std::unique_ptr<AbstractPortSource> m_source;
    MonitorSettings* m_settings;
    PollingWorker* m_worker;

    // Serialises snapshot application, session changes and callback dispatch
    QRecursiveMutex m_tickMutex;
    QHash<QString, QPointer<QSerialPort>> m_sessions;

    mutable QMutex m_stateMutex;
    QList<ComPort> m_ports;
    QList<ComPort> m_history;
    QDateTime m_lastScan;

    mutable QMutex m_callbackMutex;
    PortCallback m_onAdded;
    PortCallback m_onStatusChanged;
};

#endif // PORTMONITOR_H
