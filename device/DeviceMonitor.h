#ifndef DEVICEMONITOR_H
#define DEVICEMONITOR_H

#include <QObject>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QLoggingCategory>
#include <QMap>
#include <QMutex>
#include <QRecursiveMutex>
#include <functional>
#include <memory>
#include <optional>

#include "UsbDevice.h"
#include "AbstractDeviceSource.h"
#include "../monitor/EntityReconciler.h"

Q_DECLARE_LOGGING_CATEGORY(log_device_monitor)

class MonitorSettings;
class PollingWorker;

/**
 * @brief Tracks USB devices across snapshots and reports connect/disconnect transitions.
 *
 * Devices are matched by UsbDevice::getUniqueKey(). A device seen for the first time
 * is appended to both the device list and the history; a device that disappears is
 * marked disconnected and stays in the list.
 *
 * Each tick fires callbacks in three phases: connections of new devices, then per
 * present device an optional connect/disconnect transition followed by the update
 * callback, then disconnections of devices missing from the snapshot.
 *
 * Callbacks and signals fire synchronously on the thread that ran the tick, which is
 * the polling thread while monitoring. Consumers that need another thread must marshal
 * themselves. Callbacks may call the read accessors, refreshDevices() and stopMonitoring().
 */
class DeviceMonitor : public QObject
{
    Q_OBJECT

public:
    using DeviceCallback = std::function<void(const UsbDevice&)>;

    struct Statistics {
        int totalDevices = 0;
        int connectedDevices = 0;
        int disconnectedDevices = 0;
        QMap<QString, int> deviceTypes;
        QMap<QString, int> manufacturers;
        QDateTime lastScan;

        QJsonObject toJson() const;
    };

    // settings may be null; built-in defaults apply then
    explicit DeviceMonitor(std::unique_ptr<AbstractDeviceSource> source,
                           MonitorSettings* settings = nullptr,
                           QObject* parent = nullptr);
    ~DeviceMonitor();

    // Single slot per event, the last registration wins
    void setOnDeviceConnected(DeviceCallback callback);
    void setOnDeviceDisconnected(DeviceCallback callback);
    void setOnDeviceUpdated(DeviceCallback callback);

    void startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const;
    int monitorIntervalMs() const;

    // Fetches a snapshot and reconciles it on the calling thread.
    // A failed or empty fetch leaves the state untouched and returns false.
    bool refreshDevices();

    // Applies a snapshot as-is; an empty list disconnects every known device
    void reconcile(const QList<UsbDevice>& snapshot);

    QList<UsbDevice> connectedDevices() const;
    QList<UsbDevice> disconnectedDevices() const;
    QList<UsbDevice> allDevices() const;
    QList<UsbDevice> visibleDevices(bool showDisconnected, bool showHubs) const;
    QList<UsbDevice> visibleDevices() const;
    std::optional<UsbDevice> deviceByName(const QString& name) const;
    std::optional<UsbDevice> deviceByKey(const QString& key) const;

    QList<UsbDevice> history() const;
    void clearHistory();

    Statistics statistics() const;

    bool exportDevices(const QString& filePath) const;
    static std::optional<QList<UsbDevice>> importDevices(const QString& filePath);

    bool hasSource() const { return m_source != nullptr; }

signals:
    void deviceConnected(const UsbDevice& device);
    void deviceDisconnected(const UsbDevice& device);
    void deviceUpdated(const UsbDevice& device);
    void monitoringStarted();
    void monitoringStopped();
    void errorOccurred(const QString& error);

private:
    void applySnapshot(const QList<UsbDevice>& snapshot);
    void dispatch(const QList<EntityChange<UsbDevice>>& changes);
    void invoke(const DeviceCallback& callback, const UsbDevice& device, const char* slotName);

    std::unique_ptr<AbstractDeviceSource> m_source;
    MonitorSettings* m_settings;
    PollingWorker* m_worker;

    // Serialises snapshot application and callback dispatch
    QRecursiveMutex m_tickMutex;

    // Guards the lists below; never held while callbacks run
    mutable QMutex m_stateMutex;
    QList<UsbDevice> m_devices;
    QList<UsbDevice> m_history;
    QDateTime m_lastScan;

    mutable QMutex m_callbackMutex;
    DeviceCallback m_onConnected;
    DeviceCallback m_onDisconnected;
    DeviceCallback m_onUpdated;
};

#endif // DEVICEMONITOR_H
