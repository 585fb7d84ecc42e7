#include "DeviceMonitor.h"
#include "../core/MonitorSettings.h"
#include "../monitor/EntityJson.h"
#include "../monitor/PollingWorker.h"

#include <QJsonArray>
#include <QMutexLocker>
#include <exception>

Q_LOGGING_CATEGORY(log_device_monitor, "usbmon.device.monitor")

namespace {

struct DeviceTraits
{
    static bool isPresent(const UsbDevice& device) { return device.isConnected; }
    static void setPresent(UsbDevice& device, bool present) { device.setConnected(present); }

    static void stampCreated(UsbDevice& device, const QDateTime& now)
    {
        device.firstSeen = now;
        device.lastSeen = now;
    }

    static void stampSeen(UsbDevice& device, const QDateTime& now)
    {
        device.lastSeen = now;
        if (!device.firstSeen.isValid() || device.firstSeen > now) {
            device.firstSeen = now;
        }
    }
};

QString displayName(const UsbDevice& device)
{
    return device.name.isEmpty() ? device.getUniqueKey() : device.name;
}

} // namespace

QJsonObject DeviceMonitor::Statistics::toJson() const
{
    QJsonObject types;
    for (auto it = deviceTypes.constBegin(); it != deviceTypes.constEnd(); ++it) {
        types[it.key()] = it.value();
    }
    QJsonObject vendors;
    for (auto it = manufacturers.constBegin(); it != manufacturers.constEnd(); ++it) {
        vendors[it.key()] = it.value();
    }

    QJsonObject object;
    object["total_devices"] = totalDevices;
    object["connected_devices"] = connectedDevices;
    object["disconnected_devices"] = disconnectedDevices;
    object["device_types"] = types;
    object["manufacturers"] = vendors;
    object["last_scan"] = EntityJson::fromDateTime(lastScan);
    return object;
}

DeviceMonitor::DeviceMonitor(std::unique_ptr<AbstractDeviceSource> source,
                             MonitorSettings* settings,
                             QObject* parent)
    : QObject(parent)
    , m_source(std::move(source))
    , m_settings(settings)
    , m_worker(nullptr)
{
    qRegisterMetaType<UsbDevice>("UsbDevice");

    m_worker = new PollingWorker("DeviceMonitor", [this]() { refreshDevices(); }, monitorIntervalMs(), this);

    if (m_source) {
        qCDebug(log_device_monitor) << "Device monitor created for platform" << m_source->getPlatformName();
    } else {
        qCWarning(log_device_monitor) << "Device monitor created without a device source";
    }
}

DeviceMonitor::~DeviceMonitor()
{
    // The tick touches members, so the thread must be gone before they are
    if (!m_worker->stopPolling()) {
        m_worker->wait();
    }
    qCDebug(log_device_monitor) << "Device monitor destroyed";
}

void DeviceMonitor::setOnDeviceConnected(DeviceCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onConnected = std::move(callback);
}

void DeviceMonitor::setOnDeviceDisconnected(DeviceCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onDisconnected = std::move(callback);
}

void DeviceMonitor::setOnDeviceUpdated(DeviceCallback callback)
{
    QMutexLocker locker(&m_callbackMutex);
    m_onUpdated = std::move(callback);
}

void DeviceMonitor::startMonitoring()
{
    if (m_worker->isPolling()) {
        qCDebug(log_device_monitor) << "Device monitoring already running";
        return;
    }

    if (!m_source) {
        qCWarning(log_device_monitor) << "Cannot start device monitoring - no device source for this platform";
        return;
    }

    m_worker->setIntervalMs(monitorIntervalMs());
    m_worker->startPolling();

    emit monitoringStarted();
    qCInfo(log_device_monitor) << "USB device monitoring started with interval" << m_worker->intervalMs() << "ms";
}

void DeviceMonitor::stopMonitoring()
{
    if (!m_worker->isPolling()) {
        return;
    }

    m_worker->stopPolling();

    emit monitoringStopped();
    qCInfo(log_device_monitor) << "USB device monitoring stopped";
}

bool DeviceMonitor::isMonitoring() const
{
    return m_worker->isPolling();
}

int DeviceMonitor::monitorIntervalMs() const
{
    return m_settings ? m_settings->deviceIntervalMs() : MonitorSettings::DEFAULT_DEVICE_INTERVAL_MS;
}

bool DeviceMonitor::refreshDevices()
{
    if (!m_source) {
        qCWarning(log_device_monitor) << "No device source available, skipping refresh";
        return false;
    }

    QMutexLocker tickLocker(&m_tickMutex);

    QList<UsbDevice> snapshot;
    try {
        snapshot = m_source->fetchDevices();
    } catch (const std::exception& e) {
        QString error = QString("Failed to enumerate USB devices: %1").arg(e.what());
        qCWarning(log_device_monitor) << error;
        emit errorOccurred(error);
        return false;
    } catch (...) {
        QString error = QString("Failed to enumerate USB devices: unknown error");
        qCWarning(log_device_monitor) << error;
        emit errorOccurred(error);
        return false;
    }

    // An empty result is treated as a failed fetch so a glitch never disconnects everything
    if (snapshot.isEmpty()) {
        qCDebug(log_device_monitor) << "Device source returned an empty snapshot, keeping current state";
        return false;
    }

    applySnapshot(snapshot);
    return true;
}

void DeviceMonitor::reconcile(const QList<UsbDevice>& snapshot)
{
    QMutexLocker tickLocker(&m_tickMutex);
    applySnapshot(snapshot);
}

void DeviceMonitor::applySnapshot(const QList<UsbDevice>& snapshot)
{
    QList<EntityChange<UsbDevice>> changes;
    {
        QMutexLocker locker(&m_stateMutex);
        QDateTime now = QDateTime::currentDateTime();
        changes = reconcileEntities<UsbDevice, DeviceTraits>(m_devices, m_history, snapshot, now);
        m_lastScan = now;
    }

    qCDebug(log_device_monitor) << "Reconciled" << snapshot.size() << "observed devices," << changes.size() << "changes";
    dispatch(changes);
}

void DeviceMonitor::dispatch(const QList<EntityChange<UsbDevice>>& changes)
{
    DeviceCallback onConnected;
    DeviceCallback onDisconnected;
    DeviceCallback onUpdated;
    {
        QMutexLocker locker(&m_callbackMutex);
        onConnected = m_onConnected;
        onDisconnected = m_onDisconnected;
        onUpdated = m_onUpdated;
    }

    for (const auto& change : changes) {
        const UsbDevice& device = change.entity;
        switch (change.kind) {
        case EntityChange<UsbDevice>::Added:
            qCInfo(log_device_monitor) << "New USB device connected:" << displayName(device);
            invoke(onConnected, device, "connected");
            emit deviceConnected(device);
            break;
        case EntityChange<UsbDevice>::StateChanged:
            if (device.isConnected) {
                qCInfo(log_device_monitor) << "USB device reconnected:" << displayName(device);
                invoke(onConnected, device, "connected");
                emit deviceConnected(device);
            } else {
                qCInfo(log_device_monitor) << "USB device reported disconnected:" << displayName(device);
                invoke(onDisconnected, device, "disconnected");
                emit deviceDisconnected(device);
            }
            break;
        case EntityChange<UsbDevice>::Refreshed:
            invoke(onUpdated, device, "updated");
            emit deviceUpdated(device);
            break;
        case EntityChange<UsbDevice>::Vanished:
            qCInfo(log_device_monitor) << "USB device disconnected:" << displayName(device);
            invoke(onDisconnected, device, "disconnected");
            emit deviceDisconnected(device);
            break;
        }
    }
}

void DeviceMonitor::invoke(const DeviceCallback& callback, const UsbDevice& device, const char* slotName)
{
    if (!callback) {
        return;
    }

    try {
        callback(device);
    } catch (const std::exception& e) {
        qCWarning(log_device_monitor) << "Exception in" << slotName << "callback for" << displayName(device) << ":" << e.what();
    } catch (...) {
        qCWarning(log_device_monitor) << "Unknown exception in" << slotName << "callback for" << displayName(device);
    }
}

QList<UsbDevice> DeviceMonitor::connectedDevices() const
{
    QMutexLocker locker(&m_stateMutex);
    QList<UsbDevice> result;
    for (const auto& device : m_devices) {
        if (device.isConnected) {
            result.append(device);
        }
    }
    return result;
}

QList<UsbDevice> DeviceMonitor::disconnectedDevices() const
{
    QMutexLocker locker(&m_stateMutex);
    QList<UsbDevice> result;
    for (const auto& device : m_devices) {
        if (!device.isConnected) {
            result.append(device);
        }
    }
    return result;
}

QList<UsbDevice> DeviceMonitor::allDevices() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_devices;
}

QList<UsbDevice> DeviceMonitor::visibleDevices(bool showDisconnected, bool showHubs) const
{
    QMutexLocker locker(&m_stateMutex);
    QList<UsbDevice> result;
    for (const auto& device : m_devices) {
        if (!showDisconnected && !device.isConnected) {
            continue;
        }
        if (!showHubs && device.isHub()) {
            continue;
        }
        result.append(device);
    }
    return result;
}

QList<UsbDevice> DeviceMonitor::visibleDevices() const
{
    if (!m_settings) {
        return allDevices();
    }
    return visibleDevices(m_settings->showDisconnected(), m_settings->showHubs());
}

std::optional<UsbDevice> DeviceMonitor::deviceByName(const QString& name) const
{
    QMutexLocker locker(&m_stateMutex);
    for (const auto& device : m_devices) {
        if (device.name == name) {
            return device;
        }
    }
    return std::nullopt;
}

std::optional<UsbDevice> DeviceMonitor::deviceByKey(const QString& key) const
{
    QMutexLocker locker(&m_stateMutex);
    for (const auto& device : m_devices) {
        if (device.getUniqueKey() == key) {
            return device;
        }
    }
    return std::nullopt;
}

QList<UsbDevice> DeviceMonitor::history() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_history;
}

void DeviceMonitor::clearHistory()
{
    QMutexLocker locker(&m_stateMutex);
    m_history.clear();
    qCInfo(log_device_monitor) << "Device history cleared";
}

DeviceMonitor::Statistics DeviceMonitor::statistics() const
{
    QMutexLocker locker(&m_stateMutex);

    Statistics stats;
    stats.totalDevices = m_devices.size();
    for (const auto& device : m_devices) {
        if (device.isConnected) {
            ++stats.connectedDevices;
        } else {
            ++stats.disconnectedDevices;
        }
        stats.deviceTypes[device.deviceType.isEmpty() ? QString("Unknown") : device.deviceType]++;
        stats.manufacturers[device.manufacturer.isEmpty() ? QString("Unknown") : device.manufacturer]++;
    }
    stats.lastScan = m_lastScan;
    return stats;
}

bool DeviceMonitor::exportDevices(const QString& filePath) const
{
    QJsonArray records;
    for (const auto& device : allDevices()) {
        records.append(device.toJson());
    }

    if (!EntityJson::writeArray(filePath, records)) {
        qCWarning(log_device_monitor) << "Failed to export device list to" << filePath;
        return false;
    }

    qCInfo(log_device_monitor) << "Exported" << records.size() << "devices to" << filePath;
    return true;
}

std::optional<QList<UsbDevice>> DeviceMonitor::importDevices(const QString& filePath)
{
    std::optional<QJsonArray> records = EntityJson::readArray(filePath);
    if (!records) {
        return std::nullopt;
    }

    QList<UsbDevice> devices;
    for (const QJsonValue& value : *records) {
        if (!value.isObject()) {
            qCWarning(log_device_monitor) << "Skipping non-object entry in" << filePath;
            continue;
        }
        devices.append(UsbDevice::fromJson(value.toObject()));
    }
    return devices;
}
