#ifndef MOCKSOURCES_H
#define MOCKSOURCES_H

#include "device/AbstractDeviceSource.h"
#include "serial/AbstractPortSource.h"

#include <QMutex>
#include <QMutexLocker>

// Returns whatever snapshot the test set last, or throws when told to fail
class MockDeviceSource : public AbstractDeviceSource
{
public:
    void setSnapshot(const QList<UsbDevice>& devices)
    {
        QMutexLocker locker(&m_mutex);
        m_snapshot = devices;
    }

    void setFailure(const QString& message)
    {
        QMutexLocker locker(&m_mutex);
        m_failure = message;
    }

    void clearFailure() { setFailure(QString()); }

    // Throws a value that is not a std::exception, like a misbehaving third-party backend
    void setThrowsUnknown(bool enabled)
    {
        QMutexLocker locker(&m_mutex);
        m_throwsUnknown = enabled;
    }

    int fetchCount() const
    {
        QMutexLocker locker(&m_mutex);
        return m_fetchCount;
    }

    QList<UsbDevice> fetchDevices() override
    {
        QMutexLocker locker(&m_mutex);
        ++m_fetchCount;
        if (m_throwsUnknown) {
            throw 42;
        }
        if (!m_failure.isEmpty()) {
            throw SourceUnavailableError(m_failure);
        }
        return m_snapshot;
    }

    QString getPlatformName() const override { return "Mock"; }

private:
    mutable QMutex m_mutex;
    QList<UsbDevice> m_snapshot;
    QString m_failure;
    bool m_throwsUnknown = false;
    int m_fetchCount = 0;
};

class MockPortSource : public AbstractPortSource
{
public:
    void setSnapshot(const QList<ComPort>& ports)
    {
        QMutexLocker locker(&m_mutex);
        m_snapshot = ports;
    }

    void setFailure(const QString& message)
    {
        QMutexLocker locker(&m_mutex);
        m_failure = message;
    }

    void setThrowsUnknown(bool enabled)
    {
        QMutexLocker locker(&m_mutex);
        m_throwsUnknown = enabled;
    }

    int fetchCount() const
    {
        QMutexLocker locker(&m_mutex);
        return m_fetchCount;
    }

    QList<ComPort> fetchPorts() override
    {
        QMutexLocker locker(&m_mutex);
        ++m_fetchCount;
        if (m_throwsUnknown) {
            throw QString("port backend failure");
        }
        if (!m_failure.isEmpty()) {
            throw SourceUnavailableError(m_failure);
        }
        return m_snapshot;
    }

    QString getPlatformName() const override { return "Mock"; }

private:
    mutable QMutex m_mutex;
    QList<ComPort> m_snapshot;
    QString m_failure;
    bool m_throwsUnknown = false;
    int m_fetchCount = 0;
};

inline UsbDevice makeDevice(const QString& id, const QString& name)
{
    UsbDevice device(name);
    device.deviceId = id;
    return device;
}

inline ComPort makePort(const QString& portName, const QString& description = QString())
{
    ComPort port(portName);
    port.description = description;
    return port;
}

#endif // MOCKSOURCES_H
