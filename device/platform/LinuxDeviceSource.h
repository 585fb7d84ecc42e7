#if defined(__linux__) && defined(HAVE_LIBUDEV)
#ifndef LINUXDEVICESOURCE_H
#define LINUXDEVICESOURCE_H

#include "../AbstractDeviceSource.h"
#include <QLoggingCategory>

struct udev;
struct udev_device;

Q_DECLARE_LOGGING_CATEGORY(log_device_linux)

/**
 * @brief USB device snapshots from libudev.
 *
 * Enumerates the "usb" subsystem, keeping "usb_device" nodes only (interfaces are
 * skipped). Root hubs are included and reported with device type "Hub".
 */
class LinuxDeviceSource : public AbstractDeviceSource
{
public:
    LinuxDeviceSource();
    ~LinuxDeviceSource();

    LinuxDeviceSource(const LinuxDeviceSource&) = delete;
    LinuxDeviceSource& operator=(const LinuxDeviceSource&) = delete;

    QList<UsbDevice> fetchDevices() override;
    QString getPlatformName() const override { return "Linux"; }

    // "480" -> "480 Mb/s", "5000" -> "5 Gb/s"
    static QString formatSpeed(const QString& mbps);
    // bcdUSB "2.00" -> "480 Mb/s"
    static QString maxSpeedForVersion(const QString& usbVersion);
    static QString deviceClassName(const QString& classCode);

private:
    UsbDevice fromUdevDevice(struct udev_device* device) const;

    struct udev* m_udev;
};

#endif // LINUXDEVICESOURCE_H
#endif // __linux__ && HAVE_LIBUDEV
