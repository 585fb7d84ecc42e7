#if defined(__linux__) && defined(HAVE_LIBUDEV)
#include "LinuxDeviceSource.h"

#include <QMap>
#include <libudev.h>

Q_LOGGING_CATEGORY(log_device_linux, "usbmon.device.linux")

namespace {

QString sysattr(struct udev_device* device, const char* name)
{
    const char* value = udev_device_get_sysattr_value(device, name);
    return value ? QString::fromUtf8(value).trimmed() : QString();
}

QString property(struct udev_device* device, const char* name)
{
    const char* value = udev_device_get_property_value(device, name);
    return value ? QString::fromUtf8(value).trimmed() : QString();
}

} // namespace

LinuxDeviceSource::LinuxDeviceSource()
    : m_udev(udev_new())
{
    if (!m_udev) {
        qCWarning(log_device_linux) << "Failed to create udev context";
    } else {
        qCDebug(log_device_linux) << "Linux device source initialized with libudev";
    }
}

LinuxDeviceSource::~LinuxDeviceSource()
{
    if (m_udev) {
        udev_unref(m_udev);
        m_udev = nullptr;
    }
}

QList<UsbDevice> LinuxDeviceSource::fetchDevices()
{
    if (!m_udev) {
        throw SourceUnavailableError("udev context not initialized");
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(m_udev);
    if (!enumerate) {
        throw SourceUnavailableError("udev_enumerate_new failed");
    }

    udev_enumerate_add_match_subsystem(enumerate, "usb");
    udev_enumerate_add_match_property(enumerate, "DEVTYPE", "usb_device");

    int rc = udev_enumerate_scan_devices(enumerate);
    if (rc < 0) {
        udev_enumerate_unref(enumerate);
        throw SourceUnavailableError(QString("udev_enumerate_scan_devices failed: %1").arg(rc));
    }

    QList<UsbDevice> devices;
    struct udev_list_entry* devicesList = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, devicesList) {
        const char* syspath = udev_list_entry_get_name(entry);
        struct udev_device* device = udev_device_new_from_syspath(m_udev, syspath);
        if (!device) {
            continue;
        }

        UsbDevice usbDevice = fromUdevDevice(device);
        if (usbDevice.isValid()) {
            devices.append(usbDevice);
        }
        udev_device_unref(device);
    }

    udev_enumerate_unref(enumerate);

    qCDebug(log_device_linux) << "Found" << devices.size() << "USB devices";
    return devices;
}

UsbDevice LinuxDeviceSource::fromUdevDevice(struct udev_device* device) const
{
    UsbDevice usbDevice;

    usbDevice.vendorId = sysattr(device, "idVendor").toUpper();
    usbDevice.productId = sysattr(device, "idProduct").toUpper();
    usbDevice.serialNumber = sysattr(device, "serial");

    usbDevice.manufacturer = sysattr(device, "manufacturer");
    if (usbDevice.manufacturer.isEmpty()) {
        usbDevice.manufacturer = property(device, "ID_VENDOR_FROM_DATABASE");
    }

    QString product = sysattr(device, "product");
    QString modelFromDatabase = property(device, "ID_MODEL_FROM_DATABASE");
    usbDevice.name = !product.isEmpty() ? product : modelFromDatabase;
    if (usbDevice.name.isEmpty()) {
        usbDevice.name = QString("USB Device %1:%2").arg(usbDevice.vendorId, usbDevice.productId);
    }
    usbDevice.description = !modelFromDatabase.isEmpty() ? modelFromDatabase : usbDevice.name;

    usbDevice.usbVersion = sysattr(device, "version");
    usbDevice.transferSpeed = formatSpeed(sysattr(device, "speed"));
    usbDevice.maxTransferSpeed = maxSpeedForVersion(usbDevice.usbVersion);

    usbDevice.maxPower = sysattr(device, "bMaxPower");
    usbDevice.powerConsumption = usbDevice.maxPower;
    usbDevice.currentRequired = usbDevice.maxPower;

    QString classCode = sysattr(device, "bDeviceClass").toLower();
    usbDevice.deviceClass = deviceClassName(classCode);
    usbDevice.deviceType = classCode == "09" ? QString("Hub") : usbDevice.deviceClass;

    const char* driver = udev_device_get_driver(device);
    usbDevice.driverVersion = driver ? QString::fromUtf8(driver) : QString();

    // sysname is the bus/port topology, e.g. "1-2.1", or "usb1" for a root hub
    const char* sysname = udev_device_get_sysname(device);
    usbDevice.portNumber = sysname ? QString::fromUtf8(sysname) : QString();

    if (!usbDevice.vendorId.isEmpty() && !usbDevice.productId.isEmpty()) {
        usbDevice.deviceId = !usbDevice.serialNumber.isEmpty()
            ? QString("%1:%2:%3").arg(usbDevice.vendorId, usbDevice.productId, usbDevice.serialNumber)
            : QString("%1:%2@%3").arg(usbDevice.vendorId, usbDevice.productId, usbDevice.portNumber);
    }

    usbDevice.setConnected(true);

    qCDebug(log_device_linux) << "USB device" << usbDevice.deviceId << usbDevice.name
                              << "speed" << usbDevice.transferSpeed << "port" << usbDevice.portNumber;
    return usbDevice;
}

QString LinuxDeviceSource::formatSpeed(const QString& mbps)
{
    if (mbps.isEmpty()) {
        return QString();
    }

    bool ok = false;
    double value = mbps.toDouble(&ok);
    if (!ok || value <= 0) {
        return QString();
    }

    if (value >= 1000) {
        return QString("%1 Gb/s").arg(value / 1000.0);
    }
    return QString("%1 Mb/s").arg(value);
}

QString LinuxDeviceSource::maxSpeedForVersion(const QString& usbVersion)
{
    bool ok = false;
    double version = usbVersion.toDouble(&ok);
    if (!ok) {
        return QString();
    }

    if (version >= 3.2) {
        return "20 Gb/s";
    }
    if (version >= 3.1) {
        return "10 Gb/s";
    }
    if (version >= 3.0) {
        return "5 Gb/s";
    }
    if (version >= 2.0) {
        return "480 Mb/s";
    }
    if (version >= 1.1) {
        return "12 Mb/s";
    }
    return "1.5 Mb/s";
}

QString LinuxDeviceSource::deviceClassName(const QString& classCode)
{
    static const QMap<QString, QString> classNames = {
        {"00", "Composite"},
        {"01", "Audio"},
        {"02", "Communications"},
        {"03", "HID"},
        {"05", "Physical"},
        {"06", "Image"},
        {"07", "Printer"},
        {"08", "Mass Storage"},
        {"09", "Hub"},
        {"0a", "CDC Data"},
        {"0b", "Smart Card"},
        {"0e", "Video"},
        {"0f", "Personal Healthcare"},
        {"10", "Audio/Video"},
        {"dc", "Diagnostic"},
        {"e0", "Wireless Controller"},
        {"ef", "Miscellaneous"},
        {"fe", "Application Specific"},
        {"ff", "Vendor Specific"}
    };

    if (classCode.isEmpty()) {
        return QString();
    }
    return classNames.value(classCode.toLower(), QString("Class %1").arg(classCode));
}

#endif // __linux__ && HAVE_LIBUDEV
