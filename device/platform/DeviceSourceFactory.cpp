#include "DeviceSourceFactory.h"
#include "../../serial/SerialPortSource.h"
#include <QLoggingCategory>

#if defined(__linux__) && defined(HAVE_LIBUDEV)
#include "LinuxDeviceSource.h"
#endif

Q_LOGGING_CATEGORY(log_device_factory, "usbmon.device.factory")

std::unique_ptr<AbstractDeviceSource> DeviceSourceFactory::createDeviceSource()
{
    QString platform = getCurrentPlatform();
    qCDebug(log_device_factory) << "Creating device source for platform:" << platform;

#if defined(__linux__) && defined(HAVE_LIBUDEV)
    if (platform == "Linux") {
        return std::make_unique<LinuxDeviceSource>();
    }
#endif

#if defined(__linux__) && !defined(HAVE_LIBUDEV)
    qCWarning(log_device_factory) << "Built without libudev, USB device enumeration is unavailable";
#else
    qCWarning(log_device_factory) << "No USB device source for platform:" << platform;
#endif
    return nullptr;
}

std::unique_ptr<AbstractPortSource> DeviceSourceFactory::createPortSource()
{
    return std::make_unique<SerialPortSource>();
}

QString DeviceSourceFactory::getCurrentPlatform()
{
#ifdef _WIN32
    return "Windows";
#elif __linux__
    return "Linux";
#elif __APPLE__
    return "macOS";
#else
    return "Unknown";
#endif
}

bool DeviceSourceFactory::isPlatformSupported(const QString& platformName)
{
    QString platform = platformName.isEmpty() ? getCurrentPlatform() : platformName;
    return getSupportedPlatforms().contains(platform, Qt::CaseInsensitive);
}

QStringList DeviceSourceFactory::getSupportedPlatforms()
{
    QStringList platforms;

#if defined(__linux__) && defined(HAVE_LIBUDEV)
    platforms << "Linux";
#endif

    return platforms;
}
