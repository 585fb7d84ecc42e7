#ifndef DEVICESOURCEFACTORY_H
#define DEVICESOURCEFACTORY_H

#include <QStringList>
#include <memory>
#include "../AbstractDeviceSource.h"
#include "../../serial/AbstractPortSource.h"

class DeviceSourceFactory
{
public:
    // nullptr when the running platform has no USB device source
    static std::unique_ptr<AbstractDeviceSource> createDeviceSource();
    static std::unique_ptr<AbstractPortSource> createPortSource();

    // Platform detection utilities
    static QString getCurrentPlatform();
    static bool isPlatformSupported(const QString& platformName = QString());
    static QStringList getSupportedPlatforms();

private:
    DeviceSourceFactory() = delete; // Static class only
};

#endif // DEVICESOURCEFACTORY_H
