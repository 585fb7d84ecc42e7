#ifndef ABSTRACTDEVICESOURCE_H
#define ABSTRACTDEVICESOURCE_H

#include <QList>
#include <QString>
#include "UsbDevice.h"
#include "../monitor/SourceUnavailableError.h"

/**
 * @brief Platform-specific enumeration of the USB devices currently attached.
 *
 * Implementations return a fresh snapshot on every call. Order and completeness
 * are not guaranteed. A source throws SourceUnavailableError when it cannot
 * enumerate at all; an empty list means nothing could be observed.
 */
class AbstractDeviceSource
{
public:
    virtual ~AbstractDeviceSource() = default;

    virtual QList<UsbDevice> fetchDevices() = 0;
    virtual QString getPlatformName() const = 0;
};

#endif // ABSTRACTDEVICESOURCE_H
