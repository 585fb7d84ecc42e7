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

#include "SerialPortSource.h"
#include "../device/platform/DeviceSourceFactory.h"

#include <QSerialPortInfo>

Q_LOGGING_CATEGORY(log_serial_source, "usbmon.serial.source")

QList<ComPort> SerialPortSource::fetchPorts()
{
    QList<ComPort> ports;
    const QList<QSerialPortInfo> infos = QSerialPortInfo::availablePorts();
    for (const QSerialPortInfo& info : infos) {
        ports.append(fromPortInfo(info));
    }

    qCDebug(log_serial_source) << "Found" << ports.size() << "serial ports";
    return ports;
}

QString SerialPortSource::getPlatformName() const
{
    return DeviceSourceFactory::getCurrentPlatform();
}

ComPort SerialPortSource::fromPortInfo(const QSerialPortInfo& info)
{
    ComPort port(info.portName());
    port.deviceName = info.systemLocation();
    port.description = info.description();
    port.manufacturer = info.manufacturer();
    port.serialNumber = info.serialNumber();
    if (info.hasVendorIdentifier()) {
        port.vendorId = QString("%1").arg(info.vendorIdentifier(), 4, 16, QChar('0')).toUpper();
    }
    if (info.hasProductIdentifier()) {
        port.productId = QString("%1").arg(info.productIdentifier(), 4, 16, QChar('0')).toUpper();
    }
    port.isAvailable = true;
    return port;
}
