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

#include "ComPort.h"
#include "../monitor/EntityJson.h"

ComPort::ComPort()
    : baudRate(9600)
    , dataBits(8)
    , stopBits(1.0)
    , parity("N")
    , flowControl("None")
    , isAvailable(true)
    , isOpen(false)
{
}

ComPort::ComPort(const QString& portName)
    : ComPort()
{
    this->portName = portName;
}

QJsonObject ComPort::toJson() const
{
    QJsonObject object;
    object["port_name"] = portName;
    object["device_name"] = deviceName;
    object["description"] = description;
    object["manufacturer"] = manufacturer;
    object["vendor_id"] = vendorId;
    object["product_id"] = productId;
    object["serial_number"] = serialNumber;
    object["baud_rate"] = baudRate;
    object["data_bits"] = dataBits;
    object["stop_bits"] = stopBits;
    object["parity"] = parity;
    object["flow_control"] = flowControl;
    object["is_available"] = isAvailable;
    object["is_open"] = isOpen;
    object["last_used"] = EntityJson::fromDateTime(lastUsed);
    object["created_at"] = EntityJson::fromDateTime(createdAt);
    return object;
}

ComPort ComPort::fromJson(const QJsonObject& object)
{
    ComPort port(object.value("port_name").toString());
    port.deviceName = object.value("device_name").toString();
    port.description = object.value("description").toString();
    port.manufacturer = object.value("manufacturer").toString();
    port.vendorId = object.value("vendor_id").toString();
    port.productId = object.value("product_id").toString();
    port.serialNumber = object.value("serial_number").toString();
    port.baudRate = object.value("baud_rate").toInt(9600);
    port.dataBits = object.value("data_bits").toInt(8);
    port.stopBits = object.value("stop_bits").toDouble(1.0);
    port.parity = object.value("parity").toString("N");
    port.flowControl = object.value("flow_control").toString("None");
    port.isAvailable = object.value("is_available").toBool(true);
    port.isOpen = port.isAvailable && object.value("is_open").toBool(false);
    port.lastUsed = EntityJson::toDateTime(object.value("last_used"));
    port.createdAt = EntityJson::toDateTime(object.value("created_at"));
    return port;
}

QString ComPort::portType() const
{
    QString upper = portName.toUpper();
    if (upper.contains("USB")) {
        return "USB Serial";
    }
    if (upper.contains("COM")) {
        return "Windows COM";
    }
    if (upper.contains("TTY")) {
        return "TTY";
    }
    return "Other";
}

void ComPort::setAvailable(bool available)
{
    isAvailable = available;
    if (!available) {
        isOpen = false;
    }
}

void ComPort::refreshFrom(const ComPort& observed)
{
    deviceName = observed.deviceName;
    description = observed.description;
    manufacturer = observed.manufacturer;
    vendorId = observed.vendorId;
    productId = observed.productId;
    serialNumber = observed.serialNumber;
}

bool ComPort::operator==(const ComPort& other) const
{
    return portName == other.portName &&
           deviceName == other.deviceName &&
           description == other.description &&
           manufacturer == other.manufacturer &&
           vendorId == other.vendorId &&
           productId == other.productId &&
           serialNumber == other.serialNumber &&
           baudRate == other.baudRate &&
           dataBits == other.dataBits &&
           stopBits == other.stopBits &&
           parity == other.parity &&
           flowControl == other.flowControl &&
           isAvailable == other.isAvailable &&
           isOpen == other.isOpen &&
           lastUsed == other.lastUsed &&
           createdAt == other.createdAt;
}

bool ComPort::operator!=(const ComPort& other) const
{
    return !(*this == other);
}
