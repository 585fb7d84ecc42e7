#include "UsbDevice.h"
#include "../monitor/EntityJson.h"

UsbDevice::UsbDevice()
    : isConnected(true)
    , connectionStatus("Connected")
{
}

UsbDevice::UsbDevice(const QString& name)
    : name(name)
    , isConnected(true)
    , connectionStatus("Connected")
{
}

QJsonObject UsbDevice::toJson() const
{
    QJsonObject object;
    object["device_id"] = deviceId;
    object["name"] = name;
    object["description"] = description;
    object["manufacturer"] = manufacturer;
    object["device_type"] = deviceType;
    object["usb_version"] = usbVersion;
    object["serial_number"] = serialNumber;
    object["vendor_id"] = vendorId;
    object["product_id"] = productId;
    object["driver_version"] = driverVersion;
    object["power_consumption"] = powerConsumption;
    object["max_power"] = maxPower;
    object["current_required"] = currentRequired;
    object["current_available"] = currentAvailable;
    object["transfer_speed"] = transferSpeed;
    object["max_transfer_speed"] = maxTransferSpeed;
    object["device_class"] = deviceClass;
    object["is_connected"] = isConnected;
    object["connection_status"] = connectionStatus;
    object["port_number"] = portNumber;
    object["first_seen"] = EntityJson::fromDateTime(firstSeen);
    object["last_seen"] = EntityJson::fromDateTime(lastSeen);
    return object;
}

UsbDevice UsbDevice::fromJson(const QJsonObject& object)
{
    UsbDevice device;
    device.deviceId = object.value("device_id").toString();
    device.name = object.value("name").toString();
    device.description = object.value("description").toString();
    device.manufacturer = object.value("manufacturer").toString();
    device.deviceType = object.value("device_type").toString();
    device.usbVersion = object.value("usb_version").toString();
    device.serialNumber = object.value("serial_number").toString();
    device.vendorId = object.value("vendor_id").toString();
    device.productId = object.value("product_id").toString();
    device.driverVersion = object.value("driver_version").toString();
    device.powerConsumption = object.value("power_consumption").toString();
    device.maxPower = object.value("max_power").toString();
    device.currentRequired = object.value("current_required").toString();
    device.currentAvailable = object.value("current_available").toString();
    device.transferSpeed = object.value("transfer_speed").toString();
    device.maxTransferSpeed = object.value("max_transfer_speed").toString();
    device.deviceClass = object.value("device_class").toString();
    device.isConnected = object.value("is_connected").toBool(true);
    device.connectionStatus = object.value("connection_status").toString(
        device.isConnected ? "Connected" : "Disconnected");
    device.portNumber = object.value("port_number").toString();
    device.firstSeen = EntityJson::toDateTime(object.value("first_seen"));
    device.lastSeen = EntityJson::toDateTime(object.value("last_seen"));
    return device;
}

QString UsbDevice::getUniqueKey() const
{
    if (!deviceId.isEmpty()) {
        return deviceId;
    }
    if (!vendorId.isEmpty() && !productId.isEmpty()) {
        if (!serialNumber.isEmpty()) {
            return QString("%1:%2:%3").arg(vendorId, productId, serialNumber);
        }
        if (!portNumber.isEmpty()) {
            return QString("%1:%2@%3").arg(vendorId, productId, portNumber);
        }
    }
    return name;
}

bool UsbDevice::isValid() const
{
    return !getUniqueKey().isEmpty();
}

void UsbDevice::setConnected(bool connected)
{
    isConnected = connected;
    connectionStatus = connected ? "Connected" : "Disconnected";
}

void UsbDevice::refreshFrom(const UsbDevice& observed)
{
    name = observed.name;
    description = observed.description;
    manufacturer = observed.manufacturer;
    deviceType = observed.deviceType;
    usbVersion = observed.usbVersion;
    serialNumber = observed.serialNumber;
    vendorId = observed.vendorId;
    productId = observed.productId;
    driverVersion = observed.driverVersion;
    powerConsumption = observed.powerConsumption;
    maxPower = observed.maxPower;
    currentRequired = observed.currentRequired;
    currentAvailable = observed.currentAvailable;
    transferSpeed = observed.transferSpeed;
    maxTransferSpeed = observed.maxTransferSpeed;
    deviceClass = observed.deviceClass;
    portNumber = observed.portNumber;
}

bool UsbDevice::operator==(const UsbDevice& other) const
{
    return deviceId == other.deviceId &&
           name == other.name &&
           description == other.description &&
           manufacturer == other.manufacturer &&
           deviceType == other.deviceType &&
           usbVersion == other.usbVersion &&
           serialNumber == other.serialNumber &&
           vendorId == other.vendorId &&
           productId == other.productId &&
           driverVersion == other.driverVersion &&
           powerConsumption == other.powerConsumption &&
           maxPower == other.maxPower &&
           currentRequired == other.currentRequired &&
           currentAvailable == other.currentAvailable &&
           transferSpeed == other.transferSpeed &&
           maxTransferSpeed == other.maxTransferSpeed &&
           deviceClass == other.deviceClass &&
           isConnected == other.isConnected &&
           connectionStatus == other.connectionStatus &&
           portNumber == other.portNumber &&
           firstSeen == other.firstSeen &&
           lastSeen == other.lastSeen;
}

bool UsbDevice::operator!=(const UsbDevice& other) const
{
    return !(*this == other);
}
