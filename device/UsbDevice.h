#ifndef USBDEVICE_H
#define USBDEVICE_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

class UsbDevice
{
public:
    UsbDevice();
    explicit UsbDevice(const QString& name);

    // Identity
    QString deviceId;

    // Descriptive
    QString name;
    QString description;
    QString manufacturer;
    QString deviceType;
    QString usbVersion;
    QString serialNumber;
    QString vendorId;
    QString productId;
    QString driverVersion;

    // Power and throughput metadata
    QString powerConsumption;
    QString maxPower;
    QString currentRequired;
    QString currentAvailable;
    QString transferSpeed;
    QString maxTransferSpeed;
    QString deviceClass;

    // Status
    bool isConnected;
    QString connectionStatus;
    QString portNumber;

    // Null until the monitor first observes the record
    QDateTime firstSeen;
    QDateTime lastSeen;

    QJsonObject toJson() const;
    static UsbDevice fromJson(const QJsonObject& object);

    // Key used to match the device across snapshots
    QString getUniqueKey() const;
    bool isValid() const;
    bool isHub() const { return deviceType == "Hub"; }

    void setConnected(bool connected);

    // Copies everything but identity, status and timestamps from a newer observation
    void refreshFrom(const UsbDevice& observed);

    bool operator==(const UsbDevice& other) const;
    bool operator!=(const UsbDevice& other) const;
};

Q_DECLARE_METATYPE(UsbDevice)

#endif // USBDEVICE_H
