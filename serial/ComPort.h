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

#ifndef COMPORT_H
#define COMPORT_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

class ComPort
{
public:
    ComPort();
    explicit ComPort(const QString& portName);

    QString portName;

    QString deviceName;
    QString description;
    QString manufacturer;
    QString vendorId;
    QString productId;
    QString serialNumber;

    // Session settings applied when the port is opened
    int baudRate;
    int dataBits;
    double stopBits;
    QString parity;       // N, E, O
    QString flowControl;  // None, XON/XOFF, RTS/CTS

    bool isAvailable;
    bool isOpen;
    QDateTime lastUsed;

    QDateTime createdAt;

    QJsonObject toJson() const;
    static ComPort fromJson(const QJsonObject& object);

    QString getUniqueKey() const { return portName; }

    // "USB Serial", "Windows COM", "TTY" or "Other", from the port name
    QString portType() const;

    // Unavailable ports are never open
    void setAvailable(bool available);

    void refreshFrom(const ComPort& observed);

    bool operator==(const ComPort& other) const;
    bool operator!=(const ComPort& other) const;
};

Q_DECLARE_METATYPE(ComPort)

#endif // COMPORT_H
