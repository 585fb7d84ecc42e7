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

#ifndef SERIALPORTSOURCE_H
#define SERIALPORTSOURCE_H

#include "AbstractPortSource.h"
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(log_serial_source)

class QSerialPortInfo;

// Port snapshots from QSerialPortInfo, on every platform Qt supports
class SerialPortSource : public AbstractPortSource
{
public:
    SerialPortSource() = default;

    QList<ComPort> fetchPorts() override;
    QString getPlatformName() const override;

    static ComPort fromPortInfo(const QSerialPortInfo& info);
};

#endif // SERIALPORTSOURCE_H
