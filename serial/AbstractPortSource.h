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

#ifndef ABSTRACTPORTSOURCE_H
#define ABSTRACTPORTSOURCE_H

#include <QList>
#include <QString>
#include "ComPort.h"
#include "../monitor/SourceUnavailableError.h"

// Enumerates the serial ports the OS currently exposes.
class AbstractPortSource
{
public:
    virtual ~AbstractPortSource() = default;

    virtual QList<ComPort> fetchPorts() = 0;
    virtual QString getPlatformName() const = 0;
};

#endif // ABSTRACTPORTSOURCE_H
