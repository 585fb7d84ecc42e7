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

#include "MonitorSettings.h"

Q_LOGGING_CATEGORY(log_core_settings, "usbmon.core.settings")

MonitorSettings::MonitorSettings(QObject *parent)
    : QObject(parent),
      m_settings("UsbMonitor", "USB-Monitor")
{
}

MonitorSettings::MonitorSettings(const QString &filePath, QObject *parent)
    : QObject(parent),
      m_settings(filePath, QSettings::IniFormat)
{
}

int MonitorSettings::boundedInt(const QString &key, int defaultValue, int minValue, int maxValue) const
{
    if (!m_settings.contains(key)) {
        return defaultValue;
    }

    bool ok = false;
    int value = m_settings.value(key).toInt(&ok);
    if (!ok || value < minValue || value > maxValue) {
        qCWarning(log_core_settings) << "Invalid value for" << key << ":" << m_settings.value(key)
                                     << "- using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

int MonitorSettings::deviceIntervalMs() const
{
    return boundedInt("monitor/deviceIntervalMs", DEFAULT_DEVICE_INTERVAL_MS, MIN_INTERVAL_MS, MAX_INTERVAL_MS);
}

void MonitorSettings::setDeviceIntervalMs(int intervalMs)
{
    m_settings.setValue("monitor/deviceIntervalMs", intervalMs);
}

int MonitorSettings::portIntervalMs() const
{
    return boundedInt("monitor/portIntervalMs", DEFAULT_PORT_INTERVAL_MS, MIN_INTERVAL_MS, MAX_INTERVAL_MS);
}

void MonitorSettings::setPortIntervalMs(int intervalMs)
{
    m_settings.setValue("monitor/portIntervalMs", intervalMs);
}

int MonitorSettings::defaultBaudRate() const
{
    int baudRate = boundedInt("serial/defaultBaudRate", DEFAULT_BAUD_RATE, 1, 4000000);
    if (!standardBaudRates().contains(baudRate)) {
        qCWarning(log_core_settings) << "Unsupported baud rate" << baudRate << "- using default" << DEFAULT_BAUD_RATE;
        return DEFAULT_BAUD_RATE;
    }
    return baudRate;
}

void MonitorSettings::setDefaultBaudRate(int baudRate)
{
    m_settings.setValue("serial/defaultBaudRate", baudRate);
}

int MonitorSettings::defaultDataBits() const
{
    return boundedInt("serial/defaultDataBits", DEFAULT_DATA_BITS, 5, 8);
}

void MonitorSettings::setDefaultDataBits(int dataBits)
{
    m_settings.setValue("serial/defaultDataBits", dataBits);
}

double MonitorSettings::defaultStopBits() const
{
    if (!m_settings.contains("serial/defaultStopBits")) {
        return DEFAULT_STOP_BITS;
    }

    bool ok = false;
    double stopBits = m_settings.value("serial/defaultStopBits").toDouble(&ok);
    if (!ok || !supportedStopBits().contains(stopBits)) {
        qCWarning(log_core_settings) << "Invalid stop bits" << m_settings.value("serial/defaultStopBits")
                                     << "- using default" << DEFAULT_STOP_BITS;
        return DEFAULT_STOP_BITS;
    }
    return stopBits;
}

void MonitorSettings::setDefaultStopBits(double stopBits)
{
    m_settings.setValue("serial/defaultStopBits", stopBits);
}

QString MonitorSettings::defaultParity() const
{
    QString parity = m_settings.value("serial/defaultParity", "N").toString().toUpper();
    if (!parityOptions().contains(parity)) {
        qCWarning(log_core_settings) << "Invalid parity" << parity << "- using default N";
        return "N";
    }
    return parity;
}

void MonitorSettings::setDefaultParity(const QString &parity)
{
    m_settings.setValue("serial/defaultParity", parity);
}

QString MonitorSettings::defaultFlowControl() const
{
    QString flowControl = m_settings.value("serial/defaultFlowControl", "None").toString();
    if (!flowControlOptions().contains(flowControl)) {
        qCWarning(log_core_settings) << "Invalid flow control" << flowControl << "- using default None";
        return "None";
    }
    return flowControl;
}

void MonitorSettings::setDefaultFlowControl(const QString &flowControl)
{
    m_settings.setValue("serial/defaultFlowControl", flowControl);
}

bool MonitorSettings::showDisconnected() const
{
    return m_settings.value("display/showDisconnected", true).toBool();
}

void MonitorSettings::setShowDisconnected(bool show)
{
    m_settings.setValue("display/showDisconnected", show);
}

bool MonitorSettings::showHubs() const
{
    return m_settings.value("display/showHubs", true).toBool();
}

void MonitorSettings::setShowHubs(bool show)
{
    m_settings.setValue("display/showHubs", show);
}

double MonitorSettings::defaultSpeedTestSizeMb() const
{
    if (!m_settings.contains("speed/defaultSizeMb")) {
        return DEFAULT_SPEED_TEST_SIZE_MB;
    }

    bool ok = false;
    double sizeMb = m_settings.value("speed/defaultSizeMb").toDouble(&ok);
    if (!ok || sizeMb < 1.0 || sizeMb > 10240.0) {
        qCWarning(log_core_settings) << "Invalid speed test size" << m_settings.value("speed/defaultSizeMb")
                                     << "- using default" << DEFAULT_SPEED_TEST_SIZE_MB;
        return DEFAULT_SPEED_TEST_SIZE_MB;
    }
    return sizeMb;
}

void MonitorSettings::setDefaultSpeedTestSizeMb(double sizeMb)
{
    m_settings.setValue("speed/defaultSizeMb", sizeMb);
}

void MonitorSettings::setLogSettings(bool core, bool device, bool serial, bool monitor, bool speed)
{
    m_settings.setValue("log/core", core);
    m_settings.setValue("log/device", device);
    m_settings.setValue("log/serial", serial);
    m_settings.setValue("log/monitor", monitor);
    m_settings.setValue("log/speed", speed);
}

QString MonitorSettings::logFilterRules() const
{
    QString logFilter = "";
    logFilter += m_settings.value("log/core", false).toBool() ? "usbmon.core.*.debug=true\n" : "usbmon.core.*.debug=false\n";
    logFilter += m_settings.value("log/device", false).toBool() ? "usbmon.device.*.debug=true\n" : "usbmon.device.*.debug=false\n";
    logFilter += m_settings.value("log/serial", false).toBool() ? "usbmon.serial.*.debug=true\n" : "usbmon.serial.*.debug=false\n";
    logFilter += m_settings.value("log/monitor", false).toBool() ? "usbmon.monitor.*.debug=true\n" : "usbmon.monitor.*.debug=false\n";
    logFilter += m_settings.value("log/speed", false).toBool() ? "usbmon.speed.*.debug=true\n" : "usbmon.speed.*.debug=false\n";
    return logFilter;
}

void MonitorSettings::setLogStoreSettings(bool storeLog, const QString &logFilePath)
{
    m_settings.setValue("log/storeLog", storeLog);
    m_settings.setValue("log/logFilePath", logFilePath);
}

bool MonitorSettings::storeLog() const
{
    return m_settings.value("log/storeLog", false).toBool();
}

QString MonitorSettings::logFilePath() const
{
    return m_settings.value("log/logFilePath").toString();
}

void MonitorSettings::resetToDefaults()
{
    m_settings.clear();
    qCInfo(log_core_settings) << "Settings reset to defaults";
}

void MonitorSettings::sync()
{
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        qCWarning(log_core_settings) << "Failed to write settings to" << m_settings.fileName();
    }
}

QString MonitorSettings::fileName() const
{
    return m_settings.fileName();
}

QList<int> MonitorSettings::standardBaudRates()
{
    return {110, 300, 600, 1200, 2400, 4800, 9600, 14400, 19200, 38400, 57600, 115200, 230400, 460800, 921600};
}

QList<int> MonitorSettings::supportedDataBits()
{
    return {5, 6, 7, 8};
}

QList<double> MonitorSettings::supportedStopBits()
{
    return {1.0, 1.5, 2.0};
}

QStringList MonitorSettings::parityOptions()
{
    return {"N", "E", "O"};
}

QStringList MonitorSettings::flowControlOptions()
{
    return {"None", "XON/XOFF", "RTS/CTS"};
}
