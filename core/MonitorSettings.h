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

#ifndef MONITORSETTINGS_H
#define MONITORSETTINGS_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QList>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(log_core_settings)

/**
 * @brief Persistent configuration consumed by the monitors, the prober and the log handler.
 *
 * Created once at startup and handed to the components that read it. Every getter
 * validates the stored value and falls back to the documented default when the value
 * is missing or out of range; invalid values are reported once per read with a warning.
 */
class MonitorSettings : public QObject
{
    Q_OBJECT
public:
    static constexpr int DEFAULT_DEVICE_INTERVAL_MS = 2000;
    static constexpr int DEFAULT_PORT_INTERVAL_MS = 3000;
    static constexpr int MIN_INTERVAL_MS = 500;
    static constexpr int MAX_INTERVAL_MS = 3600000;

    static constexpr int DEFAULT_BAUD_RATE = 9600;
    static constexpr int DEFAULT_DATA_BITS = 8;
    static constexpr double DEFAULT_STOP_BITS = 1.0;
    static constexpr double DEFAULT_SPEED_TEST_SIZE_MB = 100.0;

    // Native settings store for the application
    explicit MonitorSettings(QObject *parent = nullptr);
    // INI file at an explicit location (CLI --settings, tests)
    explicit MonitorSettings(const QString &filePath, QObject *parent = nullptr);

    // Polling intervals
    int deviceIntervalMs() const;
    void setDeviceIntervalMs(int intervalMs);
    int portIntervalMs() const;
    void setPortIntervalMs(int intervalMs);

    // Port-open defaults
    int defaultBaudRate() const;
    void setDefaultBaudRate(int baudRate);
    int defaultDataBits() const;
    void setDefaultDataBits(int dataBits);
    double defaultStopBits() const;
    void setDefaultStopBits(double stopBits);
    QString defaultParity() const;
    void setDefaultParity(const QString &parity);
    QString defaultFlowControl() const;
    void setDefaultFlowControl(const QString &flowControl);

    // Display filters
    bool showDisconnected() const;
    void setShowDisconnected(bool show);
    bool showHubs() const;
    void setShowHubs(bool show);

    // Speed test
    double defaultSpeedTestSizeMb() const;
    void setDefaultSpeedTestSizeMb(double sizeMb);

    // Logging
    void setLogSettings(bool core, bool device, bool serial, bool monitor, bool speed);
    QString logFilterRules() const;
    void setLogStoreSettings(bool storeLog, const QString &logFilePath);
    bool storeLog() const;
    QString logFilePath() const;

    void resetToDefaults();
    void sync();
    QString fileName() const;

    static QList<int> standardBaudRates();
    static QList<int> supportedDataBits();
    static QList<double> supportedStopBits();
    static QStringList parityOptions();
    static QStringList flowControlOptions();

private:
    int boundedInt(const QString &key, int defaultValue, int minValue, int maxValue) const;

    QSettings m_settings;
};

#endif // MONITORSETTINGS_H
