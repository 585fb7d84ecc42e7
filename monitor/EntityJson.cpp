#include "EntityJson.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

Q_LOGGING_CATEGORY(log_monitor_json, "usbmon.monitor.json")

bool EntityJson::writeArray(const QString& filePath, const QJsonArray& records)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(log_monitor_json) << "Cannot open" << filePath << "for writing:" << file.errorString();
        return false;
    }

    QByteArray data = QJsonDocument(records).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qCWarning(log_monitor_json) << "Failed to write" << filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qCWarning(log_monitor_json) << "Failed to commit" << filePath << ":" << file.errorString();
        return false;
    }

    qCDebug(log_monitor_json) << "Wrote" << records.size() << "records to" << filePath;
    return true;
}

std::optional<QJsonArray> EntityJson::readArray(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(log_monitor_json) << "Cannot open" << filePath << "for reading:" << file.errorString();
        return std::nullopt;
    }

    QJsonParseError parseError;
    QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(log_monitor_json) << "Invalid JSON in" << filePath << ":" << parseError.errorString()
                                    << "at offset" << parseError.offset;
        return std::nullopt;
    }
    if (!document.isArray()) {
        qCWarning(log_monitor_json) << filePath << "does not contain a JSON array";
        return std::nullopt;
    }

    return document.array();
}

QJsonValue EntityJson::fromDateTime(const QDateTime& dateTime)
{
    if (!dateTime.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return dateTime.toString(Qt::ISODateWithMs);
}

QDateTime EntityJson::toDateTime(const QJsonValue& value)
{
    if (!value.isString()) {
        return QDateTime();
    }

    QString text = value.toString();
    QDateTime dateTime = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dateTime.isValid()) {
        dateTime = QDateTime::fromString(text, Qt::ISODate);
    }
    if (!dateTime.isValid()) {
        qCDebug(log_monitor_json) << "Unparsable timestamp" << text << "- using null";
        return QDateTime();
    }
    return dateTime;
}
