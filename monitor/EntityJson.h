#ifndef ENTITYJSON_H
#define ENTITYJSON_H

#include <QDateTime>
#include <QJsonArray>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QString>
#include <optional>

Q_DECLARE_LOGGING_CATEGORY(log_monitor_json)

/**
 * Helpers shared by the device and port export/import paths.
 *
 * Exports are a JSON array of flat records. Timestamps are ISO-8601 strings,
 * or null when unset. Unparsable timestamps read back as a null QDateTime.
 */
class EntityJson
{
public:
    static bool writeArray(const QString& filePath, const QJsonArray& records);
    static std::optional<QJsonArray> readArray(const QString& filePath);

    static QJsonValue fromDateTime(const QDateTime& dateTime);
    static QDateTime toDateTime(const QJsonValue& value);

private:
    EntityJson() = delete;
};

#endif // ENTITYJSON_H
