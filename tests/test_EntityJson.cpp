#include <gtest/gtest.h>

#include "monitor/EntityJson.h"
#include "device/DeviceMonitor.h"
#include "mocks/MockSources.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

TEST(EntityJsonTest, InvalidDateTimeBecomesNull)
{
    EXPECT_TRUE(EntityJson::fromDateTime(QDateTime()).isNull());

    QDateTime now = QDateTime::currentDateTime();
    QJsonValue value = EntityJson::fromDateTime(now);
    ASSERT_TRUE(value.isString());
    EXPECT_EQ(EntityJson::toDateTime(value), now);
}

TEST(EntityJsonTest, UnparsableTimestampsReadAsNull)
{
    EXPECT_FALSE(EntityJson::toDateTime(QJsonValue("yesterday")).isValid());
    EXPECT_FALSE(EntityJson::toDateTime(QJsonValue(QJsonValue::Null)).isValid());
    EXPECT_FALSE(EntityJson::toDateTime(QJsonValue(42)).isValid());
    EXPECT_TRUE(EntityJson::toDateTime(QJsonValue("2024-05-01T10:15:30")).isValid());
}

TEST(EntityJsonTest, WriteFailsForMissingDirectory)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    EXPECT_FALSE(EntityJson::writeArray(dir.filePath("missing/devices.json"), QJsonArray()));
}

TEST(EntityJsonTest, ReadRejectsMissingOrMalformedFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    EXPECT_FALSE(EntityJson::readArray(dir.filePath("absent.json")).has_value());

    QFile broken(dir.filePath("broken.json"));
    ASSERT_TRUE(broken.open(QIODevice::WriteOnly));
    broken.write("[{\"name\": ");
    broken.close();
    EXPECT_FALSE(EntityJson::readArray(broken.fileName()).has_value());

    QFile object(dir.filePath("object.json"));
    ASSERT_TRUE(object.open(QIODevice::WriteOnly));
    object.write("{\"name\": \"Mouse\"}");
    object.close();
    EXPECT_FALSE(EntityJson::readArray(object.fileName()).has_value());
}

TEST(EntityJsonTest, DeviceExportReimportsEquivalentRecords)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    DeviceMonitor monitor(std::make_unique<MockDeviceSource>());
    UsbDevice mouse = makeDevice("046D:C077:0", "Mouse");
    mouse.manufacturer = "Logitech";
    mouse.vendorId = "046D";
    mouse.productId = "C077";
    mouse.transferSpeed = "1.5 Mb/s";
    monitor.reconcile({mouse, makeDevice("B", "Keyboard")});
    monitor.reconcile({mouse});

    QString path = dir.filePath("devices.json");
    ASSERT_TRUE(monitor.exportDevices(path));

    std::optional<QList<UsbDevice>> imported = DeviceMonitor::importDevices(path);
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(*imported, monitor.allDevices());
}

TEST(EntityJsonTest, DeviceImportToleratesBadTimestamps)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QJsonObject record = makeDevice("A", "Keyboard").toJson();
    record["first_seen"] = "not a date";
    record["last_seen"] = QJsonValue(QJsonValue::Null);
    QJsonArray records;
    records.append(record);
    records.append("not an object");
    ASSERT_TRUE(EntityJson::writeArray(dir.filePath("devices.json"), records));

    std::optional<QList<UsbDevice>> imported = DeviceMonitor::importDevices(dir.filePath("devices.json"));
    ASSERT_TRUE(imported.has_value());
    ASSERT_EQ(imported->size(), 1);
    EXPECT_EQ(imported->first().name, "Keyboard");
    EXPECT_FALSE(imported->first().firstSeen.isValid());
    EXPECT_FALSE(imported->first().lastSeen.isValid());
}

TEST(EntityJsonTest, ExportUsesSnakeCaseFields)
{
    QJsonObject json = makeDevice("A", "Keyboard").toJson();

    EXPECT_EQ(json.value("device_id").toString(), "A");
    EXPECT_TRUE(json.contains("max_transfer_speed"));
    EXPECT_TRUE(json.value("is_connected").toBool());
    EXPECT_TRUE(json.value("first_seen").isNull());
}
