#ifndef STORAGEVOLUMES_H
#define STORAGEVOLUMES_H

#include <QList>
#include <QString>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(log_speed_volumes)

struct StorageVolume {
    QString rootPath;
    QString displayName;
};

/**
 * Finds mounted volumes that look like removable USB storage and can take a probe file.
 *
 * Linux: block devices /dev/sd* or /dev/usb* mounted below /media, /run/media or /mnt.
 * macOS: anything mounted below /Volumes. Windows: every drive except the system drive.
 */
class StorageVolumes
{
public:
    static QList<StorageVolume> testableVolumes();

    static bool isUsbStorageCandidate(const QString& platform, const QString& device,
                                      const QString& rootPath, const QString& systemRoot);

private:
    StorageVolumes() = delete;
};

#endif // STORAGEVOLUMES_H
