#include "StorageVolumes.h"
#include "../device/platform/DeviceSourceFactory.h"

#include <QDir>
#include <QStorageInfo>

Q_LOGGING_CATEGORY(log_speed_volumes, "usbmon.speed.volumes")

QList<StorageVolume> StorageVolumes::testableVolumes()
{
    QList<StorageVolume> volumes;
    const QString platform = DeviceSourceFactory::getCurrentPlatform();
    const QString systemRoot = QStorageInfo::root().rootPath();

    const QList<QStorageInfo> mounted = QStorageInfo::mountedVolumes();
    for (const QStorageInfo& storage : mounted) {
        if (!storage.isValid() || !storage.isReady() || storage.isReadOnly()) {
            continue;
        }

        const QString device = QString::fromLocal8Bit(storage.device());
        if (!isUsbStorageCandidate(platform, device, storage.rootPath(), systemRoot)) {
            continue;
        }

        StorageVolume volume;
        volume.rootPath = storage.rootPath();
        volume.displayName = storage.displayName();
        if (volume.displayName.isEmpty() || volume.displayName == volume.rootPath) {
            volume.displayName = QDir(volume.rootPath).dirName();
        }
        if (platform == "Windows") {
            volume.displayName = QString("USB Drive (%1)").arg(QDir::toNativeSeparators(volume.rootPath));
        }

        qCDebug(log_speed_volumes) << "Testable volume" << volume.rootPath << "on" << device;
        volumes.append(volume);
    }

    qCDebug(log_speed_volumes) << "Found" << volumes.size() << "testable volumes";
    return volumes;
}

bool StorageVolumes::isUsbStorageCandidate(const QString& platform, const QString& device,
                                           const QString& rootPath, const QString& systemRoot)
{
    if (platform == "Linux") {
        bool usbBlockDevice = device.startsWith("/dev/sd") || device.startsWith("/dev/usb");
        bool removableMount = rootPath.startsWith("/media/") ||
                              rootPath.startsWith("/run/media/") ||
                              rootPath.startsWith("/mnt/");
        return usbBlockDevice && removableMount;
    }

    if (platform == "macOS") {
        if (!rootPath.startsWith("/Volumes/")) {
            return false;
        }
        return !QDir(rootPath).dirName().startsWith('.');
    }

    if (platform == "Windows") {
        return rootPath.compare(systemRoot, Qt::CaseInsensitive) != 0;
    }

    return false;
}
