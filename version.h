#ifndef VERSION_H
#define VERSION_H

#include <QString>
#include <QFile>
#include <QTextStream>
#include <QCoreApplication>
#include <QDir>
#include <QDebug>

#ifndef USBMON_VERSION
#define USBMON_VERSION "0.0.0"
#endif

// A version.txt beside the executable overrides the version baked in at build time
inline QString getAppVersion() {
    QString version = USBMON_VERSION;
    QString path = QCoreApplication::instance()
                       ? QDir(QCoreApplication::applicationDirPath()).filePath("version.txt")
                       : QString("version.txt");
    QFile file(path);
    if (file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QTextStream in(&file);
        QString line = in.readLine().trimmed();
        if (!line.isEmpty()) {
            version = line;
        }
        file.close();
    }
    return version;
}

#define APP_VERSION getAppVersion()

#endif // VERSION_H
