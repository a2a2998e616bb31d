#ifndef BOOTCONFIG_H
#define BOOTCONFIG_H

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

class CoreError;

struct BootEntry {
    QString title;
    QString path;     // ISO path on the data volume, e.g. /boot/isos/debian.iso
    QString params;   // kernel parameters
    QString initrd;   // initrd override, empty for the layout's default
    QString kargs;    // extra kernel arguments
};

struct BootConfig {
    QString defaultEntry;   // empty when no default is set
    QList<BootEntry> entries;

    bool hasDefaultEntry() const { return !defaultEntry.isEmpty(); }

    QJsonObject toJson() const;
    static BootConfig fromJson(const QJsonObject &obj);

    static bool parse(const QByteArray &json, BootConfig *config, CoreError *error);

    static bool load(const QString &path, BootConfig *config, CoreError *error);
    static bool save(const QString &path, const BootConfig &config, CoreError *error);

    // ~/.config/raidhos/boot.json
    static QString userConfigPath();
    static bool saveUserConfig(const BootConfig &config, CoreError *error);
    // <mountPath>/raidhos/boot.json
    static bool writeToDevice(const QString &mountPath, const BootConfig &config, CoreError *error);
};

#endif // BOOTCONFIG_H
