#ifndef DISKINVENTORY_H
#define DISKINVENTORY_H

#include <QByteArray>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

class CommandRunner;
class CoreError;

struct DiskInfo {
    QString id;          // /dev/sdb
    QString model;
    quint64 sizeBytes = 0;
    bool removable = false;
    QStringList mountpoints;
    bool isSystem = false;
};

struct PartitionInfo {
    QString id;          // /dev/sdb1
    QString label;
    QString fstype;
    QStringList mountpoints;
};

// One lsblk record with its children, as reported.
struct BlockDeviceNode {
    QString name;
    QString model;
    quint64 sizeBytes = 0;
    bool removable = false;
    QString type;
    QString label;
    QString fstype;
    QString parentName;
    QStringList mountpoints;
    QList<BlockDeviceNode> children;

    // Own mountpoints followed by those of every descendant.
    QStringList collectMountpoints() const;
};

class DiskInventory {
public:
    explicit DiskInventory(CommandRunner &runner);

    bool listDisks(QList<DiskInfo> *disks, CoreError *error) const;
    bool listPartitions(const QString &diskId, QList<PartitionInfo> *partitions, CoreError *error) const;

    static bool parseTree(const QByteArray &json, QList<BlockDeviceNode> *roots, CoreError *error);
    static QList<DiskInfo> disksFromTree(const QList<BlockDeviceNode> &roots);
    static QList<PartitionInfo> partitionsFromTree(const QList<BlockDeviceNode> &roots, const QString &diskId);

    static bool isSystemMountpoint(const QString &mountpoint);
    static QStringList lsblkArguments();

private:
    bool queryTree(QList<BlockDeviceNode> *roots, CoreError *error) const;

    CommandRunner &m_runner;
};

Q_DECLARE_METATYPE(DiskInfo)
Q_DECLARE_METATYPE(PartitionInfo)

#endif // DISKINVENTORY_H
