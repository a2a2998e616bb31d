#include "diskinventory.h"
#include "commandrunner.h"
#include "coreerror.h"
#include "logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

// lsblk prints sizes as numbers with newer util-linux and as strings before
// that. Anything unreadable counts as zero.
static quint64 sizeFromJson(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double d = value.toDouble();
        return d > 0 ? static_cast<quint64>(d) : 0;
    }
    bool ok = false;
    const quint64 size = value.toString().trimmed().toULongLong(&ok);
    return ok ? size : 0;
}

static bool flagFromJson(const QJsonValue &value)
{
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toInt() != 0;
    const QString s = value.toString().trimmed();
    return s == QLatin1String("1") || s.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

static QStringList mountpointsFromJson(const QJsonObject &obj)
{
    QStringList out;
    const QJsonValue list = obj.value(QStringLiteral("mountpoints"));
    if (list.isArray()) {
        for (const QJsonValue &mp : list.toArray()) {
            const QString path = mp.toString();   // null entries become empty
            if (!path.isEmpty())
                out << path;
        }
    } else {
        // util-linux < 2.37 only has the single MOUNTPOINT column
        const QString path = obj.value(QStringLiteral("mountpoint")).toString();
        if (!path.isEmpty())
            out << path;
    }
    return out;
}

static BlockDeviceNode nodeFromJson(const QJsonObject &obj)
{
    BlockDeviceNode node;
    node.name = obj.value(QStringLiteral("name")).toString();
    node.model = obj.value(QStringLiteral("model")).toString().trimmed();
    node.sizeBytes = sizeFromJson(obj.value(QStringLiteral("size")));
    node.removable = flagFromJson(obj.value(QStringLiteral("rm")));
    node.type = obj.value(QStringLiteral("type")).toString();
    node.label = obj.value(QStringLiteral("label")).toString();
    node.fstype = obj.value(QStringLiteral("fstype")).toString();
    node.parentName = obj.value(QStringLiteral("pkname")).toString();
    node.mountpoints = mountpointsFromJson(obj);

    const QJsonArray children = obj.value(QStringLiteral("children")).toArray();
    for (const QJsonValue &child : children) {
        if (child.isObject())
            node.children.append(nodeFromJson(child.toObject()));
    }
    return node;
}

static QString kernelName(const QString &devPath)
{
    return devPath.startsWith(QLatin1String("/dev/")) ? devPath.mid(5) : devPath;
}

static void collectPartitions(const BlockDeviceNode &node, const QString &parent,
                              QList<PartitionInfo> *out)
{
    if (node.type == QLatin1String("part") && node.parentName == parent) {
        PartitionInfo part;
        part.id = QStringLiteral("/dev/") + node.name;
        part.label = node.label;
        part.fstype = node.fstype;
        part.mountpoints = node.collectMountpoints();
        out->append(part);
    }
    for (const BlockDeviceNode &child : node.children)
        collectPartitions(child, parent, out);
}

QStringList BlockDeviceNode::collectMountpoints() const
{
    QStringList out = mountpoints;
    for (const BlockDeviceNode &child : children)
        out << child.collectMountpoints();
    return out;
}

DiskInventory::DiskInventory(CommandRunner &runner) : m_runner(runner) {}

QStringList DiskInventory::lsblkArguments()
{
    return {"-b", "-J", "-o", "NAME,MODEL,SIZE,RM,TYPE,MOUNTPOINTS,LABEL,FSTYPE,PKNAME"};
}

bool DiskInventory::isSystemMountpoint(const QString &mountpoint)
{
    return mountpoint == QLatin1String("/")
        || mountpoint == QLatin1String("/boot")
        || mountpoint == QLatin1String("/boot/efi");
}

bool DiskInventory::parseTree(const QByteArray &json, QList<BlockDeviceNode> *roots, CoreError *error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return setCoreError(error, CoreError::Parse, parseError.errorString());
    if (!doc.isObject())
        return setCoreError(error, CoreError::Parse, QStringLiteral("lsblk output is not a JSON object"));

    const QJsonValue devices = doc.object().value(QStringLiteral("blockdevices"));
    if (!devices.isArray())
        return setCoreError(error, CoreError::Parse, QStringLiteral("lsblk output has no blockdevices array"));

    roots->clear();
    for (const QJsonValue &val : devices.toArray()) {
        if (val.isObject())
            roots->append(nodeFromJson(val.toObject()));
    }
    return true;
}

QList<DiskInfo> DiskInventory::disksFromTree(const QList<BlockDeviceNode> &roots)
{
    QList<DiskInfo> disks;
    for (const BlockDeviceNode &dev : roots) {
        if (dev.type != QLatin1String("disk"))
            continue;

        DiskInfo disk;
        disk.id = QStringLiteral("/dev/") + dev.name;
        disk.model = dev.model.isEmpty() ? QStringLiteral("Unknown") : dev.model;
        disk.sizeBytes = dev.sizeBytes;
        disk.removable = dev.removable;
        disk.mountpoints = dev.collectMountpoints();
        for (const QString &mp : std::as_const(disk.mountpoints)) {
            if (isSystemMountpoint(mp)) {
                disk.isSystem = true;
                break;
            }
        }
        disks.append(disk);
    }
    return disks;
}

QList<PartitionInfo> DiskInventory::partitionsFromTree(const QList<BlockDeviceNode> &roots,
                                                       const QString &diskId)
{
    const QString parent = kernelName(diskId);
    QList<PartitionInfo> parts;
    for (const BlockDeviceNode &dev : roots)
        collectPartitions(dev, parent, &parts);
    return parts;
}

bool DiskInventory::queryTree(QList<BlockDeviceNode> *roots, CoreError *error) const
{
#if defined(Q_OS_LINUX)
    QByteArray out;
    CoreError queryError;
    if (!m_runner.capture(QStringLiteral("lsblk"), lsblkArguments(), &out, &queryError)) {
        qCWarning(lcInventory) << "lsblk failed:" << queryError.detail();
        return setCoreError(error, queryError);
    }
    return parseTree(out, roots, error);
#elif defined(Q_OS_MACOS)
    Q_UNUSED(roots)
    return setCoreError(error, CoreError::NotImplemented, QStringLiteral("macOS disk discovery not implemented yet"));
#elif defined(Q_OS_WIN)
    Q_UNUSED(roots)
    return setCoreError(error, CoreError::NotImplemented, QStringLiteral("Windows disk discovery not implemented yet"));
#else
    Q_UNUSED(roots)
    return setCoreError(error, CoreError::UnsupportedPlatform, QString());
#endif
}

bool DiskInventory::listDisks(QList<DiskInfo> *disks, CoreError *error) const
{
    QList<BlockDeviceNode> roots;
    if (!queryTree(&roots, error))
        return false;
    *disks = disksFromTree(roots);
    qCDebug(lcInventory) << "found" << disks->size() << "disks";
    return true;
}

bool DiskInventory::listPartitions(const QString &diskId, QList<PartitionInfo> *partitions,
                                   CoreError *error) const
{
    QList<BlockDeviceNode> roots;
    if (!queryTree(&roots, error))
        return false;
    *partitions = partitionsFromTree(roots, diskId);
    return true;
}
