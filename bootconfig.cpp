#include "bootconfig.h"
#include "coreerror.h"
#include "logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

QJsonObject BootConfig::toJson() const
{
    QJsonArray list;
    for (const BootEntry &e : entries) {
        QJsonObject obj;
        obj.insert(QStringLiteral("title"), e.title);
        obj.insert(QStringLiteral("path"), e.path);
        obj.insert(QStringLiteral("params"), e.params);
        obj.insert(QStringLiteral("initrd"), e.initrd);
        obj.insert(QStringLiteral("kargs"), e.kargs);
        list.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("entries"), list);
    if (hasDefaultEntry())
        root.insert(QStringLiteral("default_entry"), defaultEntry);
    else
        root.insert(QStringLiteral("default_entry"), QJsonValue::Null);
    return root;
}

BootConfig BootConfig::fromJson(const QJsonObject &obj)
{
    BootConfig config;
    config.defaultEntry = obj.value(QStringLiteral("default_entry")).toString();
    const QJsonArray list = obj.value(QStringLiteral("entries")).toArray();
    for (const QJsonValue &val : list) {
        const QJsonObject o = val.toObject();
        BootEntry e;
        e.title = o.value(QStringLiteral("title")).toString();
        e.path = o.value(QStringLiteral("path")).toString();
        e.params = o.value(QStringLiteral("params")).toString();
        e.initrd = o.value(QStringLiteral("initrd")).toString();
        e.kargs = o.value(QStringLiteral("kargs")).toString();
        config.entries.append(e);
    }
    return config;
}

bool BootConfig::parse(const QByteArray &json, BootConfig *config, CoreError *error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return setCoreError(error, CoreError::Parse, parseError.errorString());
    if (!doc.isObject())
        return setCoreError(error, CoreError::Parse, QStringLiteral("boot config is not a JSON object"));

    *config = fromJson(doc.object());
    return true;
}

bool BootConfig::load(const QString &path, BootConfig *config, CoreError *error)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("cannot read %1: %2").arg(path, f.errorString()));
    }
    return parse(f.readAll(), config, error);
}

bool BootConfig::save(const QString &path, const BootConfig &config, CoreError *error)
{
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir))
        return setCoreError(error, CoreError::Io, QStringLiteral("cannot create %1").arg(dir));

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("cannot write %1: %2").arg(path, f.errorString()));
    }
    f.write(QJsonDocument(config.toJson()).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("cannot write %1: %2").arg(path, f.errorString()));
    }
    qCDebug(lcBootConfig) << "saved" << config.entries.size() << "entries to" << path;
    return true;
}

QString BootConfig::userConfigPath()
{
    return QDir::homePath() + QStringLiteral("/.config/raidhos/boot.json");
}

bool BootConfig::saveUserConfig(const BootConfig &config, CoreError *error)
{
    return save(userConfigPath(), config, error);
}

bool BootConfig::writeToDevice(const QString &mountPath, const BootConfig &config, CoreError *error)
{
    if (!QFileInfo(mountPath).isDir())
        return setCoreError(error, CoreError::Validation, QStringLiteral("not a directory: %1").arg(mountPath));
    return save(QDir(mountPath).filePath(QStringLiteral("raidhos/boot.json")), config, error);
}
