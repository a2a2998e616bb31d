#include "payload.h"
#include "coreerror.h"
#include "logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

bool PayloadSource::resolve(PayloadSource *source, CoreError *error)
{
    const QString dir = qEnvironmentVariable(environmentVariable()).trimmed();
    if (dir.isEmpty()) {
        return setCoreError(error, CoreError::Validation,
                            QStringLiteral("payload location not configured (%1 is not set)")
                                .arg(QLatin1String(environmentVariable())));
    }
    return fromDirectory(dir, source, error);
}

bool PayloadSource::fromDirectory(const QString &dir, PayloadSource *source, CoreError *error)
{
    const QFileInfo info(dir);
    if (!info.isDir())
        return setCoreError(error, CoreError::Validation, QStringLiteral("payload directory not found: %1").arg(dir));

    const QDir root(info.absoluteFilePath());
    for (const char *sub : {"esp", "data"}) {
        if (!QFileInfo(root.filePath(QLatin1String(sub))).isDir()) {
            return setCoreError(error, CoreError::Validation,
                                QStringLiteral("payload directory %1 has no %2/ subtree")
                                    .arg(root.path(), QLatin1String(sub)));
        }
    }

    source->m_root = root.path();
    return true;
}

QString PayloadSource::espDir() const
{
    return QDir(m_root).filePath(QStringLiteral("esp"));
}

QString PayloadSource::dataDir() const
{
    return QDir(m_root).filePath(QStringLiteral("data"));
}

QString PayloadSource::manifestVersion(const QString &baseDir)
{
    const QDir base(baseDir);
    const QStringList candidates{
        QStringLiteral("payload/manifest.json"),
        QStringLiteral("../payload/manifest.json"),
        QStringLiteral("../../payload/manifest.json"),
    };

    for (const QString &rel : candidates) {
        QFile f(base.filePath(rel));
        if (!f.open(QIODevice::ReadOnly))
            continue;
        const QJsonDocument doc = QJsonDocument::fromJson(f.readAll());
        const QJsonValue version = doc.object().value(QStringLiteral("version"));
        if (version.isString()) {
            qCDebug(lcInstall) << "payload manifest" << f.fileName() << "version" << version.toString();
            return version.toString();
        }
    }
    return QStringLiteral("unknown");
}
