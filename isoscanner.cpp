#include "isoscanner.h"
#include "bootconfig.h"
#include "logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

static void appendIfIso(const QFileInfo &file, QList<IsoEntry> *out)
{
    if (file.suffix().compare(QLatin1String("iso"), Qt::CaseInsensitive) != 0)
        return;

    IsoEntry e;
    e.title = file.completeBaseName();
    if (e.title.isEmpty())
        e.title = QStringLiteral("ISO");
    e.path = file.absoluteFilePath();
    e.sizeBytes = static_cast<quint64>(file.size());
    e.params = IsoScanner::defaultParams();
    out->append(e);
}

QList<IsoEntry> IsoScanner::scan(const QStringList &dirs)
{
    QList<IsoEntry> results;
    for (const QString &dir : dirs) {
        const QDir root(dir);
        if (!root.exists())
            continue;

        const QFileInfoList entries = root.entryInfoList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot);
        for (const QFileInfo &entry : entries) {
            if (entry.isFile()) {
                appendIfIso(entry, &results);
            } else if (entry.isDir()) {
                const QFileInfoList subs = QDir(entry.absoluteFilePath()).entryInfoList(QDir::Files);
                for (const QFileInfo &sub : subs)
                    appendIfIso(sub, &results);
            }
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const IsoEntry &a, const IsoEntry &b) {
        return a.title.compare(b.title, Qt::CaseInsensitive) < 0;
    });
    qCDebug(lcBootConfig) << "found" << results.size() << "ISO images in" << dirs;
    return results;
}

BootEntry IsoScanner::toBootEntry(const IsoEntry &iso)
{
    BootEntry entry;
    entry.title = iso.title;
    entry.path = QStringLiteral("/boot/isos/") + QFileInfo(iso.path).fileName();
    entry.params = iso.params;
    return entry;
}
