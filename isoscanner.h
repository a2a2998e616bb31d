#ifndef ISOSCANNER_H
#define ISOSCANNER_H

#include <QList>
#include <QString>
#include <QStringList>

struct BootEntry;

struct IsoEntry {
    QString title;        // file name without extension
    QString path;         // absolute path on the scanning host
    quint64 sizeBytes = 0;
    QString params;
};

class IsoScanner {
public:
    // Finds *.iso directly inside each directory and one level below it.
    // Directories that do not exist are skipped.
    static QList<IsoEntry> scan(const QStringList &dirs);

    // Menu entry for an ISO copied to /boot/isos on the data volume.
    static BootEntry toBootEntry(const IsoEntry &iso);

    static QString defaultParams() { return QStringLiteral("quiet splash"); }
};

#endif // ISOSCANNER_H
