#ifndef PAYLOAD_H
#define PAYLOAD_H

#include <QString>

class CoreError;

// Pre-built payload tree: esp/ goes onto the EFI partition, data/ onto the
// data partition.
class PayloadSource {
public:
    static const char *environmentVariable() { return "RAIDHOS_PAYLOAD_DIR"; }

    // Reads the directory from RAIDHOS_PAYLOAD_DIR.
    static bool resolve(PayloadSource *source, CoreError *error);
    static bool fromDirectory(const QString &dir, PayloadSource *source, CoreError *error);

    // "version" from payload/manifest.json, searched upwards from baseDir.
    static QString manifestVersion(const QString &baseDir);

    QString root() const { return m_root; }
    QString espDir() const;
    QString dataDir() const;

private:
    QString m_root;
};

#endif // PAYLOAD_H
