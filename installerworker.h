#ifndef INSTALLERWORKER_H
#define INSTALLERWORKER_H

#include "progress.h"

#include <QObject>
#include <QString>

class CommandRunner;
class CoreError;
class DiskInventory;
class PayloadSource;

struct InstallRequest {
    QString device;          // whole disk, e.g. /dev/sdb
    QString payloadVersion;
    bool wipe = false;       // caller acknowledges the disk will be erased
    bool dryRun = true;
    bool allowWrite = false; // second key, required for a real write
};

// Repartitions a removable disk into an ESP plus an exFAT data volume and
// copies the boot payload onto them. Every step is reported through
// progress() before it runs; the first failure ends the install.
class InstallerWorker : public QObject {
    Q_OBJECT
public:
    static constexpr const char *EspLabel = "RAIDHOS_ESP";
    static constexpr const char *DataLabel = "RAIDHOS";

    InstallerWorker(DiskInventory &inventory, CommandRunner &runner, QObject *parent = nullptr);

    void setRequest(const InstallRequest &request);
    bool install(const InstallRequest &request, CoreError *error = nullptr);

    // /dev/sdb + 1 -> /dev/sdb1 ; /dev/nvme0n1 + 1 -> /dev/nvme0n1p1
    static QString partitionPath(const QString &device, int index);

signals:
    void progress(const ProgressEvent &event);
    void errorOccurred(const QString &message);
    void installComplete();

public slots:
    void run();

private:
    void report(Phase phase, const QString &message, int percent);
    bool runInstall(const InstallRequest &request, CoreError *error);
    bool validate(const InstallRequest &request, CoreError *error);
    bool createPartitions(const QString &devPath, CoreError *error);
    bool formatPartitions(const QString &espPart, const QString &dataPart, CoreError *error);
    bool formatDataPartition(const QString &dataPart, CoreError *error);
    bool copyPayload(const PayloadSource &payload, const QString &espPart,
                     const QString &dataPart, CoreError *error);

    DiskInventory &m_inventory;
    CommandRunner &m_runner;
    InstallRequest m_request;
    PhaseTracker m_phases;
};

#endif // INSTALLERWORKER_H
