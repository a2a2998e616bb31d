#include "installerworker.h"
#include "commandrunner.h"
#include "coreerror.h"
#include "diskinventory.h"
#include "logging.h"
#include "payload.h"

#include <QDir>
#include <QTemporaryDir>

namespace {

// Process-local mount point for payload staging. Unmounted on release or
// destruction; an unmount failure is logged and otherwise ignored because
// the payload has already been written by then.
class StagingMount {
public:
    StagingMount(CommandRunner &runner, const QString &tag)
        : m_runner(runner), m_dir(QDir::tempPath() + QStringLiteral("/raidhos-%1-XXXXXX").arg(tag))
    {
        // Never let QTemporaryDir delete recursively through a live mount.
        m_dir.setAutoRemove(false);
    }
    ~StagingMount() { release(); }

    QString path() const { return m_dir.path(); }

    bool mount(const QString &device, CoreError *error)
    {
        if (!m_dir.isValid()) {
            return setCoreError(error, CoreError::Io,
                                QStringLiteral("failed to create mount point: %1").arg(m_dir.errorString()));
        }
        if (!m_runner.run(QStringLiteral("mount"), {device, path()}, error))
            return false;
        m_mounted = true;
        return true;
    }

    // Runs once; a second call is a no-op.
    void release()
    {
        if (!m_dir.isValid() || m_released)
            return;
        m_released = true;
        if (m_mounted) {
            CoreError umountError;
            if (!m_runner.run(QStringLiteral("umount"), {path()}, &umountError)) {
                qCWarning(lcInstall) << "ignoring unmount failure for" << path() << umountError.detail();
                return; // still mounted, leave the directory alone
            }
            m_mounted = false;
        }
        QDir().rmdir(path());
    }

private:
    CommandRunner &m_runner;
    QTemporaryDir m_dir;
    bool m_mounted = false;
    bool m_released = false;
};

} // namespace

InstallerWorker::InstallerWorker(DiskInventory &inventory, CommandRunner &runner, QObject *parent)
    : QObject(parent), m_inventory(inventory), m_runner(runner)
{
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
}

void InstallerWorker::setRequest(const InstallRequest &request) { m_request = request; }

QString InstallerWorker::partitionPath(const QString &device, int index)
{
    if (!device.isEmpty() && device.back().isDigit())
        return device + QStringLiteral("p") + QString::number(index);
    return device + QString::number(index);
}

void InstallerWorker::run()
{
    CoreError error;
    if (!install(m_request, &error)) {
        emit errorOccurred(error.toString());
        return;
    }
    emit installComplete();
}

void InstallerWorker::report(Phase phase, const QString &message, int percent)
{
    if (!m_phases.advance(phase)) {
        qCCritical(lcInstall) << "dropping out-of-order phase" << phaseName(phase)
                              << "after" << phaseName(m_phases.current());
        return;
    }
    qCInfo(lcInstall).noquote() << QStringLiteral("[%1] %2 (%3%)").arg(phaseName(phase), message).arg(percent);
    emit progress(ProgressEvent{phase, message, percent});
}

bool InstallerWorker::install(const InstallRequest &request, CoreError *error)
{
#if defined(Q_OS_LINUX)
    m_phases = PhaseTracker();
    CoreError failure;
    if (!runInstall(request, &failure)) {
        qCWarning(lcInstall) << "install on" << request.device << "failed:" << failure.toString();
        return setCoreError(error, failure);
    }
    return true;
#elif defined(Q_OS_MACOS)
    Q_UNUSED(request)
    return setCoreError(error, CoreError::NotImplemented, QStringLiteral("macOS installer not implemented yet"));
#elif defined(Q_OS_WIN)
    Q_UNUSED(request)
    return setCoreError(error, CoreError::NotImplemented, QStringLiteral("Windows installer not implemented yet"));
#else
    Q_UNUSED(request)
    return setCoreError(error, CoreError::UnsupportedPlatform, QString());
#endif
}

bool InstallerWorker::runInstall(const InstallRequest &request, CoreError *error)
{
    if (!validate(request, error))
        return false;

    report(Phase::Prepare, QStringLiteral("Preparing partition layout"), 20);
    report(Phase::Stage, QStringLiteral("Staging payload %1").arg(request.payloadVersion), 45);
    report(Phase::Write, QStringLiteral("Writing boot structures"), 70);
    report(Phase::Finalize, QStringLiteral("Final checks"), 90);

    if (request.dryRun) {
        report(Phase::Complete, QStringLiteral("Dry-run complete. No changes made."), 100);
        return true;
    }

    // wipe alone is not enough to touch the disk
    if (!request.allowWrite)
        return setCoreError(error, CoreError::Validation, QStringLiteral("write blocked: set allowWrite to proceed"));

    PayloadSource payload;
    if (!PayloadSource::resolve(&payload, error))
        return false;

    report(Phase::Partition, QStringLiteral("Creating GPT partitions"), 30);
    if (!createPartitions(request.device, error))
        return false;

    const QString espPart = partitionPath(request.device, 1);
    const QString dataPart = partitionPath(request.device, 2);

    report(Phase::Format, QStringLiteral("Formatting partitions"), 60);
    if (!formatPartitions(espPart, dataPart, error))
        return false;

    if (!copyPayload(payload, espPart, dataPart, error))
        return false;

    report(Phase::Complete, QStringLiteral("Install complete."), 100);
    return true;
}

bool InstallerWorker::validate(const InstallRequest &request, CoreError *error)
{
    if (!request.device.startsWith(QLatin1String("/dev/")))
        return setCoreError(error, CoreError::Validation, QStringLiteral("device must be an absolute /dev path"));

    report(Phase::Validate, QStringLiteral("Validating target %1").arg(request.device), 5);

    if (!request.wipe)
        return setCoreError(error, CoreError::Validation, QStringLiteral("wipe flag must be set for destructive install"));

    // Fresh snapshot: never trust what the caller saw when it built the request.
    QList<DiskInfo> disks;
    if (!m_inventory.listDisks(&disks, error))
        return false;

    const DiskInfo *target = nullptr;
    for (const DiskInfo &disk : std::as_const(disks)) {
        if (disk.id == request.device) {
            target = &disk;
            break;
        }
    }

    if (!target)
        return setCoreError(error, CoreError::Validation, QStringLiteral("device not found: %1").arg(request.device));
    if (target->isSystem)
        return setCoreError(error, CoreError::Validation, QStringLiteral("refusing to operate on system disk"));
    if (!target->mountpoints.isEmpty()) {
        return setCoreError(error, CoreError::Validation,
                            QStringLiteral("device has mounted partitions; unmount first (%1)")
                                .arg(target->mountpoints.join(QStringLiteral(", "))));
    }
    return true;
}

bool InstallerWorker::createPartitions(const QString &devPath, CoreError *error)
{
    const QString parted = QStringLiteral("parted");

    // ESP: 1MiB-33MiB, data: 33MiB-end
    return m_runner.run(parted, {devPath, "-s", "mklabel", "gpt"}, error)
        && m_runner.run(parted, {devPath, "-s", "mkpart", "primary", "fat32", "1MiB", "33MiB"}, error)
        && m_runner.run(parted, {devPath, "-s", "set", "1", "esp", "on"}, error)
        && m_runner.run(parted, {devPath, "-s", "mkpart", "primary", "33MiB", "100%"}, error);
}

bool InstallerWorker::formatPartitions(const QString &espPart, const QString &dataPart, CoreError *error)
{
    if (!m_runner.run(QStringLiteral("mkfs.vfat"), {"-F", "32", "-n", EspLabel, espPart}, error))
        return false;
    return formatDataPartition(dataPart, error);
}

bool InstallerWorker::formatDataPartition(const QString &dataPart, CoreError *error)
{
    // exfatprogs ships mkfs.exfat, the older exfat-utils mkexfatfs
    QString tool;
    for (const char *candidate : {"mkfs.exfat", "mkexfatfs"}) {
        if (m_runner.hasProgram(QLatin1String(candidate))) {
            tool = QLatin1String(candidate);
            break;
        }
    }
    if (tool.isEmpty())
        return setCoreError(error, CoreError::Io, QStringLiteral("exFAT formatter not found (mkfs.exfat or mkexfatfs)"));

    CoreError labeledError;
    if (m_runner.run(tool, {"-n", DataLabel, dataPart}, &labeledError))
        return true;

    qCWarning(lcInstall) << tool << "rejected the labeled format, retrying unlabeled:" << labeledError.detail();
    if (!m_runner.run(tool, {dataPart}, error))
        return false;
    return m_runner.run(QStringLiteral("exfatlabel"), {dataPart, DataLabel}, error);
}

bool InstallerWorker::copyPayload(const PayloadSource &payload, const QString &espPart,
                                  const QString &dataPart, CoreError *error)
{
    StagingMount espMount(m_runner, QStringLiteral("esp"));
    StagingMount dataMount(m_runner, QStringLiteral("data"));

    if (!espMount.mount(espPart, error) || !dataMount.mount(dataPart, error))
        return false;

    report(Phase::PayloadCopy, QStringLiteral("Copying payload files"), 85);

    // "dir/." copies the contents of dir, not dir itself
    const QString cp = QStringLiteral("cp");
    if (!m_runner.run(cp, {"-a", payload.espDir() + QStringLiteral("/."), espMount.path()}, error))
        return false;
    if (!m_runner.run(cp, {"-a", payload.dataDir() + QStringLiteral("/."), dataMount.path()}, error))
        return false;

    espMount.release();
    dataMount.release();

    report(Phase::PayloadDone, QStringLiteral("Payload copy complete."), 90);
    return true;
}
