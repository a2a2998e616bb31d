#include "commandrunner.h"
#include "coreerror.h"
#include "logging.h"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

static bool execute(const QString &program, const QStringList &args,
                    QByteArray *output, CoreError *error)
{
    const QString path = ProcessCommandRunner::locate(program);
    if (path.isEmpty())
        return setCoreError(error, CoreError::Io, QStringLiteral("command not found: %1").arg(program));

    qCDebug(lcCommand) << "exec" << path << args;

    QProcess process;
    process.start(path, args);
    if (!process.waitForStarted()) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("failed to start %1: %2").arg(program, process.errorString()));
    }
    process.closeWriteChannel();
    process.waitForFinished(-1);

    const QByteArray stdErr = process.readAllStandardError();
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qCWarning(lcCommand) << program << "exited with" << process.exitCode()
                             << QString::fromLocal8Bit(stdErr).trimmed();
        return setCoreError(error, CoreError::Io, QStringLiteral("command failed: %1").arg(program));
    }

    if (output)
        *output = process.readAllStandardOutput();
    return true;
}

QString ProcessCommandRunner::locate(const QString &program)
{
    if (program.startsWith('/'))
        return QFileInfo(program).isExecutable() ? program : QString();

    const QString p = QStandardPaths::findExecutable(program);
    if (!p.isEmpty())
        return p;
    const QStringList fallbacks{"/usr/sbin", "/sbin", "/usr/local/sbin"};
    return QStandardPaths::findExecutable(program, fallbacks);
}

bool ProcessCommandRunner::run(const QString &program, const QStringList &args, CoreError *error)
{
    return execute(program, args, nullptr, error);
}

bool ProcessCommandRunner::capture(const QString &program, const QStringList &args,
                                   QByteArray *output, CoreError *error)
{
    return execute(program, args, output, error);
}

bool ProcessCommandRunner::hasProgram(const QString &program) const
{
    return !locate(program).isEmpty();
}

bool NoopCommandRunner::run(const QString &program, const QStringList &args, CoreError *)
{
    record(program, args);
    return true;
}

bool NoopCommandRunner::capture(const QString &program, const QStringList &args,
                                QByteArray *output, CoreError *)
{
    record(program, args);
    if (output)
        output->clear();
    return true;
}

bool NoopCommandRunner::hasProgram(const QString &) const
{
    return true;
}

QStringList NoopCommandRunner::programs() const
{
    QStringList out;
    for (const Invocation &inv : m_invocations)
        out << inv.program;
    return out;
}

void NoopCommandRunner::record(const QString &program, const QStringList &args)
{
    qCDebug(lcCommand) << "noop" << program << args;
    m_invocations.append({program, args});
}
