#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

class CoreError;

// Runs one external program to completion. A non-zero exit is a failure.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual bool run(const QString &program, const QStringList &args, CoreError *error) = 0;
    virtual bool capture(const QString &program, const QStringList &args,
                         QByteArray *output, CoreError *error) = 0;
    virtual bool hasProgram(const QString &program) const = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    bool run(const QString &program, const QStringList &args, CoreError *error) override;
    bool capture(const QString &program, const QStringList &args,
                 QByteArray *output, CoreError *error) override;
    bool hasProgram(const QString &program) const override;

    // Full path of program, looking in PATH and then the sbin directories
    // that are often missing from a desktop user's PATH. Empty if not found.
    static QString locate(const QString &program);
};

// Accepts every command without running anything.
class NoopCommandRunner : public CommandRunner {
public:
    struct Invocation {
        QString program;
        QStringList args;
    };

    bool run(const QString &program, const QStringList &args, CoreError *error) override;
    bool capture(const QString &program, const QStringList &args,
                 QByteArray *output, CoreError *error) override;
    bool hasProgram(const QString &program) const override;

    const QList<Invocation> &invocations() const { return m_invocations; }
    QStringList programs() const;
    void clear() { m_invocations.clear(); }

protected:
    void record(const QString &program, const QStringList &args);

private:
    QList<Invocation> m_invocations;
};

#endif // COMMANDRUNNER_H
