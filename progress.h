#ifndef PROGRESS_H
#define PROGRESS_H

#include <QMetaType>
#include <QString>

// Install phases in the order they are reported. Stage, PayloadCopy and
// PayloadDone all go out under the "payload" name.
enum class Phase {
    Idle,
    Validate,
    Prepare,
    Stage,
    Write,
    Finalize,
    Partition,
    Format,
    PayloadCopy,
    PayloadDone,
    Complete
};

QString phaseName(Phase phase);

struct ProgressEvent {
    Phase phase = Phase::Idle;
    QString message;
    int percent = -1;   // 0..100, -1 when not known

    QString phaseName() const { return ::phaseName(phase); }
    bool hasPercent() const { return percent >= 0; }
};

// Guards the install sequence against reordered or repeated checkpoints.
class PhaseTracker {
public:
    Phase current() const { return m_current; }

    static bool canAdvance(Phase from, Phase to);
    bool advance(Phase next);

private:
    Phase m_current = Phase::Idle;
};

Q_DECLARE_METATYPE(ProgressEvent)

#endif // PROGRESS_H
