#include "progress.h"

namespace {

struct Transition {
    Phase from;
    Phase to;
};

// Dry run stops after Finalize; a real write continues through Partition.
const Transition kTransitions[] = {
    {Phase::Idle,        Phase::Validate},
    {Phase::Validate,    Phase::Prepare},
    {Phase::Prepare,     Phase::Stage},
    {Phase::Stage,       Phase::Write},
    {Phase::Write,       Phase::Finalize},
    {Phase::Finalize,    Phase::Complete},
    {Phase::Finalize,    Phase::Partition},
    {Phase::Partition,   Phase::Format},
    {Phase::Format,      Phase::PayloadCopy},
    {Phase::PayloadCopy, Phase::PayloadDone},
    {Phase::PayloadDone, Phase::Complete},
};

} // namespace

QString phaseName(Phase phase)
{
    switch (phase) {
    case Phase::Idle:        return QStringLiteral("idle");
    case Phase::Validate:    return QStringLiteral("validate");
    case Phase::Prepare:     return QStringLiteral("prepare");
    case Phase::Stage:
    case Phase::PayloadCopy:
    case Phase::PayloadDone: return QStringLiteral("payload");
    case Phase::Write:       return QStringLiteral("write");
    case Phase::Finalize:    return QStringLiteral("finalize");
    case Phase::Partition:   return QStringLiteral("partition");
    case Phase::Format:      return QStringLiteral("format");
    case Phase::Complete:    return QStringLiteral("complete");
    }
    return QString();
}

bool PhaseTracker::canAdvance(Phase from, Phase to)
{
    for (const Transition &t : kTransitions) {
        if (t.from == from && t.to == to)
            return true;
    }
    return false;
}

bool PhaseTracker::advance(Phase next)
{
    if (!canAdvance(m_current, next))
        return false;
    m_current = next;
    return true;
}
