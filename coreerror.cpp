#include "coreerror.h"

CoreError::CoreError(Kind kind, const QString &detail)
    : m_kind(kind), m_detail(detail) {}

QString CoreError::toString() const
{
    switch (m_kind) {
    case NoError:
        return QStringLiteral("no error");
    case UnsupportedPlatform:
        return QStringLiteral("unsupported platform");
    case Io:
        return QStringLiteral("io error: %1").arg(m_detail);
    case Validation:
        return QStringLiteral("validation error: %1").arg(m_detail);
    case Parse:
        return QStringLiteral("parse error: %1").arg(m_detail);
    case NotImplemented:
        return QStringLiteral("not implemented: %1").arg(m_detail);
    }
    return m_detail;
}

bool setCoreError(CoreError *error, CoreError::Kind kind, const QString &detail)
{
    if (error)
        *error = CoreError(kind, detail);
    return false;
}

bool setCoreError(CoreError *error, const CoreError &source)
{
    if (error)
        *error = source;
    return false;
}
