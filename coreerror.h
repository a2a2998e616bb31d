#ifndef COREERROR_H
#define COREERROR_H

#include <QMetaType>
#include <QString>

class CoreError {
public:
    enum Kind {
        NoError,
        UnsupportedPlatform,
        Io,
        Validation,
        Parse,
        NotImplemented
    };

    CoreError() = default;
    CoreError(Kind kind, const QString &detail);

    Kind kind() const { return m_kind; }
    QString detail() const { return m_detail; }
    bool isError() const { return m_kind != NoError; }

    // "validation error: device not found", "unsupported platform", ...
    QString toString() const;

private:
    Kind m_kind = NoError;
    QString m_detail;
};

Q_DECLARE_METATYPE(CoreError)

// Stores the error when the caller asked for one. Always returns false so
// failing paths can end with `return setCoreError(...)`.
bool setCoreError(CoreError *error, CoreError::Kind kind, const QString &detail);
bool setCoreError(CoreError *error, const CoreError &source);

#endif // COREERROR_H
