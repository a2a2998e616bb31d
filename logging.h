#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="raidhos.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcInstall)
Q_DECLARE_LOGGING_CATEGORY(lcInventory)
Q_DECLARE_LOGGING_CATEGORY(lcCommand)
Q_DECLARE_LOGGING_CATEGORY(lcBootConfig)

#endif // LOGGING_H
