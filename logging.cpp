#include "logging.h"

Q_LOGGING_CATEGORY(lcInstall, "raidhos.install")
Q_LOGGING_CATEGORY(lcInventory, "raidhos.inventory")
Q_LOGGING_CATEGORY(lcCommand, "raidhos.command")
Q_LOGGING_CATEGORY(lcBootConfig, "raidhos.bootconfig")
