#ifndef GRUBCONFIG_H
#define GRUBCONFIG_H

#include <QString>

struct BootConfig;
struct BootEntry;
class CoreError;

// Renders grub.cfg for the multi-ISO boot menu. Nothing here touches the
// disk except writeToEsp().
class GrubConfig {
public:
    static QString render(const BootConfig &config, const QString &dataLabel);

    // Drops double quotes, folds line breaks into one space, trims.
    static QString sanitize(const QString &input);
    // Makes the ISO path absolute on the searched volume.
    static QString pathPrefix(const QString &path);

    // Writes <espMount>/EFI/BOOT/grub.cfg
    static bool writeToEsp(const QString &espMount, const BootConfig &config,
                           const QString &dataLabel, CoreError *error);

private:
    static QString menuEntry(const BootEntry &entry);
};

#endif // GRUBCONFIG_H
