#include "grubconfig.h"
#include "bootconfig.h"
#include "coreerror.h"
#include "logging.h"

#include <QDir>
#include <QRegularExpression>
#include <QSaveFile>

QString GrubConfig::sanitize(const QString &input)
{
    static const QRegularExpression lineBreaks(QStringLiteral("[\\r\\n]+"));
    QString out = input;
    out.remove(QLatin1Char('"'));
    out.replace(lineBreaks, QStringLiteral(" "));
    return out.trimmed();
}

QString GrubConfig::pathPrefix(const QString &path)
{
    if (path.startsWith(QLatin1Char('/')))
        return path;
    return QStringLiteral("/") + path;
}

QString GrubConfig::render(const BootConfig &config, const QString &dataLabel)
{
    QString out;
    out += QStringLiteral("set timeout=5\n");
    if (config.hasDefaultEntry())
        out += QStringLiteral("set default=\"%1\"\n").arg(sanitize(config.defaultEntry));

    out += QStringLiteral("insmod part_gpt\n"
                          "insmod fat\n"
                          "insmod exfat\n"
                          "insmod iso9660\n"
                          "insmod loopback\n"
                          "insmod search\n");
    out += QStringLiteral("search --no-floppy --label %1 --set=root\n").arg(sanitize(dataLabel));
    out += QStringLiteral("set isopath=/boot/isos\n"
                          "export root\n"
                          "export isopath\n");

    for (const BootEntry &entry : config.entries)
        out += menuEntry(entry);
    return out;
}

// Layouts are probed by GRUB at boot time, so any ISO following one of the
// common conventions boots without per-distribution knowledge here.
QString GrubConfig::menuEntry(const BootEntry &entry)
{
    const QString title = sanitize(entry.title);
    const QString path = pathPrefix(sanitize(entry.path));
    const QString params = sanitize(entry.params);
    const QString initrd = sanitize(entry.initrd);
    const QString kargs = sanitize(entry.kargs);

    QString out;
    out += QStringLiteral("menuentry \"%1\" {\n").arg(title);
    out += QStringLiteral("  set isofile=\"($root)%1\"\n").arg(path);
    out += QStringLiteral("  loopback loop $isofile\n");

    // 1) ISO ships its own grub.cfg
    out += QStringLiteral("  if [ -f (loop)/boot/grub/grub.cfg ]; then\n");
    out += QStringLiteral("    configfile (loop)/boot/grub/grub.cfg\n");

    // 2) Ubuntu and other casper based live images
    out += QStringLiteral("  elif [ -f (loop)/casper/vmlinuz ]; then\n");
    out += QStringLiteral("    linux (loop)/casper/vmlinuz %1 %2 iso-scan/filename=$isofile\n").arg(params, kargs);
    out += QStringLiteral("    initrd %1\n")
               .arg(initrd.isEmpty() ? QStringLiteral("(loop)/casper/initrd") : initrd);

    // 3) Debian live-boot
    out += QStringLiteral("  elif [ -f (loop)/live/vmlinuz ]; then\n");
    out += QStringLiteral("    linux (loop)/live/vmlinuz %1 %2 boot=live findiso=$isofile\n").arg(params, kargs);
    out += QStringLiteral("    initrd %1\n")
               .arg(initrd.isEmpty() ? QStringLiteral("(loop)/live/initrd.img") : initrd);

    out += QStringLiteral("  else\n");
    out += QStringLiteral("    echo \"No known kernel path found in ISO.\"\n");
    out += QStringLiteral("  fi\n");
    out += QStringLiteral("}\n");
    return out;
}

bool GrubConfig::writeToEsp(const QString &espMount, const BootConfig &config,
                            const QString &dataLabel, CoreError *error)
{
    const QDir esp(espMount);
    if (!esp.exists())
        return setCoreError(error, CoreError::Validation, QStringLiteral("ESP mount not found: %1").arg(espMount));

    const QString bootDir = esp.filePath(QStringLiteral("EFI/BOOT"));
    if (!QDir().mkpath(bootDir))
        return setCoreError(error, CoreError::Io, QStringLiteral("cannot create %1").arg(bootDir));

    const QString path = QDir(bootDir).filePath(QStringLiteral("grub.cfg"));
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("cannot write %1: %2").arg(path, f.errorString()));
    }
    f.write(render(config, dataLabel).toUtf8());
    if (!f.commit()) {
        return setCoreError(error, CoreError::Io,
                            QStringLiteral("cannot write %1: %2").arg(path, f.errorString()));
    }
    qCInfo(lcBootConfig) << "wrote" << config.entries.size() << "menu entries to" << path;
    return true;
}
