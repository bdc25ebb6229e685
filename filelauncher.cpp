#include "filelauncher.h"

#include "errors.h"
#include "logging.h"

#include <QDesktopServices>
#include <QGuiApplication>
#include <QUrl>

void DesktopFileLauncher::open(const QString &path)
{
    if (!qobject_cast<QGuiApplication *>(QCoreApplication::instance())) {
        throw PlaybackDispatchError(QStringLiteral("No desktop session is available to play %1").arg(path));
    }

    const QUrl url = QUrl::fromLocalFile(path);
    qCDebug(CAPTIONSPEAK_RUNNER) << "Opening" << url;
    if (!QDesktopServices::openUrl(url)) {
        throw PlaybackDispatchError(QStringLiteral("No application could be launched to play %1").arg(path));
    }
}
