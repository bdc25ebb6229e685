#include <gtest/gtest.h>

#include "errors.h"
#include "filelauncher.h"

#include <QCoreApplication>

TEST(DesktopFileLauncherTest, NoApplicationIsPlaybackDispatchError)
{
    ASSERT_EQ(QCoreApplication::instance(), nullptr);

    DesktopFileLauncher launcher;
    EXPECT_THROW(launcher.open(QStringLiteral("/tmp/captionspeak-test.wav")), PlaybackDispatchError);
}

TEST(DesktopFileLauncherTest, ConsoleApplicationIsPlaybackDispatchError)
{
    int argc = 1;
    char name[] = "captionspeak_tests";
    char *argv[] = {name, nullptr};
    QCoreApplication app(argc, argv);

    DesktopFileLauncher launcher;
    try {
        launcher.open(QStringLiteral("/tmp/captionspeak-test.wav"));
        FAIL() << "expected PlaybackDispatchError";
    } catch (const PlaybackDispatchError &e) {
        EXPECT_TRUE(e.message().contains(QStringLiteral("captionspeak-test.wav")));
    }
}
