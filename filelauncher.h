#pragma once

#include <QString>

/**
 * Opens a file with whatever application the desktop associates with it.
 * Returns once the launch has been requested.
 */
class FileLauncher
{
public:
    virtual ~FileLauncher() = default;
    // throws PlaybackDispatchError
    virtual void open(const QString &path) = 0;
};

// QDesktopServices picks xdg-open/portals, ShellExecute or LaunchServices
class DesktopFileLauncher : public FileLauncher
{
public:
    void open(const QString &path) override;
};
