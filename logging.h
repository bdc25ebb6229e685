#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(CAPTIONSPEAK_RUNNER)
Q_DECLARE_LOGGING_CATEGORY(CAPTIONSPEAK_NETWORK)
Q_DECLARE_LOGGING_CATEGORY(CAPTIONSPEAK_UI)
