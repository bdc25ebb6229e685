#include "logging.h"

Q_LOGGING_CATEGORY(CAPTIONSPEAK_RUNNER, "captionspeak.runner", QtInfoMsg)
Q_LOGGING_CATEGORY(CAPTIONSPEAK_NETWORK, "captionspeak.network", QtInfoMsg)
Q_LOGGING_CATEGORY(CAPTIONSPEAK_UI, "captionspeak.ui", QtInfoMsg)
