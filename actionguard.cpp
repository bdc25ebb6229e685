#include "actionguard.h"

#include "logging.h"

#include <utility>

ActionLogger::ActionLogger(const QString &action)
    : m_action(action)
{
    m_timer.start();
    qCInfo(CAPTIONSPEAK_UI).noquote() << "Running:" << m_action;
}

ActionLogger::~ActionLogger()
{
    qCInfo(CAPTIONSPEAK_UI).noquote() << "Finished:" << m_action << "in" << m_timer.elapsed() << "ms";
}

ActionGuard::ActionGuard(ErrorSink sink)
    : m_sink(std::move(sink))
{
}

void ActionGuard::report(const QString &message)
{
    qCWarning(CAPTIONSPEAK_UI).noquote() << "Action failed:" << message;
    if (m_sink) {
        m_sink(message);
    }
}
