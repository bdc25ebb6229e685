#pragma once

#include "errors.h"

#include <QElapsedTimer>
#include <QString>

#include <exception>
#include <functional>

// Logs "Running: <action>" on construction and the elapsed time on destruction.
class ActionLogger
{
public:
    explicit ActionLogger(const QString &action);
    ~ActionLogger();

private:
    QString m_action;
    QElapsedTimer m_timer;
};

/**
 * Runs a user action and turns any exception it throws into a message
 * handed to the error sink. The window passes a sink that shows a message box.
 */
class ActionGuard
{
public:
    using ErrorSink = std::function<void(const QString &message)>;

    explicit ActionGuard(ErrorSink sink);

    // returns false if the action threw
    template<typename Func>
    bool run(Func &&func)
    {
        try {
            func();
            return true;
        } catch (const ModelError &e) {
            report(e.message());
        } catch (const std::exception &e) {
            report(QString::fromLocal8Bit(e.what()));
        }
        return false;
    }

private:
    void report(const QString &message);

    ErrorSink m_sink;
};
