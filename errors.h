#pragma once

#include <stdexcept>
#include <string>

#include <QString>

/**
 * Base of every failure the model runner reports to the window.
 * The message is meant to be shown to the user as is.
 */
class ModelError : public std::runtime_error
{
public:
    explicit ModelError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }

    QString message() const
    {
        return QString::fromStdString(what());
    }
};

// input image missing or unreadable, empty speech text
class ResourceError : public ModelError
{
public:
    using ModelError::ModelError;
};

// the inference backend itself failed
class InferenceError : public ModelError
{
public:
    using ModelError::ModelError;
};

// a backend result or a waveform did not have the expected shape
class FormatError : public ModelError
{
public:
    using ModelError::ModelError;
};

// temporary audio file could not be created or written
class IOError : public ModelError
{
public:
    using ModelError::ModelError;
};

class PlaybackDispatchError : public ModelError
{
public:
    using ModelError::ModelError;
};
