#pragma once

#include <QJsonValue>
#include <QString>

class QImage;

/**
 * Captions an image. The result is the raw model output, expected to be a
 * list of records carrying "generated_text".
 */
class ImageToTextPipeline
{
public:
    virtual ~ImageToTextPipeline() = default;
    virtual QString model() const = 0;
    virtual QJsonValue run(const QImage &image) = 0;
};

/**
 * Synthesizes speech. The result is the raw model output, expected to be a
 * record with "audio" and "sampling_rate".
 */
class TextToAudioPipeline
{
public:
    virtual ~TextToAudioPipeline() = default;
    virtual QString model() const = 0;
    virtual QJsonValue run(const QString &text) = 0;
};
