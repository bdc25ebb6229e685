#pragma once

#include <QAudioFormat>
#include <QVector>

class QIODevice;

/**
 * Writes mono samples into a RIFF/WAVE container.
 *
 * The stream layout comes from a QAudioFormat; 32-bit float and 16-bit
 * signed integer samples are supported.
 */
class WavWriter
{
public:
    enum class Encoding {
        Float32,
        Int16,
    };

    static QAudioFormat requiredFormat(int sampleRate, Encoding encoding = Encoding::Float32);

    // throws IOError if the device rejects the data or the format is unsupported
    static void write(QIODevice *device, const QAudioFormat &format, const QVector<float> &samples);
};
