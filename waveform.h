#pragma once

#include <QJsonValue>
#include <QString>
#include <QVector>

/**
 * Audio samples as returned by a text-to-audio model, together with the
 * shape the model reported. Samples are stored row-major.
 */
class Waveform
{
public:
    Waveform() = default;
    explicit Waveform(const QVector<float> &samples);
    // throws FormatError when the shape does not match the sample count
    Waveform(const QVector<int> &shape, const QVector<float> &samples);

    /**
     * Builds a waveform from a nested JSON array of numbers of one or two
     * dimensions. Throws FormatError for anything else.
     */
    static Waveform fromJson(const QJsonValue &value);

    QVector<int> shape() const;
    int dimensions() const;
    int sampleCount() const;
    bool isEmpty() const;
    const QVector<float> &samples() const;

    /**
     * Collapses a single-row or single-column 2-D waveform to 1-D.
     * A 1-D waveform is returned unchanged. Any other shape throws
     * FormatError.
     */
    Waveform squeezed() const;

    QString shapeString() const;

private:
    QVector<int> m_shape {0};
    QVector<float> m_samples;
};

struct AudioResult
{
    Waveform waveform;
    int sampleRate = 0;
};
