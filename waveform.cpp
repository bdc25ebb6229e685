#include "waveform.h"

#include "errors.h"

#include <QJsonArray>
#include <QStringList>

static QVector<float> readRow(const QJsonArray &row)
{
    QVector<float> samples;
    samples.reserve(row.size());
    for (const QJsonValue &value : row) {
        if (!value.isDouble()) {
            throw FormatError(QStringLiteral("Audio data contains a non-numeric sample"));
        }
        samples.append(static_cast<float>(value.toDouble()));
    }
    return samples;
}

Waveform::Waveform(const QVector<float> &samples)
    : m_shape{samples.size()}
    , m_samples(samples)
{
}

Waveform::Waveform(const QVector<int> &shape, const QVector<float> &samples)
    : m_shape(shape)
    , m_samples(samples)
{
    if (shape.isEmpty()) {
        throw FormatError(QStringLiteral("Audio data has no dimensions"));
    }
    qint64 expected = 1;
    for (int extent : shape) {
        if (extent < 0) {
            throw FormatError(QStringLiteral("Audio data has a negative extent"));
        }
        expected *= extent;
    }
    if (expected != samples.size()) {
        throw FormatError(QStringLiteral("Audio shape %1 does not hold %2 samples")
                              .arg(shapeString())
                              .arg(samples.size()));
    }
}

Waveform Waveform::fromJson(const QJsonValue &value)
{
    if (!value.isArray()) {
        throw FormatError(QStringLiteral("Audio data is not an array"));
    }
    const QJsonArray outer = value.toArray();

    // an empty or flat array is a single channel
    if (outer.isEmpty() || !outer.first().isArray()) {
        return Waveform(readRow(outer));
    }

    QVector<float> samples;
    int columns = -1;
    for (const QJsonValue &row : outer) {
        if (!row.isArray()) {
            throw FormatError(QStringLiteral("Audio data mixes rows and samples"));
        }
        const QJsonArray rowArray = row.toArray();
        for (const QJsonValue &sample : rowArray) {
            if (sample.isArray()) {
                throw FormatError(QStringLiteral("Audio data has more than two dimensions"));
            }
        }
        if (columns >= 0 && rowArray.size() != columns) {
            throw FormatError(QStringLiteral("Audio rows have different lengths"));
        }
        columns = rowArray.size();
        samples.append(readRow(rowArray));
    }
    return Waveform({outer.size(), columns}, samples);
}

QVector<int> Waveform::shape() const
{
    return m_shape;
}

int Waveform::dimensions() const
{
    return m_shape.size();
}

int Waveform::sampleCount() const
{
    return m_samples.size();
}

bool Waveform::isEmpty() const
{
    return m_samples.isEmpty();
}

const QVector<float> &Waveform::samples() const
{
    return m_samples;
}

Waveform Waveform::squeezed() const
{
    if (dimensions() == 1) {
        return *this;
    }
    if (dimensions() == 2 && (m_shape[0] == 1 || m_shape[1] == 1)) {
        return Waveform(m_samples);
    }
    throw FormatError(QStringLiteral("Expected mono audio but the model returned shape %1").arg(shapeString()));
}

QString Waveform::shapeString() const
{
    QStringList extents;
    for (int extent : m_shape) {
        extents << QString::number(extent);
    }
    if (extents.size() == 1) {
        return QStringLiteral("(%1,)").arg(extents.first());
    }
    return QStringLiteral("(%1)").arg(extents.join(QStringLiteral(", ")));
}
