#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

struct WavData
{
    quint16 formatTag = 0;
    int channels = 0;
    int sampleRate = 0;
    int bitsPerSample = 0;
    // mono, multi-channel input is averaged per frame
    QVector<float> samples;
};

/**
 * Reads RIFF/WAVE data: 8, 16, 24 and 32-bit PCM and 32-bit float,
 * including WAVE_FORMAT_EXTENSIBLE wrappers of those.
 */
class WavReader
{
public:
    // throws FormatError
    static WavData read(const QByteArray &data);
    // throws IOError if the file cannot be opened, FormatError otherwise
    static WavData readFile(const QString &path);
};
