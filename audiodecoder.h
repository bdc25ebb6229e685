#pragma once

#include <QByteArray>
#include <QVector>

struct DecodedAudio
{
    QVector<float> samples;
    int sampleRate = 0;
};

/**
 * Turns an encoded audio reply into mono float samples.
 *
 * WAV data is read directly, anything else (FLAC, MP3, Ogg) goes through
 * QAudioDecoder and needs a running Qt application plus a multimedia
 * backend able to handle the type.
 */
class AudioDecoder
{
public:
    static bool isWav(const QByteArray &mimeType, const QByteArray &data);

    // throws FormatError
    static DecodedAudio decode(const QByteArray &mimeType, const QByteArray &data);

private:
    static DecodedAudio decodeWithBackend(const QByteArray &mimeType, const QByteArray &data);
};
