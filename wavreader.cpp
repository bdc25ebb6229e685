#include "wavreader.h"

#include "errors.h"

#include <QDataStream>
#include <QFile>

#include <cstring>

static const quint16 s_formatPcm = 1;
static const quint16 s_formatIeeeFloat = 3;
static const quint16 s_formatExtensible = 0xFFFE;

static float readSample(QDataStream &stream, quint16 format, int bits)
{
    if (format == s_formatIeeeFloat) {
        float value = 0;
        stream >> value;
        return value;
    }
    switch (bits) {
    case 8: {
        quint8 value = 0;
        stream >> value;
        return (int(value) - 128) / 128.0f;
    }
    case 16: {
        qint16 value = 0;
        stream >> value;
        return value / 32768.0f;
    }
    case 24: {
        quint8 bytes[3];
        stream >> bytes[0] >> bytes[1] >> bytes[2];
        const qint32 value = static_cast<qint32>((quint32(bytes[2]) << 24) | (quint32(bytes[1]) << 16) | (quint32(bytes[0]) << 8));
        return (value >> 8) / 8388608.0f;
    }
    default: {
        qint32 value = 0;
        stream >> value;
        return value / 2147483648.0f;
    }
    }
}

WavData WavReader::read(const QByteArray &data)
{
    QDataStream stream(data);
    stream.setByteOrder(QDataStream::LittleEndian);
    stream.setFloatingPointPrecision(QDataStream::SinglePrecision);

    char tag[4];
    quint32 size = 0;
    if (stream.readRawData(tag, 4) != 4 || std::memcmp(tag, "RIFF", 4) != 0) {
        throw FormatError(QStringLiteral("Audio is not a RIFF file"));
    }
    stream >> size;
    if (stream.readRawData(tag, 4) != 4 || std::memcmp(tag, "WAVE", 4) != 0) {
        throw FormatError(QStringLiteral("Audio is not a WAVE file"));
    }

    WavData wav;
    bool haveFormat = false;
    while (stream.readRawData(tag, 4) == 4) {
        stream >> size;
        if (std::memcmp(tag, "fmt ", 4) == 0) {
            if (size < 16) {
                throw FormatError(QStringLiteral("WAVE fmt chunk is too short"));
            }
            quint16 channels = 0;
            quint32 sampleRate = 0;
            quint32 byteRate = 0;
            quint16 blockAlign = 0;
            quint16 bits = 0;
            stream >> wav.formatTag >> channels >> sampleRate >> byteRate >> blockAlign >> bits;
            quint32 consumed = 16;
            if (wav.formatTag == s_formatExtensible && size >= 40) {
                quint16 extensionSize = 0;
                quint16 validBits = 0;
                quint32 channelMask = 0;
                stream >> extensionSize >> validBits >> channelMask >> wav.formatTag;
                consumed += 10;
            }
            stream.skipRawData(size - consumed + (size & 1));
            wav.channels = channels;
            wav.sampleRate = static_cast<int>(sampleRate);
            wav.bitsPerSample = bits;
            haveFormat = true;
        } else if (std::memcmp(tag, "data", 4) == 0) {
            if (!haveFormat) {
                throw FormatError(QStringLiteral("WAVE data chunk precedes its format"));
            }
            const bool pcm = wav.formatTag == s_formatPcm
                && (wav.bitsPerSample == 8 || wav.bitsPerSample == 16 || wav.bitsPerSample == 24 || wav.bitsPerSample == 32);
            const bool ieee = wav.formatTag == s_formatIeeeFloat && wav.bitsPerSample == 32;
            if ((!pcm && !ieee) || wav.channels < 1 || wav.sampleRate <= 0 || wav.sampleRate > 1000000) {
                throw FormatError(QStringLiteral("Unsupported WAVE layout (format %1, %2 bits, %3 channels)")
                                      .arg(wav.formatTag)
                                      .arg(wav.bitsPerSample)
                                      .arg(wav.channels));
            }

            // streamed files may leave the size at 0 or 0xFFFFFFFF
            const qint64 remaining = data.size() - stream.device()->pos();
            const qint64 available = (size == 0 || size > remaining) ? remaining : size;
            const qint64 frameSize = qint64(wav.channels) * (wav.bitsPerSample / 8);
            const qint64 frames = available / frameSize;

            wav.samples.reserve(static_cast<int>(frames));
            for (qint64 i = 0; i < frames; ++i) {
                float sum = 0;
                for (int c = 0; c < wav.channels; ++c) {
                    sum += readSample(stream, wav.formatTag, wav.bitsPerSample);
                }
                wav.samples.append(sum / wav.channels);
            }
            if (stream.status() != QDataStream::Ok) {
                throw FormatError(QStringLiteral("WAVE data is truncated"));
            }
            return wav;
        } else {
            stream.skipRawData(size + (size & 1));
        }
    }
    throw FormatError(QStringLiteral("WAVE file has no data chunk"));
}

WavData WavReader::readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw IOError(QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }
    return read(file.readAll());
}
