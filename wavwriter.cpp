#include "wavwriter.h"

#include "errors.h"

#include <QDataStream>
#include <QIODevice>

#include <algorithm>

// WAVE format tags
static const quint16 s_formatPcm = 1;
static const quint16 s_formatIeeeFloat = 3;

QAudioFormat WavWriter::requiredFormat(int sampleRate, Encoding encoding)
{
    QAudioFormat format;
    format.setSampleRate(sampleRate);
    format.setChannelCount(1);
    format.setCodec(QStringLiteral("audio/pcm"));
    format.setByteOrder(QAudioFormat::LittleEndian);
    if (encoding == Encoding::Int16) {
        format.setSampleSize(16);
        format.setSampleType(QAudioFormat::SignedInt);
    } else {
        format.setSampleSize(32);
        format.setSampleType(QAudioFormat::Float);
    }
    return format;
}

void WavWriter::write(QIODevice *device, const QAudioFormat &format, const QVector<float> &samples)
{
    const bool isFloat = format.sampleType() == QAudioFormat::Float && format.sampleSize() == 32;
    const bool isInt16 = format.sampleType() == QAudioFormat::SignedInt && format.sampleSize() == 16;
    if (!format.isValid() || format.channelCount() != 1 || (!isFloat && !isInt16)
        || format.byteOrder() != QAudioFormat::LittleEndian) {
        throw IOError(QStringLiteral("Unsupported WAV layout"));
    }
    if (!device || !device->isWritable()) {
        throw IOError(QStringLiteral("Audio output is not writable"));
    }

    const quint32 bytesPerFrame = format.bytesPerFrame();
    const quint32 dataSize = bytesPerFrame * static_cast<quint32>(samples.size());

    QDataStream stream(device);
    stream.setByteOrder(QDataStream::LittleEndian);
    stream.setFloatingPointPrecision(QDataStream::SinglePrecision);

    // non-PCM formats carry an extended fmt chunk and a fact chunk
    const quint32 fmtSize = isFloat ? 18 : 16;
    const quint32 factChunk = isFloat ? 12 : 0;

    stream.writeRawData("RIFF", 4);
    stream << quint32(4 + (8 + fmtSize) + factChunk + (8 + dataSize));
    stream.writeRawData("WAVE", 4);

    stream.writeRawData("fmt ", 4);
    stream << fmtSize;
    stream << (isFloat ? s_formatIeeeFloat : s_formatPcm);
    stream << quint16(format.channelCount());
    stream << quint32(format.sampleRate());
    stream << quint32(format.sampleRate() * bytesPerFrame);
    stream << quint16(bytesPerFrame);
    stream << quint16(format.sampleSize());
    if (isFloat) {
        stream << quint16(0);
        stream.writeRawData("fact", 4);
        stream << quint32(4);
        stream << quint32(samples.size());
    }

    stream.writeRawData("data", 4);
    stream << dataSize;
    for (float sample : samples) {
        if (isFloat) {
            stream << sample;
        } else {
            const float clamped = std::max(-1.0f, std::min(1.0f, sample));
            stream << qint16(clamped * 32767.0f);
        }
    }

    if (stream.status() != QDataStream::Ok) {
        throw IOError(QStringLiteral("Failed to write audio data: %1").arg(device->errorString()));
    }
}
