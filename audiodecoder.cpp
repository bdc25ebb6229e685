#include "audiodecoder.h"

#include "errors.h"
#include "logging.h"
#include "wavreader.h"

#include <QAudioBuffer>
#include <QAudioDecoder>
#include <QBuffer>
#include <QEventLoop>

static bool appendBuffer(const QAudioBuffer &buffer, DecodedAudio &audio, QString &failure)
{
    const QAudioFormat format = buffer.format();
    const int channels = format.channelCount();
    if (channels < 1) {
        failure = QStringLiteral("decoded audio has no channels");
        return false;
    }
    if (audio.sampleRate == 0) {
        audio.sampleRate = format.sampleRate();
    } else if (audio.sampleRate != format.sampleRate()) {
        failure = QStringLiteral("sample rate changed while decoding");
        return false;
    }

    // the decoder does not always honour a requested format, so convert what arrives
    const int frames = buffer.frameCount();
    for (int frame = 0; frame < frames; ++frame) {
        float sum = 0;
        for (int c = 0; c < channels; ++c) {
            const int index = frame * channels + c;
            if (format.sampleType() == QAudioFormat::Float && format.sampleSize() == 32) {
                sum += buffer.constData<float>()[index];
            } else if (format.sampleType() == QAudioFormat::SignedInt && format.sampleSize() == 16) {
                sum += buffer.constData<qint16>()[index] / 32768.0f;
            } else if (format.sampleType() == QAudioFormat::SignedInt && format.sampleSize() == 32) {
                sum += buffer.constData<qint32>()[index] / 2147483648.0f;
            } else if (format.sampleType() == QAudioFormat::UnSignedInt && format.sampleSize() == 8) {
                sum += (int(buffer.constData<quint8>()[index]) - 128) / 128.0f;
            } else {
                failure = QStringLiteral("unsupported decoded sample format");
                return false;
            }
        }
        audio.samples.append(sum / channels);
    }
    return true;
}

bool AudioDecoder::isWav(const QByteArray &mimeType, const QByteArray &data)
{
    return mimeType == "audio/wav" || mimeType == "audio/x-wav" || mimeType == "audio/wave"
        || mimeType == "audio/vnd.wave" || data.startsWith("RIFF");
}

DecodedAudio AudioDecoder::decode(const QByteArray &mimeType, const QByteArray &data)
{
    if (data.isEmpty()) {
        throw FormatError(QStringLiteral("The model returned empty %1 audio").arg(QString::fromLatin1(mimeType)));
    }

    if (isWav(mimeType, data)) {
        const WavData wav = WavReader::read(data);
        DecodedAudio audio;
        audio.samples = wav.samples;
        audio.sampleRate = wav.sampleRate;
        return audio;
    }
    return decodeWithBackend(mimeType, data);
}

DecodedAudio AudioDecoder::decodeWithBackend(const QByteArray &mimeType, const QByteArray &data)
{
    QBuffer source;
    source.setData(data);
    source.open(QIODevice::ReadOnly);

    QAudioDecoder decoder;
    decoder.setSourceDevice(&source);

    DecodedAudio audio;
    QString failure;
    bool done = false;
    QEventLoop loop;

    QObject::connect(&decoder, &QAudioDecoder::bufferReady, &loop, [&]() {
        while (decoder.bufferAvailable() && failure.isEmpty()) {
            if (!appendBuffer(decoder.read(), audio, failure)) {
                decoder.stop();
                done = true;
                loop.quit();
            }
        }
    });
    QObject::connect(&decoder, &QAudioDecoder::finished, &loop, [&]() {
        done = true;
        loop.quit();
    });
    QObject::connect(&decoder, QOverload<QAudioDecoder::Error>::of(&QAudioDecoder::error), &loop, [&](QAudioDecoder::Error) {
        failure = decoder.errorString();
        done = true;
        loop.quit();
    });

    qCDebug(CAPTIONSPEAK_NETWORK) << "Decoding" << data.size() << "bytes of" << mimeType;
    decoder.start();
    if (decoder.error() != QAudioDecoder::NoError && failure.isEmpty()) {
        failure = decoder.errorString();
        done = true;
    }
    if (!done) {
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }

    if (!failure.isEmpty()) {
        throw FormatError(QStringLiteral("Cannot decode %1 audio: %2").arg(QString::fromLatin1(mimeType), failure));
    }
    if (audio.samples.isEmpty() || audio.sampleRate <= 0) {
        throw FormatError(QStringLiteral("Decoding %1 audio produced no samples").arg(QString::fromLatin1(mimeType)));
    }
    return audio;
}
