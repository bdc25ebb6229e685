#include "modelrunner.h"

#include "errors.h"
#include "filelauncher.h"
#include "logging.h"
#include "pipelines.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryFile>

#include <cmath>
#include <limits>

ModelRunner::ModelRunner(ImageToTextPipeline &captioner, TextToAudioPipeline &speaker, FileLauncher &launcher)
    : m_captioner(captioner)
    , m_speaker(speaker)
    , m_launcher(launcher)
    , m_audioDirectory(QDir::tempPath())
{
}

ModelRunner::~ModelRunner()
{
    if (!m_keepAudioFiles) {
        removeProducedFiles();
    }
}

QString ModelRunner::captionModel() const
{
    return m_captioner.model();
}

QString ModelRunner::speechModel() const
{
    return m_speaker.model();
}

void ModelRunner::setAudioDirectory(const QString &directory)
{
    m_audioDirectory = directory.isEmpty() ? QDir::tempPath() : directory;
}

QString ModelRunner::audioDirectory() const
{
    return m_audioDirectory;
}

void ModelRunner::setAudioEncoding(WavWriter::Encoding encoding)
{
    m_encoding = encoding;
}

void ModelRunner::setKeepAudioFiles(bool keep)
{
    m_keepAudioFiles = keep;
}

QString ModelRunner::generateCaption(const QString &imagePath)
{
    if (imagePath.isEmpty() || !QFileInfo::exists(imagePath)) {
        throw ResourceError(QStringLiteral("Image file \"%1\" does not exist").arg(imagePath));
    }

    QImageReader reader(imagePath);
    const QImage image = reader.read();
    if (image.isNull()) {
        throw ResourceError(QStringLiteral("Cannot load image \"%1\": %2").arg(imagePath, reader.errorString()));
    }

    QElapsedTimer bench;
    bench.start();
    qCInfo(CAPTIONSPEAK_RUNNER) << "Captioning" << imagePath << image.size() << "with" << m_captioner.model();

    QJsonValue result;
    try {
        result = m_captioner.run(image);
    } catch (const ModelError &) {
        throw;
    } catch (const std::exception &e) {
        throw InferenceError(QStringLiteral("%1 failed: %2").arg(m_captioner.model(), QString::fromLocal8Bit(e.what())));
    }

    const QJsonArray records = result.toArray();
    if (!result.isArray() || records.isEmpty()) {
        throw FormatError(QStringLiteral("%1 returned no caption").arg(m_captioner.model()));
    }
    const QJsonValue text = records.first().toObject().value(QStringLiteral("generated_text"));
    if (!text.isString()) {
        throw FormatError(QStringLiteral("%1 returned a result without generated_text").arg(m_captioner.model()));
    }
    if (text.toString().trimmed().isEmpty()) {
        throw FormatError(QStringLiteral("%1 returned an empty caption").arg(m_captioner.model()));
    }

    qCInfo(CAPTIONSPEAK_RUNNER) << "Caption ready after" << bench.elapsed() << "ms";
    return text.toString();
}

AudioResult ModelRunner::synthesizeSpeech(const QString &text)
{
    if (text.trimmed().isEmpty()) {
        throw ResourceError(QStringLiteral("There is no text to speak"));
    }

    QElapsedTimer bench;
    bench.start();
    qCInfo(CAPTIONSPEAK_RUNNER) << "Synthesizing" << text.size() << "characters with" << m_speaker.model();

    QJsonValue result;
    try {
        result = m_speaker.run(text);
    } catch (const ModelError &) {
        throw;
    } catch (const std::exception &e) {
        throw InferenceError(QStringLiteral("%1 failed: %2").arg(m_speaker.model(), QString::fromLocal8Bit(e.what())));
    }

    const QJsonObject record = result.toObject();
    if (!result.isObject() || !record.contains(QStringLiteral("audio")) || !record.contains(QStringLiteral("sampling_rate"))) {
        throw FormatError(QStringLiteral("Unexpected output format from %1").arg(m_speaker.model()));
    }

    const QJsonValue rate = record.value(QStringLiteral("sampling_rate"));
    const double rateValue = rate.toDouble();
    // range check first, the cast below is only defined for values an int can hold
    if (!rate.isDouble() || rateValue <= 0 || rateValue > std::numeric_limits<int>::max()
        || rateValue != std::floor(rateValue)) {
        throw FormatError(QStringLiteral("%1 returned an invalid sampling rate").arg(m_speaker.model()));
    }

    AudioResult audio;
    audio.waveform = Waveform::fromJson(record.value(QStringLiteral("audio")));
    audio.sampleRate = static_cast<int>(rateValue);

    qCInfo(CAPTIONSPEAK_RUNNER) << "Speech ready after" << bench.elapsed() << "ms, shape"
                                << audio.waveform.shapeString() << "at" << audio.sampleRate << "Hz";
    return audio;
}

QString ModelRunner::play(const AudioResult &audio)
{
    const Waveform mono = audio.waveform.squeezed();
    if (mono.isEmpty()) {
        throw FormatError(QStringLiteral("The synthesized audio contains no samples"));
    }
    if (audio.sampleRate <= 0) {
        throw FormatError(QStringLiteral("Invalid sample rate %1").arg(audio.sampleRate));
    }

    const QString path = writeTemporaryWav(mono, audio.sampleRate);
    m_launcher.open(path);
    return path;
}

QString ModelRunner::speak(const QString &text)
{
    return play(synthesizeSpeech(text));
}

QString ModelRunner::writeTemporaryWav(const Waveform &waveform, int sampleRate)
{
    QTemporaryFile file(QDir(m_audioDirectory).filePath(QStringLiteral("captionspeak-XXXXXX.wav")));
    file.setAutoRemove(false);
    if (!file.open()) {
        throw IOError(QStringLiteral("Cannot create a temporary audio file in %1: %2").arg(m_audioDirectory, file.errorString()));
    }

    const QString path = file.fileName();
    try {
        WavWriter::write(&file, WavWriter::requiredFormat(sampleRate, m_encoding), waveform.samples());
    } catch (const IOError &) {
        file.remove();
        throw;
    }
    if (!file.flush()) {
        file.remove();
        throw IOError(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    file.close();

    m_producedFiles << path;
    qCInfo(CAPTIONSPEAK_RUNNER) << "Wrote" << waveform.sampleCount() << "samples to" << path;
    return path;
}

QStringList ModelRunner::producedFiles() const
{
    return m_producedFiles;
}

void ModelRunner::removeProducedFiles()
{
    for (const QString &path : qAsConst(m_producedFiles)) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qCWarning(CAPTIONSPEAK_RUNNER) << "Could not remove" << path;
        }
    }
    m_producedFiles.clear();
}
