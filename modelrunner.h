#pragma once

#include "waveform.h"
#include "wavwriter.h"

#include <QString>
#include <QStringList>

class FileLauncher;
class ImageToTextPipeline;
class TextToAudioPipeline;

/**
 * Runs the captioning and speech models and plays synthesized speech.
 *
 * Every operation either returns its result or throws a ModelError
 * subclass; nothing is recovered here.
 */
class ModelRunner
{
public:
    ModelRunner(ImageToTextPipeline &captioner, TextToAudioPipeline &speaker, FileLauncher &launcher);
    ~ModelRunner();

    QString captionModel() const;
    QString speechModel() const;

    // directory receiving the generated wav files, the system temp dir by default
    void setAudioDirectory(const QString &directory);
    QString audioDirectory() const;
    void setAudioEncoding(WavWriter::Encoding encoding);
    // when set, generated files are left behind on destruction
    void setKeepAudioFiles(bool keep);

    QString generateCaption(const QString &imagePath);
    AudioResult synthesizeSpeech(const QString &text);

    /**
     * Writes the audio to a new wav file and hands it to the desktop for
     * playback. Returns the path of the written file.
     */
    QString play(const AudioResult &audio);

    // synthesizeSpeech() followed by play()
    QString speak(const QString &text);

    QStringList producedFiles() const;
    void removeProducedFiles();

private:
    QString writeTemporaryWav(const Waveform &waveform, int sampleRate);

    ImageToTextPipeline &m_captioner;
    TextToAudioPipeline &m_speaker;
    FileLauncher &m_launcher;

    QString m_audioDirectory;
    WavWriter::Encoding m_encoding = WavWriter::Encoding::Float32;
    bool m_keepAudioFiles = false;
    QStringList m_producedFiles;
};
