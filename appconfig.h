#pragma once

#include "wavwriter.h"

#include <QString>
#include <QUrl>

class QCommandLineParser;
class QProcessEnvironment;
class QSettings;

/**
 * Application settings. Values come from QSettings, then the HF_TOKEN
 * environment variable, then the command line, later sources winning.
 */
struct AppConfig
{
    QUrl endpoint = QUrl(QStringLiteral("https://api-inference.huggingface.co"));
    QString token;
    int timeoutMs = 0;
    QString captionModel = QStringLiteral("Salesforce/blip-image-captioning-base");
    QString speechModel = QStringLiteral("suno/bark");
    QString audioDirectory;
    WavWriter::Encoding audioEncoding = WavWriter::Encoding::Float32;
    bool keepAudioFiles = false;

    static AppConfig load(const QSettings &settings, const QProcessEnvironment &environment);
    static void addOptions(QCommandLineParser &parser);
    void applyCommandLine(const QCommandLineParser &parser);
};
