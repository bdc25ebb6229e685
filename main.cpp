#include "appconfig.h"
#include "filelauncher.h"
#include "huggingface.h"
#include "mainwindow.h"
#include "modelrunner.h"

#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QSettings>
#include <QtWidgets/QApplication>

int main(int argc, char **argv)
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("captionspeak"));
    QCoreApplication::setApplicationName(QStringLiteral("captionspeak"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CAPTIONSPEAK_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Caption images and speak text with Hugging Face models"));
    parser.addHelpOption();
    parser.addVersionOption();
    AppConfig::addOptions(parser);
    parser.process(app);

    QSettings settings;
    AppConfig config = AppConfig::load(settings, QProcessEnvironment::systemEnvironment());
    config.applyCommandLine(parser);

    HuggingFaceClient client(config.endpoint, config.token, config.timeoutMs);
    HuggingFaceImageToText captioner(client, config.captionModel);
    HuggingFaceTextToAudio speaker(client, config.speechModel);
    DesktopFileLauncher launcher;

    ModelRunner runner(captioner, speaker, launcher);
    runner.setAudioDirectory(config.audioDirectory);
    runner.setAudioEncoding(config.audioEncoding);
    runner.setKeepAudioFiles(config.keepAudioFiles);

    MainWindow window(runner);
    window.show();

    return QCoreApplication::exec();
}
