#include "appconfig.h"

#include "logging.h"

#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QSettings>

static QUrl parseEndpoint(const QString &value, const QUrl &fallback)
{
    const QUrl url(value, QUrl::StrictMode);
    if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty()) {
        qCWarning(CAPTIONSPEAK_RUNNER) << "Ignoring invalid inference endpoint" << value;
        return fallback;
    }
    return url;
}

AppConfig AppConfig::load(const QSettings &settings, const QProcessEnvironment &environment)
{
    AppConfig config;

    if (settings.contains(QStringLiteral("inference/endpoint"))) {
        config.endpoint = parseEndpoint(settings.value(QStringLiteral("inference/endpoint")).toString(), config.endpoint);
    }
    config.token = settings.value(QStringLiteral("inference/token"), config.token).toString();

    bool ok = false;
    const int timeout = settings.value(QStringLiteral("inference/timeoutMs"), config.timeoutMs).toInt(&ok);
    if (ok && timeout >= 0) {
        config.timeoutMs = timeout;
    } else {
        qCWarning(CAPTIONSPEAK_RUNNER) << "Ignoring invalid inference/timeoutMs" << settings.value(QStringLiteral("inference/timeoutMs"));
    }

    config.captionModel = settings.value(QStringLiteral("models/caption"), config.captionModel).toString();
    config.speechModel = settings.value(QStringLiteral("models/speech"), config.speechModel).toString();
    config.audioDirectory = settings.value(QStringLiteral("audio/directory")).toString();
    config.keepAudioFiles = settings.value(QStringLiteral("audio/keepFiles"), config.keepAudioFiles).toBool();

    const QString encoding = settings.value(QStringLiteral("audio/sampleFormat"), QStringLiteral("float")).toString();
    if (encoding == QLatin1String("int16")) {
        config.audioEncoding = WavWriter::Encoding::Int16;
    } else if (encoding != QLatin1String("float")) {
        qCWarning(CAPTIONSPEAK_RUNNER) << "Unknown audio/sampleFormat" << encoding << "- using float";
    }

    const QString envToken = environment.value(QStringLiteral("HF_TOKEN"));
    if (!envToken.isEmpty()) {
        config.token = envToken;
    }

    return config;
}

void AppConfig::addOptions(QCommandLineParser &parser)
{
    parser.addOptions({
        {QStringLiteral("endpoint"), QStringLiteral("Base URL of the inference API."), QStringLiteral("url")},
        {QStringLiteral("token"), QStringLiteral("Hugging Face access token."), QStringLiteral("token")},
        {QStringLiteral("caption-model"), QStringLiteral("Image captioning model id."), QStringLiteral("model")},
        {QStringLiteral("speech-model"), QStringLiteral("Text-to-speech model id."), QStringLiteral("model")},
        {QStringLiteral("keep-audio"), QStringLiteral("Keep generated audio files on exit.")},
    });
}

void AppConfig::applyCommandLine(const QCommandLineParser &parser)
{
    if (parser.isSet(QStringLiteral("endpoint"))) {
        endpoint = parseEndpoint(parser.value(QStringLiteral("endpoint")), endpoint);
    }
    if (parser.isSet(QStringLiteral("token"))) {
        token = parser.value(QStringLiteral("token"));
    }
    if (parser.isSet(QStringLiteral("caption-model"))) {
        captionModel = parser.value(QStringLiteral("caption-model"));
    }
    if (parser.isSet(QStringLiteral("speech-model"))) {
        speechModel = parser.value(QStringLiteral("speech-model"));
    }
    if (parser.isSet(QStringLiteral("keep-audio"))) {
        keepAudioFiles = true;
    }
}
