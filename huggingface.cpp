#include "huggingface.h"

#include "audiodecoder.h"
#include "errors.h"
#include "logging.h"

#include <QBuffer>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopedPointer>

HuggingFaceClient::HuggingFaceClient(const QUrl &endpoint, const QString &token, int timeoutMs)
    : m_endpoint(endpoint)
    , m_token(token)
    , m_timeoutMs(timeoutMs)
{
}

QUrl HuggingFaceClient::modelUrl(const QString &model) const
{
    QUrl url = m_endpoint;
    QString path = url.path();
    if (!path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }
    url.setPath(path + QStringLiteral("models/") + model);
    return url;
}

QNetworkRequest HuggingFaceClient::createRequest(const QString &model, const QByteArray &contentType, const QByteArray &accept) const
{
    QNetworkRequest request(modelUrl(model));
    request.setHeader(QNetworkRequest::ContentTypeHeader, contentType);
    request.setRawHeader("Accept", accept);
    // load a cold model instead of failing with 503
    request.setRawHeader("x-wait-for-model", "true");
    if (!m_token.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + m_token.toUtf8());
    }
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    if (m_timeoutMs > 0) {
        request.setTransferTimeout(m_timeoutMs);
    }
    return request;
}

HttpReply HuggingFaceClient::send(const QString &model, const QByteArray &contentType, const QByteArray &accept, const QByteArray &body)
{
    const QNetworkRequest request = createRequest(model, contentType, accept);
    qCInfo(CAPTIONSPEAK_NETWORK) << "POST" << request.url() << body.size() << "bytes";

    QElapsedTimer bench;
    bench.start();

    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply(m_network.post(request, body));
    QEventLoop loop;
    QObject::connect(reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    qCInfo(CAPTIONSPEAK_NETWORK) << "Reply from" << model << "status" << status.toInt() << "after" << bench.elapsed() << "ms";

    if (!status.isValid()) {
        throw InferenceError(QStringLiteral("Could not reach %1: %2").arg(model, reply->errorString()));
    }

    HttpReply result;
    result.status = status.toInt();
    result.mimeType = reply->header(QNetworkRequest::ContentTypeHeader).toByteArray().split(';').first().trimmed().toLower();
    result.body = reply->readAll();
    return result;
}

QJsonValue HuggingFaceClient::post(const QString &model, const QByteArray &contentType, const QByteArray &body)
{
    const HttpReply reply = send(model, contentType, "application/json", body);
    return parseReply(reply.status, reply.body);
}

QJsonValue HuggingFaceClient::parseReply(int status, const QByteArray &body)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(body, &parseError);

    if (status < 200 || status >= 300) {
        QString message;
        if (document.isObject()) {
            message = document.object().value(QStringLiteral("error")).toString();
        }
        if (message.isEmpty()) {
            message = QString::fromUtf8(body.left(200)).trimmed();
        }
        throw InferenceError(QStringLiteral("Inference request failed with HTTP %1: %2").arg(status).arg(message));
    }

    if (parseError.error != QJsonParseError::NoError) {
        throw FormatError(QStringLiteral("Model reply is not JSON: %1").arg(parseError.errorString()));
    }
    if (document.isArray()) {
        return document.array();
    }
    return document.object();
}

HuggingFaceImageToText::HuggingFaceImageToText(HuggingFaceClient &client, const QString &model)
    : m_client(client)
    , m_model(model)
{
}

QString HuggingFaceImageToText::model() const
{
    return m_model;
}

QJsonValue HuggingFaceImageToText::run(const QImage &image)
{
    QByteArray encoded;
    QBuffer buffer(&encoded);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        throw InferenceError(QStringLiteral("Could not encode the image for %1").arg(m_model));
    }
    return m_client.post(m_model, "image/png", encoded);
}

HuggingFaceTextToAudio::HuggingFaceTextToAudio(HuggingFaceClient &client, const QString &model)
    : m_client(client)
    , m_model(model)
{
}

QString HuggingFaceTextToAudio::model() const
{
    return m_model;
}

QJsonValue HuggingFaceTextToAudio::run(const QString &text)
{
    QJsonObject payload;
    payload.insert(QStringLiteral("inputs"), text);
    const HttpReply reply = m_client.send(m_model, "application/json", "audio/wav, audio/flac;q=0.9, audio/*;q=0.8, application/json;q=0.5",
                                          QJsonDocument(payload).toJson(QJsonDocument::Compact));
    return parseReply(reply);
}

QJsonValue HuggingFaceTextToAudio::parseReply(const HttpReply &reply)
{
    const bool success = reply.status >= 200 && reply.status < 300;
    const bool audio = reply.mimeType.startsWith("audio/") || AudioDecoder::isWav(reply.mimeType, reply.body);
    if (!success || !audio) {
        return HuggingFaceClient::parseReply(reply.status, reply.body);
    }

    const DecodedAudio decoded = AudioDecoder::decode(reply.mimeType, reply.body);
    qCInfo(CAPTIONSPEAK_NETWORK) << "Decoded" << decoded.samples.size() << "samples at" << decoded.sampleRate << "Hz from" << reply.mimeType;

    QJsonArray samples;
    for (float sample : decoded.samples) {
        samples.append(static_cast<double>(sample));
    }
    QJsonObject record;
    record.insert(QStringLiteral("audio"), samples);
    record.insert(QStringLiteral("sampling_rate"), decoded.sampleRate);
    return record;
}
