#pragma once

#include "pipelines.h"

#include <QByteArray>
#include <QJsonValue>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

class QNetworkRequest;

struct HttpReply
{
    int status = 0;
    // media type without parameters, lower case
    QByteArray mimeType;
    QByteArray body;
};

/**
 * Talks to the Hugging Face inference HTTP API.
 *
 * Requests are awaited in a local event loop so callers see a plain
 * blocking call. User input is not processed while waiting.
 */
class HuggingFaceClient
{
public:
    HuggingFaceClient(const QUrl &endpoint, const QString &token, int timeoutMs = 0);

    QUrl modelUrl(const QString &model) const;

    // throws InferenceError when the service cannot be reached
    HttpReply send(const QString &model, const QByteArray &contentType, const QByteArray &accept, const QByteArray &body);

    // send() expecting JSON back, throws InferenceError or FormatError
    QJsonValue post(const QString &model, const QByteArray &contentType, const QByteArray &body);

    /**
     * Turns an HTTP status and body into the decoded JSON result.
     * Non-2xx statuses throw InferenceError, bodies that are not JSON
     * throw FormatError.
     */
    static QJsonValue parseReply(int status, const QByteArray &body);

private:
    QNetworkRequest createRequest(const QString &model, const QByteArray &contentType, const QByteArray &accept) const;

    QUrl m_endpoint;
    QString m_token;
    int m_timeoutMs;
    QNetworkAccessManager m_network;
};

class HuggingFaceImageToText : public ImageToTextPipeline
{
public:
    HuggingFaceImageToText(HuggingFaceClient &client, const QString &model);
    QString model() const override;
    QJsonValue run(const QImage &image) override;

private:
    HuggingFaceClient &m_client;
    QString m_model;
};

/**
 * The hosted API answers with encoded audio (FLAC or WAV), inference
 * endpoints running the transformers pipeline answer with JSON. Both are
 * returned as an {"audio", "sampling_rate"} record.
 */
class HuggingFaceTextToAudio : public TextToAudioPipeline
{
public:
    HuggingFaceTextToAudio(HuggingFaceClient &client, const QString &model);
    QString model() const override;
    QJsonValue run(const QString &text) override;

    // throws InferenceError for error statuses, FormatError for undecodable bodies
    static QJsonValue parseReply(const HttpReply &reply);

private:
    HuggingFaceClient &m_client;
    QString m_model;
};
