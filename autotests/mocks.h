#pragma once

#include <gmock/gmock.h>

#include "filelauncher.h"
#include "pipelines.h"

#include <QImage>

class MockImageToText : public ImageToTextPipeline
{
public:
    MOCK_METHOD(QString, model, (), (const, override));
    MOCK_METHOD(QJsonValue, run, (const QImage &image), (override));
};

class MockTextToAudio : public TextToAudioPipeline
{
public:
    MOCK_METHOD(QString, model, (), (const, override));
    MOCK_METHOD(QJsonValue, run, (const QString &text), (override));
};

class MockFileLauncher : public FileLauncher
{
public:
    MOCK_METHOD(void, open, (const QString &path), (override));
};
