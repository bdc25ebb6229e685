#include "modelinfo.h"

#include <QCoreApplication>

QString ModelInfo::toDisplayText() const
{
    return QCoreApplication::translate("ModelInfo", "Model Name: %1\nCategory: %2\nShort Description: %3")
        .arg(name, category, description);
}

ModelInfo ModelInfo::captioning(const QString &model)
{
    return {model, QStringLiteral("Vision"), QStringLiteral("BLIP image captioning model.")};
}

ModelInfo ModelInfo::speech(const QString &model)
{
    return {model, QStringLiteral("Audio"), QStringLiteral("Neural text-to-speech model.")};
}
