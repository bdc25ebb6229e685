#pragma once

#include <QString>

struct ModelInfo
{
    QString name;
    QString category;
    QString description;

    QString toDisplayText() const;

    static ModelInfo captioning(const QString &model);
    static ModelInfo speech(const QString &model);
};
