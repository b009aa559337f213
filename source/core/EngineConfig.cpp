#include "EngineConfig.h"

#include <QDebug>

QJsonObject StoreConfig::toJson() const
{
    QJsonObject obj;
    obj["eraser_min_split_segments"] = eraserMinSplitSegments;
    obj["history_max_len"] = historyMaxLen;
    return obj;
}

StoreConfig StoreConfig::fromJson(const QJsonObject& obj)
{
    StoreConfig config;
    config.eraserMinSplitSegments = qMax(1, obj["eraser_min_split_segments"].toInt(2));
    config.historyMaxLen = obj["history_max_len"].toInt(100);
    if (config.historyMaxLen < 1) {
        qWarning() << "StoreConfig::fromJson: invalid history length" << config.historyMaxLen;
        config.historyMaxLen = 100;
    }
    return config;
}

QJsonObject RenderConfig::toJson() const
{
    QJsonObject obj;
    obj["viewport_margin_factor"] = viewportMarginFactor;
    obj["rerender_threshold"] = rerenderThreshold;
    obj["image_scale_tolerance"] = imageScaleTolerance;
    return obj;
}

RenderConfig RenderConfig::fromJson(const QJsonObject& obj)
{
    RenderConfig config;
    config.viewportMarginFactor = qMax(0.0, obj["viewport_margin_factor"].toDouble(0.4));
    config.rerenderThreshold = qBound(0.0, obj["rerender_threshold"].toDouble(0.7), 1.0);
    config.imageScaleTolerance = qMax(0.0, obj["image_scale_tolerance"].toDouble(0.01));
    return config;
}
