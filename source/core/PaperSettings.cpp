#include "PaperSettings.h"

#include <QDebug>
#include <QSettings>

static int positiveInt(const QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "[PaperSettings] Ignoring invalid" << key << "=" << settings.value(key);
        return fallback;
    }
    return value;
}

PaperSettings PaperSettings::load()
{
    QSettings settings;
    return load(settings);
}

PaperSettings PaperSettings::load(QSettings& settings)
{
    PaperSettings s;

    const QString layoutName = settings.value("encode/layout", layoutKindName(s.layout)).toString();
    if (!parseLayoutKind(layoutName, &s.layout)) {
        qWarning() << "[PaperSettings] Ignoring unknown layout" << layoutName;
        s.layout = LayoutKind::Single;
    }

    s.dpi = positiveInt(settings, "encode/dpi", s.dpi);
    s.threads = positiveInt(settings, "encode/threads", s.threads);
    s.infoPage = settings.value("encode/infoPage", s.infoPage).toBool();
    s.indexed = settings.value("encode/indexed", s.indexed).toBool();
    s.fetchTimeoutMs = positiveInt(settings, "fetch/timeoutMs", s.fetchTimeoutMs);
    s.imageTimeoutMs = positiveInt(settings, "fetch/imageTimeoutMs", s.imageTimeoutMs);

    return s;
}

void PaperSettings::save(QSettings& settings) const
{
    settings.setValue("encode/layout", layoutKindName(layout));
    settings.setValue("encode/dpi", dpi);
    settings.setValue("encode/threads", threads);
    settings.setValue("encode/infoPage", infoPage);
    settings.setValue("encode/indexed", indexed);
    settings.setValue("fetch/timeoutMs", fetchTimeoutMs);
    settings.setValue("fetch/imageTimeoutMs", imageTimeoutMs);
}
