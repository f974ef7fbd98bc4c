#include "AppConfig.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

QJsonArray toJsonArray(const QStringList& list) {
    QJsonArray arr;
    for (const auto& s : list) arr.append(s);
    return arr;
}

QStringList fromJsonArray(const QJsonValue& value, const QStringList& fallback) {
    if (!value.isArray()) return fallback;
    QStringList list;
    for (const auto& v : value.toArray()) {
        const QString s = v.toString().trimmed();
        if (!s.isEmpty()) list << s;
    }
    return list;
}

} // namespace

QStringList AppSettings::defaultFontFamilies() {
    return {"Vazirmatn", "IRANSans", "Segoe UI", "sans-serif"};
}

AppConfig::AppConfig(QObject* parent) : QObject(parent) {}
AppConfig::~AppConfig() = default;

bool AppConfig::load(const QString& filePath, AppSettings& settings) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_error = QString("Invalid config %1: %2").arg(filePath, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_error = "Invalid config format";
        return false;
    }

    AppSettings loaded = fromJson(doc.object());
    if (loaded.execTimeoutMs < 0) {
        m_error = "execTimeoutMs must not be negative";
        return false;
    }

    settings = loaded;
    return true;
}

QJsonObject AppConfig::toJson(const AppSettings& settings) {
    QJsonObject obj;
    obj["ffmpegPath"] = settings.ffmpegPath;
    obj["workDirRoot"] = settings.workDirRoot;
    obj["fontFamilies"] = toJsonArray(settings.fontFamilies);
    obj["fontFiles"] = toJsonArray(settings.fontFiles);
    obj["execTimeoutMs"] = settings.execTimeoutMs;
    obj["logRules"] = settings.logRules;
    return obj;
}

AppSettings AppConfig::fromJson(const QJsonObject& obj) {
    AppSettings s;
    s.ffmpegPath = obj["ffmpegPath"].toString();
    s.workDirRoot = obj["workDirRoot"].toString();
    s.fontFamilies = fromJsonArray(obj["fontFamilies"], AppSettings::defaultFontFamilies());
    if (s.fontFamilies.isEmpty()) s.fontFamilies = AppSettings::defaultFontFamilies();
    s.fontFiles = fromJsonArray(obj["fontFiles"], {});
    s.execTimeoutMs = obj["execTimeoutMs"].toInt(0);
    s.logRules = obj["logRules"].toString();
    return s;
}
