#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QJsonObject>

struct AppSettings {
    QString ffmpegPath;          // empty = look up "ffmpeg" on PATH
    QString workDirRoot;         // empty = system temp location
    QStringList fontFamilies = defaultFontFamilies();
    QStringList fontFiles;       // registered with the font database before rendering
    int execTimeoutMs = 0;       // 0 = no limit
    QString logRules;            // QLoggingCategory filter rules

    static QStringList defaultFontFamilies();
};

class AppConfig : public QObject {
    Q_OBJECT
public:
    explicit AppConfig(QObject* parent = nullptr);
    ~AppConfig();

    bool load(const QString& filePath, AppSettings& settings);

    static QJsonObject toJson(const AppSettings& settings);
    static AppSettings fromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
