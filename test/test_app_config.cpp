#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "app/AppConfig.h"
#include "util/Logging.h"

static QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& content) {
    const QString path = dir.filePath(name);
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write(content);
    return path;
}

void test_defaults() {
    AppSettings settings;
    assert(settings.ffmpegPath.isEmpty());
    assert(settings.execTimeoutMs == 0);
    assert(settings.fontFamilies.size() == 4);
    assert(settings.fontFamilies.first() == "Vazirmatn");
    assert(settings.fontFamilies.last() == "sans-serif");

    AppSettings fromEmpty = AppConfig::fromJson(QJsonObject());
    assert(fromEmpty.fontFamilies == AppSettings::defaultFontFamilies());
    assert(fromEmpty.fontFiles.isEmpty());
    printf("PASS: test_defaults\n");
}

void test_load_file() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = writeFile(dir, "photoreel.json", R"({
        "ffmpegPath": "/opt/ffmpeg/bin/ffmpeg",
        "fontFamilies": ["Noto Naskh Arabic", " ", "DejaVu Sans"],
        "fontFiles": ["/usr/share/fonts/Vazirmatn.ttf"],
        "execTimeoutMs": 60000,
        "logRules": "photoreel.engine.debug=true"
    })");

    AppConfig config;
    AppSettings settings;
    assert(config.load(path, settings));
    assert(settings.ffmpegPath == "/opt/ffmpeg/bin/ffmpeg");
    assert(settings.workDirRoot.isEmpty());
    assert((settings.fontFamilies == QStringList{"Noto Naskh Arabic", "DejaVu Sans"}));
    assert(settings.fontFiles.size() == 1);
    assert(settings.execTimeoutMs == 60000);
    assert(settings.logRules == "photoreel.engine.debug=true");
    printf("PASS: test_load_file\n");
}

void test_dumped_config_loads_back() {
    QTemporaryDir dir;
    AppSettings settings;
    settings.workDirRoot = dir.path();
    settings.fontFamilies = {"IRANSans"};
    settings.execTimeoutMs = 1500;

    // Same JSON the CLI prints for --dump-config
    const QString path = writeFile(dir, "dumped.json",
                                   QJsonDocument(AppConfig::toJson(settings)).toJson());

    AppConfig config;
    AppSettings loaded;
    assert(config.load(path, loaded));
    assert(loaded.workDirRoot == dir.path());
    assert(loaded.fontFamilies == QStringList{"IRANSans"});
    assert(loaded.execTimeoutMs == 1500);
    printf("PASS: test_dumped_config_loads_back\n");
}

void test_rejects_bad_files() {
    QTemporaryDir dir;
    AppConfig config;
    AppSettings settings;
    settings.ffmpegPath = "unchanged";

    assert(!config.load(dir.filePath("missing.json"), settings));
    assert(config.errorString().startsWith("Cannot read"));

    assert(!config.load(writeFile(dir, "broken.json", "{ \"ffmpegPath\": "), settings));
    assert(config.errorString().contains("Invalid config"));

    assert(!config.load(writeFile(dir, "array.json", "[1, 2, 3]"), settings));

    assert(!config.load(writeFile(dir, "negative.json", R"({"execTimeoutMs": -5})"), settings));
    assert(config.errorString().contains("execTimeoutMs"));

    assert(settings.ffmpegPath == "unchanged");
    printf("PASS: test_rejects_bad_files\n");
}

void test_log_rules() {
    Logging::applyRules(QString(), false);
    assert(!lcEncode().isDebugEnabled());
    assert(lcEncode().isInfoEnabled());

    Logging::applyRules("photoreel.engine.debug=true", false);
    assert(lcEngine().isDebugEnabled());
    assert(!lcImage().isDebugEnabled());

    Logging::applyRules(QString(), true);
    assert(lcImage().isDebugEnabled());
    assert(lcApp().isDebugEnabled());
    printf("PASS: test_log_rules\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_defaults();
    test_load_file();
    test_dumped_config_loads_back();
    test_rejects_bad_files();
    test_log_rules();
    printf("All app config tests passed.\n");
    return 0;
}
