#include <QGuiApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QMimeDatabase>
#include <QSaveFile>
#include <cstdio>
#include <memory>
#include "AppConfig.h"
#include "AppConstants.h"
#include "EngineProvider.h"
#include "FfmpegEngine.h"
#include "Logging.h"
#include "MediaProbe.h"
#include "MovieGenerator.h"

namespace {

bool readInput(const QString& path, QByteArray& data, QString& mimeType) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCCritical(lcApp) << "Cannot read" << path << ":" << file.errorString();
        return false;
    }
    data = file.readAll();
    mimeType = QMimeDatabase().mimeTypeForFileNameAndData(path, data).name();
    return true;
}

bool writeOutput(const QString& path, const QByteArray& data) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCCritical(lcApp) << "Cannot write" << path << ":" << file.errorString();
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        qCCritical(lcApp) << "Writing" << path << "failed:" << file.errorString();
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Rendering only, no windows
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    Logging::installMessagePattern();

    QCommandLineParser parser;
    parser.setApplicationDescription("Turns a photo, an optional audio clip and a caption into a short MP4.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption imageOpt("image", "Input photo.", "file");
    QCommandLineOption audioOpt("audio", "Optional audio track.", "file");
    QCommandLineOption textOpt("text", "Caption shown at the bottom of the video.", "caption");
    QCommandLineOption colorOpt("color", "Caption outline color (#rrggbb).", "color",
                                AppConstants::DefaultAccentColor);
    QCommandLineOption durationOpt("duration",
                                   QString("Video length in seconds (%1-%2).")
                                       .arg(AppConstants::MinDurationSeconds)
                                       .arg(AppConstants::MaxDurationSeconds),
                                   "seconds", QString::number(AppConstants::DefaultDurationSeconds));
    QCommandLineOption outputOpt("output", "Output MP4 file.", "file", AppConstants::DefaultOutputName);
    QCommandLineOption configOpt("config", "JSON settings file.", "file");
    QCommandLineOption ffmpegOpt("ffmpeg", "ffmpeg executable to use.", "path");
    QCommandLineOption fontOpt("font", "Font file to register (repeatable).", "file");
    QCommandLineOption verboseOpt("verbose", "Enable debug logging.");
    QCommandLineOption dumpConfigOpt("dump-config", "Print the effective settings as JSON and exit.");

    parser.addOptions({imageOpt, audioOpt, textOpt, colorOpt, durationOpt, outputOpt,
                       configOpt, ffmpegOpt, fontOpt, verboseOpt, dumpConfigOpt});
    parser.process(app);

    AppSettings settings;
    if (parser.isSet(configOpt)) {
        AppConfig config;
        if (!config.load(parser.value(configOpt), settings)) {
            std::fprintf(stderr, "%s\n", qPrintable(config.errorString()));
            return 1;
        }
    }
    if (parser.isSet(ffmpegOpt)) settings.ffmpegPath = parser.value(ffmpegOpt);
    if (parser.isSet(fontOpt)) settings.fontFiles += parser.values(fontOpt);

    Logging::applyRules(settings.logRules, parser.isSet(verboseOpt));

    if (parser.isSet(dumpConfigOpt)) {
        std::printf("%s", QJsonDocument(AppConfig::toJson(settings)).toJson().constData());
        return 0;
    }

    MovieRequest request;
    if (parser.isSet(imageOpt) &&
        !readInput(parser.value(imageOpt), request.image, request.imageMimeType)) {
        return 1;
    }
    if (parser.isSet(audioOpt) &&
        !readInput(parser.value(audioOpt), request.audio, request.audioMimeType)) {
        return 1;
    }
    request.text = parser.value(textOpt);
    request.accentColor = parser.value(colorOpt);

    bool ok = false;
    request.durationSeconds = parser.value(durationOpt).toInt(&ok);
    if (!ok) request.durationSeconds = -1;   // reported as invalid input

    FfmpegEngineOptions engineOptions;
    engineOptions.ffmpegPath = settings.ffmpegPath;
    engineOptions.workDirRoot = settings.workDirRoot;
    engineOptions.execTimeoutMs = settings.execTimeoutMs;

    EngineProvider provider([engineOptions]() -> std::unique_ptr<EncoderEngine> {
        return std::make_unique<FfmpegEngine>(engineOptions);
    });

    MovieGenerator generator(provider, settings.fontFamilies, settings.fontFiles);
    QObject::connect(&generator, &MovieGenerator::statusMessage, [](const QString& message) {
        qCInfo(lcApp).noquote() << message;
    });

    QByteArray video;
    if (!generator.generate(request, video)) {
        std::fprintf(stderr, "%s\n", qPrintable(generator.userMessage()));
        return 1;
    }

    const QString outputPath = parser.value(outputOpt);
    if (!writeOutput(outputPath, video)) {
        return 1;
    }

    MediaProbe probe;
    if (probe.probe(outputPath)) {
        qCInfo(lcApp).noquote() << "Wrote" << outputPath << "-" << probe.info().summary();
    } else {
        qCWarning(lcApp) << "Wrote" << outputPath << "but probing it failed:" << probe.errorString();
    }

    std::printf("%s\n", qPrintable(outputPath));
    return 0;
}
