#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <memory>
#include "EncoderEngine.h"

struct FfmpegEngineOptions {
    QString ffmpegPath;     // empty = look up "ffmpeg" in PATH
    QString workDirRoot;    // empty = system temp directory
    int execTimeoutMs = 0;  // 0 = wait for ffmpeg indefinitely
};

// EncoderEngine backed by an installed ffmpeg executable. Artifacts live in a
// private temporary directory that is removed with the engine.
class FfmpegEngine : public EncoderEngine {
public:
    explicit FfmpegEngine(const FfmpegEngineOptions& options = FfmpegEngineOptions());
    ~FfmpegEngine() override;

    bool load() override;
    bool isLoaded() const override { return m_loaded; }

    bool writeFile(const QString& name, const QByteArray& data) override;
    bool readFile(const QString& name, EngineFileData& out) override;
    bool deleteFile(const QString& name) override;
    bool exec(const QStringList& args) override;

    QString ffmpegPath() const { return m_resolvedPath; }
    QString version() const { return m_version; }
    QString workDir() const;

    // Plain file names only; anything that could leave the work directory is refused.
    static bool isValidArtifactName(const QString& name);

private:
    QString artifactPath(const QString& name) const;
    bool checkArtifact(const QString& name);
    void consumeLog(QByteArray& pending, const QByteArray& chunk, bool flush);

    FfmpegEngineOptions m_options;
    QString m_resolvedPath;
    QString m_version;
    std::unique_ptr<QTemporaryDir> m_workDir;
    QStringList m_logTail;
    bool m_loaded = false;

    static constexpr int LogTailLines = 8;
    static constexpr int StartTimeoutMs = 10000;
};
