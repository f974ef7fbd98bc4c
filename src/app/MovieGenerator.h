#pragma once

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include "AppConstants.h"
#include "FrameCompositor.h"
#include "PipelineError.h"
#include "ProgressReporter.h"

class EngineProvider;

struct MovieRequest {
    QByteArray image;
    QString imageMimeType;
    QByteArray audio;            // optional
    QString audioMimeType;
    QString text;
    QString accentColor = AppConstants::DefaultAccentColor;
    int durationSeconds = AppConstants::DefaultDurationSeconds;
};

enum class GenerationStage {
    Idle,
    Loading,     // engine acquisition, decode and composition
    Rendering,   // encoder running
    Ready,
    Error
};

const char* generationStageName(GenerationStage stage);

// One photo (+ audio, + caption) in, one MP4 out.
class MovieGenerator : public QObject {
    Q_OBJECT
public:
    MovieGenerator(EngineProvider& provider,
                   const QStringList& fontFamilies = QStringList(),
                   const QStringList& fontFiles = QStringList(),
                   QObject* parent = nullptr);
    ~MovieGenerator();

    bool generate(const MovieRequest& request, QByteArray& video);

    GenerationStage stage() const { return m_stage; }
    PipelineError error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    QString userMessage() const { return PipelineErrors::userMessage(m_error); }

    // Frame handed to the encoder by the last generate() call that got that far
    const CompositedFrame& lastFrame() const { return m_lastFrame; }

    // Configured families, preceded by those provided by the registered font files
    QStringList fontFamilies() const { return m_fontFamilies; }

signals:
    void stageChanged(GenerationStage stage);
    void statusMessage(const QString& message);
    void progress(const ProgressUpdate& update);

private:
    bool fail(PipelineError error, const QString& cause);
    void setStage(GenerationStage stage);
    void registerFonts();

    EngineProvider& m_provider;
    QStringList m_fontFamilies;
    QStringList m_fontFiles;
    bool m_fontsRegistered = false;

    GenerationStage m_stage = GenerationStage::Idle;
    PipelineError m_error = PipelineError::None;
    QString m_errorString;
    CompositedFrame m_lastFrame;
};
