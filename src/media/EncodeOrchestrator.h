#pragma once

#include <QObject>
#include <QByteArray>
#include <QSize>
#include <QString>
#include <QStringList>
#include "AppConstants.h"
#include "EncoderEngine.h"
#include "PipelineError.h"
#include "ProgressReporter.h"

enum class EncodeJobState {
    Idle,
    Preparing,   // staging frame (and audio) artifacts
    Encoding,    // encoder running
    Completed,
    Failed
};

const char* encodeJobStateName(EncodeJobState state);

struct EncodeRequest {
    QByteArray frame;           // composited PNG
    QByteArray audio;           // empty = silent video
    QString audioMimeType;
    int durationSeconds = AppConstants::DefaultDurationSeconds;
    int frameRate = AppConstants::FrameRate;
    QSize resolution{AppConstants::VideoWidth, AppConstants::VideoHeight};

    bool hasAudio() const { return !audio.isEmpty(); }
    int totalFrames() const { return durationSeconds * frameRate; }
};

// Deletes the artifacts of one job, in the order they were tracked, when the
// job leaves scope. Each deletion is attempted exactly once; failures are
// logged and never change the job outcome.
class StagedArtifacts {
public:
    explicit StagedArtifacts(EncoderEngine& engine);
    ~StagedArtifacts();

    StagedArtifacts(const StagedArtifacts&) = delete;
    StagedArtifacts& operator=(const StagedArtifacts&) = delete;

    void track(const QString& name);

private:
    EncoderEngine& m_engine;
    QStringList m_names;
};

// Runs one encode job on the engine: stage inputs, invoke, read output, clean up.
class EncodeOrchestrator : public QObject {
    Q_OBJECT
public:
    explicit EncodeOrchestrator(EncoderEngine& engine, QObject* parent = nullptr);
    ~EncodeOrchestrator();

    bool encode(const EncodeRequest& request, QByteArray& video);

    EncodeJobState state() const { return m_state; }
    PipelineError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    static bool validate(const EncodeRequest& request, QString& error);
    static QStringList buildArguments(const EncodeRequest& request, const QString& audioArtifact);
    static QString buildVideoFilter(int totalFrames, QSize resolution);
    static QString audioArtifactName(const QString& mimeType);

signals:
    void stateChanged(EncodeJobState state);
    void progress(const ProgressUpdate& update);

private:
    bool runJob(const EncodeRequest& request, QByteArray& video, StagedArtifacts& artifacts);
    void setState(EncodeJobState state);

    EncoderEngine& m_engine;
    EncodeJobState m_state = EncodeJobState::Idle;
    PipelineError m_error = PipelineError::None;
    QString m_errorString;
};
