#include "EncodeOrchestrator.h"
#include "Logging.h"
#include <QMutexLocker>
#include <variant>

const char* encodeJobStateName(EncodeJobState state) {
    switch (state) {
    case EncodeJobState::Idle: return "Idle";
    case EncodeJobState::Preparing: return "Preparing";
    case EncodeJobState::Encoding: return "Encoding";
    case EncodeJobState::Completed: return "Completed";
    case EncodeJobState::Failed: return "Failed";
    }
    return "Unknown";
}

// --- StagedArtifacts ---

StagedArtifacts::StagedArtifacts(EncoderEngine& engine) : m_engine(engine) {}

StagedArtifacts::~StagedArtifacts() {
    for (const QString& name : m_names) {
        if (!m_engine.deleteFile(name)) {
            qCWarning(lcEncode) << "Cleanup of" << name << "failed:" << m_engine.errorString();
        }
    }
}

void StagedArtifacts::track(const QString& name) {
    if (!m_names.contains(name)) m_names.append(name);
}

// --- EncodeOrchestrator ---

EncodeOrchestrator::EncodeOrchestrator(EncoderEngine& engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{}

EncodeOrchestrator::~EncodeOrchestrator() = default;

bool EncodeOrchestrator::validate(const EncodeRequest& request, QString& error) {
    if (request.frame.isEmpty()) {
        error = "No frame to encode";
        return false;
    }
    if (request.durationSeconds < AppConstants::MinDurationSeconds ||
        request.durationSeconds > AppConstants::MaxDurationSeconds) {
        error = QString("Duration %1 s is outside %2-%3 s")
            .arg(request.durationSeconds)
            .arg(AppConstants::MinDurationSeconds)
            .arg(AppConstants::MaxDurationSeconds);
        return false;
    }
    if (request.frameRate != AppConstants::FrameRate ||
        request.resolution != QSize(AppConstants::VideoWidth, AppConstants::VideoHeight)) {
        error = "Only 1280x720 at 30 fps is supported";
        return false;
    }
    return true;
}

QString EncodeOrchestrator::buildVideoFilter(int totalFrames, QSize resolution) {
    const QString zoompan = QString(
        "zoompan=z='min(zoom+0.0015,1.3)':x='(iw-iw/zoom)/2':y='(ih-ih/zoom)/2'"
        ":d=%1:s=%2x%3")
        .arg(totalFrames)
        .arg(resolution.width())
        .arg(resolution.height());
    return zoompan + ",format=yuv420p";
}

QStringList EncodeOrchestrator::buildArguments(const EncodeRequest& request,
                                               const QString& audioArtifact) {
    QStringList args{
        "-loop", "1",
        "-framerate", QString::number(request.frameRate),
        "-i", AppConstants::FrameArtifact,
    };

    if (request.hasAudio()) {
        args << "-i" << audioArtifact;
    }

    args << "-t" << QString::number(request.durationSeconds)
         << "-vf" << buildVideoFilter(request.totalFrames(), request.resolution)
         << "-c:v" << "libx264"
         << "-preset" << "veryfast"
         << "-pix_fmt" << "yuv420p";

    if (request.hasAudio()) {
        args << "-shortest" << "-c:a" << "aac" << "-b:a" << "192k";
    }

    args << AppConstants::OutputArtifact;
    return args;
}

QString EncodeOrchestrator::audioArtifactName(const QString& mimeType) {
    const QString mime = mimeType.trimmed().toLower();
    if (mime == "audio/wav" || mime == "audio/x-wav" || mime == "audio/wave") return "audio.wav";
    if (mime == "audio/aac") return "audio.aac";
    if (mime == "audio/mp4" || mime == "audio/x-m4a") return "audio.m4a";
    if (mime == "audio/ogg") return "audio.ogg";
    if (mime == "audio/flac" || mime == "audio/x-flac") return "audio.flac";
    if (mime == "audio/webm") return "audio.webm";
    return AppConstants::DefaultAudioArtifact;
}

void EncodeOrchestrator::setState(EncodeJobState state) {
    if (m_state == state) return;
    m_state = state;
    qCDebug(lcEncode) << "Job state:" << encodeJobStateName(state);
    emit stateChanged(state);
}

bool EncodeOrchestrator::encode(const EncodeRequest& request, QByteArray& video) {
    video.clear();
    m_error = PipelineError::None;
    m_errorString.clear();

    QString invalid;
    if (!validate(request, invalid)) {
        m_error = PipelineError::InvalidInput;
        m_errorString = invalid;
        qCWarning(lcEncode) << "Rejected encode request:" << invalid;
        return false;
    }

    // Artifact names are fixed, so jobs take turns on the engine
    QMutexLocker jobLock(&m_engine.jobMutex());

    bool ok = false;
    {
        StagedArtifacts artifacts(m_engine);
        ok = runJob(request, video, artifacts);
        if (!ok) {
            video.clear();
            setState(EncodeJobState::Failed);
        }
    }
    setState(EncodeJobState::Idle);

    if (!ok) {
        m_error = PipelineError::Encode;
        qCWarning(lcEncode) << "Encode failed:" << m_errorString;
        return false;
    }

    qCInfo(lcEncode) << "Encoded" << request.durationSeconds << "s video,"
                     << video.size() << "bytes" << (request.hasAudio() ? "with audio" : "without audio");
    return true;
}

bool EncodeOrchestrator::runJob(const EncodeRequest& request, QByteArray& video,
                                StagedArtifacts& artifacts) {
    setState(EncodeJobState::Preparing);

    // Deletion order: frame, output, then audio if staged
    artifacts.track(AppConstants::FrameArtifact);
    artifacts.track(AppConstants::OutputArtifact);

    if (!m_engine.writeFile(AppConstants::FrameArtifact, request.frame)) {
        m_errorString = QString("Staging frame failed: %1").arg(m_engine.errorString());
        return false;
    }

    QString audioArtifact;
    if (request.hasAudio()) {
        audioArtifact = audioArtifactName(request.audioMimeType);
        artifacts.track(audioArtifact);
        if (!m_engine.writeFile(audioArtifact, request.audio)) {
            m_errorString = QString("Staging audio failed: %1").arg(m_engine.errorString());
            return false;
        }
    }

    setState(EncodeJobState::Encoding);
    const QStringList args = buildArguments(request, audioArtifact);

    ProgressReporter reporter(request.totalFrames(),
        [this](const ProgressUpdate& update) { emit progress(update); });

    bool execOk = false;
    {
        LogSubscription subscription(m_engine,
            [&reporter](const QString& line) { reporter.handleLogLine(line); });
        execOk = m_engine.exec(args);
    }
    if (!execOk) {
        m_errorString = QString("Encoder invocation failed: %1").arg(m_engine.errorString());
        return false;
    }

    setState(EncodeJobState::Completed);

    EngineFileData output;
    if (!m_engine.readFile(AppConstants::OutputArtifact, output)) {
        m_errorString = QString("Reading output failed: %1").arg(m_engine.errorString());
        return false;
    }
    if (std::holds_alternative<QString>(output)) {
        m_errorString = "Encoder returned text where video data was expected";
        return false;
    }

    video = std::get<QByteArray>(output);
    if (video.isEmpty()) {
        m_errorString = "Encoder produced an empty output file";
        return false;
    }
    return true;
}
