#include "MovieGenerator.h"
#include "CaptionOverlay.h"
#include "EncodeOrchestrator.h"
#include "EngineProvider.h"
#include "ImageNormalizer.h"
#include "ImageUtil.h"
#include "Logging.h"
#include "SourceImage.h"

const char* generationStageName(GenerationStage stage) {
    switch (stage) {
    case GenerationStage::Idle: return "Idle";
    case GenerationStage::Loading: return "Loading";
    case GenerationStage::Rendering: return "Rendering";
    case GenerationStage::Ready: return "Ready";
    case GenerationStage::Error: return "Error";
    }
    return "Unknown";
}

MovieGenerator::MovieGenerator(EngineProvider& provider,
                               const QStringList& fontFamilies,
                               const QStringList& fontFiles,
                               QObject* parent)
    : QObject(parent)
    , m_provider(provider)
    , m_fontFamilies(fontFamilies)
    , m_fontFiles(fontFiles)
{}

MovieGenerator::~MovieGenerator() = default;

void MovieGenerator::setStage(GenerationStage stage) {
    if (m_stage == stage) return;
    m_stage = stage;
    emit stageChanged(stage);
}

bool MovieGenerator::fail(PipelineError error, const QString& cause) {
    m_error = error;
    m_errorString = cause;
    qCWarning(lcApp) << PipelineErrors::name(error) << "-" << cause;
    setStage(GenerationStage::Error);
    emit statusMessage(PipelineErrors::userMessage(error));
    return false;
}

void MovieGenerator::registerFonts() {
    if (m_fontsRegistered) return;
    m_fontsRegistered = true;

    const QStringList provided = CaptionOverlay::registerFontFiles(m_fontFiles);
    for (int i = provided.size() - 1; i >= 0; --i) {
        if (!m_fontFamilies.contains(provided[i])) m_fontFamilies.prepend(provided[i]);
    }
}

bool MovieGenerator::generate(const MovieRequest& request, QByteArray& video) {
    video.clear();
    m_error = PipelineError::None;
    m_errorString.clear();

    if (request.image.isEmpty()) {
        return fail(PipelineError::InputMissing, "No image supplied");
    }

    OverlaySpec overlay;
    overlay.text = request.text.trimmed();
    if (!ImageUtil::parseAccentColor(request.accentColor, overlay.accentColor)) {
        return fail(PipelineError::InvalidInput,
                    QString("Accent color '%1' is not #rrggbb").arg(request.accentColor));
    }
    if (request.durationSeconds < AppConstants::MinDurationSeconds ||
        request.durationSeconds > AppConstants::MaxDurationSeconds) {
        return fail(PipelineError::InvalidInput,
                    QString("Duration %1 s is outside %2-%3 s")
                        .arg(request.durationSeconds)
                        .arg(AppConstants::MinDurationSeconds)
                        .arg(AppConstants::MaxDurationSeconds));
    }

    setStage(GenerationStage::Loading);
    emit statusMessage("Preparing files...");

    EncoderEngine* engine = m_provider.acquire();
    if (!engine) {
        return fail(PipelineError::EngineLoad, m_provider.errorString());
    }

    registerFonts();
    overlay.fontFamilies = m_fontFamilies;

    ImageNormalizer normalizer;
    std::unique_ptr<SourceImage> source = normalizer.normalize(request.image, request.imageMimeType);
    if (!source) {
        return fail(PipelineError::ImageDecode, normalizer.errorString());
    }

    FrameCompositor compositor;
    CompositedFrame frame;
    if (!compositor.compose(*source, overlay, frame)) {
        return fail(PipelineError::Render, compositor.errorString());
    }
    source.reset();
    m_lastFrame = frame;

    setStage(GenerationStage::Rendering);
    emit statusMessage("Rendering video...");

    EncodeRequest encodeRequest;
    encodeRequest.frame = frame.png;
    encodeRequest.audio = request.audio;
    encodeRequest.audioMimeType = request.audioMimeType;
    encodeRequest.durationSeconds = request.durationSeconds;

    EncodeOrchestrator orchestrator(*engine);
    connect(&orchestrator, &EncodeOrchestrator::progress, this, [this](const ProgressUpdate& update) {
        emit progress(update);
        emit statusMessage(QString("Render progress: %1").arg(update.line));
    });

    if (!orchestrator.encode(encodeRequest, video)) {
        return fail(orchestrator.error(), orchestrator.errorString());
    }

    setStage(GenerationStage::Ready);
    emit statusMessage("The video is ready.");
    qCInfo(lcApp) << "Generated" << video.size() << "byte movie"
                  << (frame.hasOverlay ? QString("with %1 caption line(s)").arg(frame.caption.lineCount())
                                       : QString("without caption"));
    return true;
}
