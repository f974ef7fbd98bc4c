#include "ProgressReporter.h"
#include <QRegularExpression>
#include <QtGlobal>
#include <utility>

namespace {
constexpr const char* ProgressMarker = "frame=";
}

ProgressReporter::ProgressReporter(int totalFrames, Callback callback)
    : m_totalFrames(totalFrames)
    , m_callback(std::move(callback))
{}

bool ProgressReporter::isProgressLine(const QString& line) {
    return line.startsWith(ProgressMarker);
}

int ProgressReporter::parseFrameNumber(const QString& line) {
    static const QRegularExpression re(R"(^frame=\s*(\d+))");
    auto match = re.match(line);
    if (!match.hasMatch()) return -1;

    bool ok = false;
    int frame = match.captured(1).toInt(&ok);
    return ok ? frame : -1;
}

void ProgressReporter::handleLogLine(const QString& line) {
    if (!isProgressLine(line)) return;

    ProgressUpdate update;
    update.line = line;
    update.frame = parseFrameNumber(line);
    if (update.frame >= 0 && m_totalFrames > 0) {
        update.fraction = qBound(0.0, static_cast<double>(update.frame) / m_totalFrames, 1.0);
    }

    ++m_forwarded;
    if (m_callback) m_callback(update);
}

LogSubscription::LogSubscription(EncoderEngine& engine, EncoderEngine::LogHandler handler)
    : m_engine(engine)
    , m_id(engine.addLogListener(std::move(handler)))
{}

LogSubscription::~LogSubscription() {
    m_engine.removeLogListener(m_id);
}
