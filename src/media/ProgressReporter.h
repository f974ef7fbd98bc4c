#pragma once

#include <QMetaType>
#include <QString>
#include <functional>
#include "EncoderEngine.h"

struct ProgressUpdate {
    QString line;           // raw encoder line, e.g. "frame=  120 fps= 30 ..."
    int frame = -1;         // -1 if the line carried no frame number
    double fraction = 0.0;  // 0.0 to 1.0
};
Q_DECLARE_METATYPE(ProgressUpdate)

// Filters encoder log lines down to frame progress and forwards them.
class ProgressReporter {
public:
    using Callback = std::function<void(const ProgressUpdate&)>;

    ProgressReporter(int totalFrames, Callback callback);

    void handleLogLine(const QString& line);
    int forwardedCount() const { return m_forwarded; }

    static bool isProgressLine(const QString& line);
    static int parseFrameNumber(const QString& line);

private:
    int m_totalFrames;
    Callback m_callback;
    int m_forwarded = 0;
};

// Keeps a log listener registered on an engine for exactly its own lifetime.
class LogSubscription {
public:
    LogSubscription(EncoderEngine& engine, EncoderEngine::LogHandler handler);
    ~LogSubscription();

    LogSubscription(const LogSubscription&) = delete;
    LogSubscription& operator=(const LogSubscription&) = delete;

private:
    EncoderEngine& m_engine;
    int m_id;
};
