#pragma once

#include <QMutex>
#include <QString>
#include <functional>
#include <memory>
#include "EncoderEngine.h"

// Lazily creates and loads the one shared encoder engine. The first caller
// loads it under the provider mutex; callers arriving meanwhile wait for that
// load instead of starting another. A failed load is retried on the next call.
class EngineProvider {
public:
    using Factory = std::function<std::unique_ptr<EncoderEngine>()>;

    explicit EngineProvider(Factory factory);
    ~EngineProvider();

    EngineProvider(const EngineProvider&) = delete;
    EngineProvider& operator=(const EngineProvider&) = delete;

    // Returns the loaded engine, or nullptr with errorString() set.
    EncoderEngine* acquire();

    bool isReady() const;
    int loadAttempts() const;
    QString errorString() const;

private:
    mutable QMutex m_mutex;
    Factory m_factory;
    std::unique_ptr<EncoderEngine> m_engine;
    bool m_ready = false;
    int m_loadAttempts = 0;
    QString m_error;
};
