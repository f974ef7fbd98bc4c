#include "EngineProvider.h"
#include "Logging.h"
#include <QMutexLocker>
#include <utility>

EngineProvider::EngineProvider(Factory factory)
    : m_factory(std::move(factory))
{}

EngineProvider::~EngineProvider() = default;

EncoderEngine* EngineProvider::acquire() {
    QMutexLocker lock(&m_mutex);
    if (m_ready) return m_engine.get();

    ++m_loadAttempts;
    m_error.clear();

    if (!m_engine) {
        m_engine = m_factory ? m_factory() : nullptr;
        if (!m_engine) {
            m_error = "No encoder engine available";
            qCWarning(lcEngine) << m_error;
            return nullptr;
        }
    }

    if (!m_engine->load()) {
        m_error = m_engine->errorString();
        qCWarning(lcEngine) << "Encoder engine load failed (attempt" << m_loadAttempts << "):" << m_error;
        return nullptr;
    }

    m_ready = true;
    return m_engine.get();
}

bool EngineProvider::isReady() const {
    QMutexLocker lock(&m_mutex);
    return m_ready;
}

int EngineProvider::loadAttempts() const {
    QMutexLocker lock(&m_mutex);
    return m_loadAttempts;
}

QString EngineProvider::errorString() const {
    QMutexLocker lock(&m_mutex);
    return m_error;
}
