#include "EncoderEngine.h"
#include <QMutexLocker>
#include <utility>
#include <vector>

int EncoderEngine::addLogListener(LogHandler handler) {
    QMutexLocker lock(&m_listenerMutex);
    const int id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(handler));
    return id;
}

void EncoderEngine::removeLogListener(int id) {
    QMutexLocker lock(&m_listenerMutex);
    m_listeners.erase(id);
}

int EncoderEngine::logListenerCount() const {
    QMutexLocker lock(&m_listenerMutex);
    return static_cast<int>(m_listeners.size());
}

void EncoderEngine::emitLog(const QString& line) {
    // Copy so handlers run without the lock held
    std::vector<LogHandler> handlers;
    {
        QMutexLocker lock(&m_listenerMutex);
        handlers.reserve(m_listeners.size());
        for (const auto& entry : m_listeners) handlers.push_back(entry.second);
    }
    for (const auto& handler : handlers) handler(line);
}
