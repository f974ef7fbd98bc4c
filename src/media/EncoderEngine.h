#pragma once

#include <QByteArray>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <functional>
#include <map>
#include <variant>

// Contents of an artifact read back from the engine. A QString means the
// engine handed out text where binary data was expected.
using EngineFileData = std::variant<QByteArray, QString>;

// Encoder capability: a private artifact store, one invocation entry point and
// a line-oriented log stream. One job at a time holds jobMutex().
class EncoderEngine {
public:
    using LogHandler = std::function<void(const QString& line)>;

    virtual ~EncoderEngine() = default;

    virtual bool load() = 0;
    virtual bool isLoaded() const = 0;

    virtual bool writeFile(const QString& name, const QByteArray& data) = 0;
    virtual bool readFile(const QString& name, EngineFileData& out) = 0;
    virtual bool deleteFile(const QString& name) = 0;

    // Runs the encoder with the given arguments; log lines are delivered to
    // the registered listeners while it runs.
    virtual bool exec(const QStringList& args) = 0;

    int addLogListener(LogHandler handler);
    void removeLogListener(int id);
    int logListenerCount() const;

    QMutex& jobMutex() { return m_jobMutex; }
    QString errorString() const { return m_error; }

protected:
    void emitLog(const QString& line);

    QString m_error;

private:
    mutable QMutex m_listenerMutex;
    QMutex m_jobMutex;
    std::map<int, LogHandler> m_listeners;
    int m_nextListenerId = 1;
};
