#include "FfmpegEngine.h"
#include "Logging.h"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <utility>

FfmpegEngine::FfmpegEngine(const FfmpegEngineOptions& options)
    : m_options(options)
{}

FfmpegEngine::~FfmpegEngine() = default;

QString FfmpegEngine::workDir() const {
    return m_workDir ? m_workDir->path() : QString();
}

bool FfmpegEngine::load() {
    if (m_loaded) return true;
    m_error.clear();

    QString path = m_options.ffmpegPath;
    if (path.isEmpty()) path = QStandardPaths::findExecutable("ffmpeg");
    if (path.isEmpty()) {
        m_error = "ffmpeg executable not found in PATH";
        return false;
    }

    QFileInfo fi(path);
    if (!fi.exists() || !fi.isExecutable()) {
        m_error = QString("ffmpeg is not executable: %1").arg(path);
        return false;
    }

    QProcess probe;
    probe.start(path, {"-hide_banner", "-version"});
    if (!probe.waitForStarted(StartTimeoutMs)) {
        m_error = QString("Cannot start %1: %2").arg(path, probe.errorString());
        return false;
    }
    if (!probe.waitForFinished(StartTimeoutMs)) {
        probe.kill();
        probe.waitForFinished();
        m_error = QString("%1 -version did not finish").arg(path);
        return false;
    }
    if (probe.exitStatus() != QProcess::NormalExit || probe.exitCode() != 0) {
        m_error = QString("%1 -version failed with code %2").arg(path).arg(probe.exitCode());
        return false;
    }
    m_version = QString::fromUtf8(probe.readAllStandardOutput()).section('\n', 0, 0).trimmed();

    QString root = m_options.workDirRoot.isEmpty() ? QDir::tempPath() : m_options.workDirRoot;
    auto dir = std::make_unique<QTemporaryDir>(QDir(root).filePath("photoreel-XXXXXX"));
    if (!dir->isValid()) {
        m_error = QString("Cannot create work directory in %1: %2").arg(root, dir->errorString());
        return false;
    }

    m_resolvedPath = fi.absoluteFilePath();
    m_workDir = std::move(dir);
    m_loaded = true;
    qCInfo(lcEngine) << "Encoder ready:" << m_version << "work dir" << m_workDir->path();
    return true;
}

bool FfmpegEngine::isValidArtifactName(const QString& name) {
    if (name.isEmpty() || name == "." || name == "..") return false;
    return !name.contains('/') && !name.contains('\\');
}

QString FfmpegEngine::artifactPath(const QString& name) const {
    return QDir(m_workDir->path()).filePath(name);
}

bool FfmpegEngine::checkArtifact(const QString& name) {
    if (!m_loaded) {
        m_error = "Encoder engine is not loaded";
        return false;
    }
    if (!isValidArtifactName(name)) {
        m_error = QString("Invalid artifact name: %1").arg(name);
        return false;
    }
    return true;
}

bool FfmpegEngine::writeFile(const QString& name, const QByteArray& data) {
    if (!checkArtifact(name)) return false;

    QFile file(artifactPath(name));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        m_error = QString("Cannot write artifact %1: %2").arg(name, file.errorString());
        return false;
    }
    if (file.write(data) != data.size()) {
        m_error = QString("Short write for artifact %1: %2").arg(name, file.errorString());
        return false;
    }
    return true;
}

bool FfmpegEngine::readFile(const QString& name, EngineFileData& out) {
    if (!checkArtifact(name)) return false;

    QFile file(artifactPath(name));
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read artifact %1: %2").arg(name, file.errorString());
        return false;
    }
    out = file.readAll();
    return true;
}

bool FfmpegEngine::deleteFile(const QString& name) {
    if (!checkArtifact(name)) return false;

    QFile file(artifactPath(name));
    if (!file.exists()) {
        m_error = QString("No such artifact: %1").arg(name);
        return false;
    }
    if (!file.remove()) {
        m_error = QString("Cannot delete artifact %1: %2").arg(name, file.errorString());
        return false;
    }
    return true;
}

bool FfmpegEngine::exec(const QStringList& args) {
    if (!m_loaded) {
        m_error = "Encoder engine is not loaded";
        return false;
    }
    m_error.clear();
    m_logTail.clear();

    QStringList fullArgs{"-hide_banner", "-nostdin", "-y"};
    fullArgs += args;

    QProcess proc;
    proc.setWorkingDirectory(m_workDir->path());
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.setReadChannel(QProcess::StandardError);

    qCDebug(lcEngine) << "Running" << m_resolvedPath << fullArgs;
    proc.start(m_resolvedPath, fullArgs);
    if (!proc.waitForStarted(StartTimeoutMs)) {
        m_error = QString("Cannot start ffmpeg: %1").arg(proc.errorString());
        return false;
    }

    QElapsedTimer timer;
    timer.start();
    QByteArray pending;
    bool timedOut = false;

    while (proc.state() != QProcess::NotRunning) {
        proc.waitForReadyRead(100);
        consumeLog(pending, proc.readAllStandardError(), false);

        if (m_options.execTimeoutMs > 0 && timer.elapsed() > m_options.execTimeoutMs) {
            timedOut = true;
            proc.kill();
            proc.waitForFinished();
            break;
        }
    }
    consumeLog(pending, proc.readAllStandardError(), true);

    if (timedOut) {
        m_error = QString("ffmpeg did not finish within %1 ms").arg(m_options.execTimeoutMs);
        return false;
    }
    if (proc.exitStatus() != QProcess::NormalExit) {
        m_error = QString("ffmpeg crashed: %1").arg(proc.errorString());
        return false;
    }
    if (proc.exitCode() != 0) {
        m_error = QString("ffmpeg exited with code %1: %2")
            .arg(proc.exitCode())
            .arg(m_logTail.join(" | "));
        return false;
    }

    qCDebug(lcEngine) << "ffmpeg finished in" << timer.elapsed() << "ms";
    return true;
}

void FfmpegEngine::consumeLog(QByteArray& pending, const QByteArray& chunk, bool flush) {
    pending += chunk;

    // Progress updates are terminated by '\r', regular messages by '\n'
    int start = 0;
    for (int i = 0; i < pending.size(); ++i) {
        const char c = pending.at(i);
        if (c != '\r' && c != '\n') continue;

        const QString line = QString::fromUtf8(pending.mid(start, i - start)).trimmed();
        start = i + 1;
        if (line.isEmpty()) continue;

        m_logTail.append(line);
        while (m_logTail.size() > LogTailLines) m_logTail.removeFirst();
        emitLog(line);
    }
    pending.remove(0, start);

    if (flush && !pending.isEmpty()) {
        const QString line = QString::fromUtf8(pending).trimmed();
        pending.clear();
        if (!line.isEmpty()) {
            m_logTail.append(line);
            emitLog(line);
        }
    }
}
