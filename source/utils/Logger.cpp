#include "Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>

#include <cstdio>
#include <memory>
#include <utility>

Q_LOGGING_CATEGORY(appCore, "todod.core")
Q_LOGGING_CATEGORY(appHttp, "todod.http")

namespace {

const char *const kMessagePattern =
    "%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}";

struct LogSink {
    QMutex mutex;
    std::unique_ptr<QFile> file;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LogSink &sink() {
    static LogSink instance;
    return instance;
}

void writeLine(QtMsgType type, const QMessageLogContext &ctx, const QString &msg) {
    const QByteArray line = (qFormatLogMessage(type, ctx, msg) + '\n').toUtf8();

    LogSink &s = sink();
    // Route bodies log from pool threads; one lock keeps lines whole.
    QMutexLocker lock(&s.mutex);

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    if (s.file) {
        s.file->write(line);
        s.file->flush();
    }
}

} // namespace

bool initLogging(const QString &filePath) {
    qSetMessagePattern(QString::fromLatin1(kMessagePattern));

    LogSink &s = sink();
    bool fileOk = true;
    {
        QMutexLocker lock(&s.mutex);
        s.file.reset();

        if (!filePath.isEmpty()) {
            auto file = std::make_unique<QFile>(filePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                s.file = std::move(file);
            } else {
                fileOk = false;
            }
        }

        if (!s.installed) {
            s.previous = qInstallMessageHandler(writeLine);
            s.installed = true;
        }
    }

    if (!fileOk) {
        qWarning(appCore) << "Failed to open log file:" << filePath;
    }
    qInfo(appCore) << "Logging initialized"
                   << (fileOk && !filePath.isEmpty() ? filePath : QStringLiteral("(stderr only)"));
    return fileOk;
}

void shutdownLogging() {
    LogSink &s = sink();
    QMutexLocker lock(&s.mutex);

    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.previous = nullptr;
        s.installed = false;
    }
    s.file.reset();
}
