#include "utils/FileLogger.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

static QFile *logFile = nullptr;
static QMutex logMutex;
static bool logDebug = false;

static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QMutexLocker locker(&logMutex);

    QString level;
    switch (type) {
        case QtDebugMsg:
            if (!logDebug) return;
            level = "DEBUG";
            break;
        case QtInfoMsg:     level = "INFO "; break;
        case QtWarningMsg:  level = "WARN "; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString logMessage = QString("[%1] [%2] %3\n").arg(timestamp, level, msg);

    // Write to console
    fprintf(stderr, "%s", logMessage.toLocal8Bit().constData());

    // Write to file
    if (logFile && logFile->isOpen()) {
        QTextStream stream(logFile);
        stream << logMessage;
        stream.flush();
    }
}

bool setupFileLogging(const QString &logDir, const QString &prefix, bool debugEnabled)
{
    {
        QMutexLocker locker(&logMutex);
        logDebug = debugEnabled;
    }

    QDir().mkpath(logDir);

    // Log file with timestamp
    QString timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
    QString logFileName = QDir(logDir).filePath(QString("%1_%2.log").arg(prefix, timestamp));

    bool opened;
    {
        QMutexLocker locker(&logMutex);
        if (logFile) {
            logFile->close();
            delete logFile;
        }
        logFile = new QFile(logFileName);
        opened = logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        if (!opened) {
            delete logFile;
            logFile = nullptr;
        }
    }

    // Install message handler
    qInstallMessageHandler(messageHandler);

    if (opened) {
        qDebug() << "[Logger] Log file created:" << logFileName;
    } else {
        qWarning() << "[Logger] Failed to open log file:" << logFileName;
    }
    return opened;
}

void cleanupFileLogging()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker locker(&logMutex);
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}

QString currentLogFilePath()
{
    QMutexLocker locker(&logMutex);
    return logFile ? logFile->fileName() : QString();
}
