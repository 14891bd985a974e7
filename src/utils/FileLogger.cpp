#include "utils/FileLogger.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
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
            if (!logDebug)
                return;
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

void installFormulaLogging(const QString &logFilePath, bool debugEnabled)
{
    {
        QMutexLocker locker(&logMutex);
        logDebug = debugEnabled;

        if (logFile) {
            logFile->close();
            delete logFile;
            logFile = nullptr;
        }

        if (!logFilePath.isEmpty()) {
            QDir().mkpath(QFileInfo(logFilePath).absolutePath());
            logFile = new QFile(logFilePath);
            if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                fprintf(stderr, "Failed to open log file: %s\n", logFilePath.toLocal8Bit().constData());
                delete logFile;
                logFile = nullptr;
            }
        }
    }

    // Install message handler
    qInstallMessageHandler(messageHandler);
    if (logFile)
        qDebug() << "Log file opened:" << logFilePath;
}

void shutdownFormulaLogging()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker locker(&logMutex);
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}
