#ifndef FILELOGGER_H
#define FILELOGGER_H

#include <QString>

// Routes qDebug/qInfo/qWarning/qCritical through one handler that writes
// "[timestamp] [LEVEL] message" to stderr and, when logFilePath is not
// empty, appends the same line to that file. Debug messages are dropped
// unless debugEnabled is set.
void installFormulaLogging(const QString &logFilePath = QString(), bool debugEnabled = false);

// Restores the default handler and closes the log file.
void shutdownFormulaLogging();

#endif // FILELOGGER_H
