#ifndef FILELOGGER_H
#define FILELOGGER_H

#include <QString>

// Installs a Qt message handler that writes every line as
//   [yyyy-MM-dd HH:mm:ss.zzz] [LEVEL] message
// to stderr and appends it to <logDir>/<prefix>_<yyyyMMdd_HHmmss>.log.
// Debug lines are dropped unless debugEnabled is set.
// Returns false when the log file could not be opened (console output
// still works).
bool setupFileLogging(const QString &logDir = "logs",
                      const QString &prefix = "formula_console",
                      bool debugEnabled = false);

// Restores the default handler and closes the log file
void cleanupFileLogging();

// Path of the current log file, empty when file logging is off
QString currentLogFilePath();

#endif // FILELOGGER_H
