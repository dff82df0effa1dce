#pragma once
#include <QString>

namespace logcollect {
namespace Logger {

// Installs the process-wide Qt message handler. Records go to `filePath`
// (default "logcollect.log" in the working directory); warnings and errors
// are mirrored to stderr.
void install(const QString& filePath = QString());

// Restores Qt's default handler and closes the log file.
void shutdown();

// 0=Errors only, 1=Normal, 2=Debug
void setLogLevel(int level);
int  logLevel();

QString logFilePath();

} // namespace Logger
} // namespace logcollect
