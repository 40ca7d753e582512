#ifndef TODOD_UTILS_LOGGER_HPP
#define TODOD_UTILS_LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appHttp)

// Installs the todod message format and handler. Lines always go to stderr;
// with a non-empty `filePath` they are appended there too. Returns false if
// the file could not be opened (stderr logging is still installed).
bool initLogging(const QString &filePath = QString());

// Restores the handler that was active before initLogging and closes the
// log file.
void shutdownLogging();

#endif // TODOD_UTILS_LOGGER_HPP
