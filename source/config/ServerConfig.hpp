#ifndef TODOD_CONFIG_SERVERCONFIG_HPP
#define TODOD_CONFIG_SERVERCONFIG_HPP

#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <optional>

struct ServerConfig {
    QHostAddress address = QHostAddress(QHostAddress::LocalHost);
    quint16 port = 9000;
    int workers = 0; // 0: QThread::idealThreadCount()
    QString logFile;
};

// Parses `arguments` (argv[0] included). Returns std::nullopt on a bad value
// and fills outError; `--help` / `--version` are reported through outExitText.
std::optional<ServerConfig> parseServerConfig(const QStringList &arguments,
                                              QString *outError = nullptr,
                                              QString *outExitText = nullptr);

#endif // TODOD_CONFIG_SERVERCONFIG_HPP
