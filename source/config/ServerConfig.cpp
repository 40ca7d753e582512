#include "ServerConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

namespace {

void setError(QString *outError, const QString &message) {
    if (outError) {
        *outError = message;
    }
}

} // namespace

std::optional<ServerConfig> parseServerConfig(const QStringList &arguments,
                                              QString *outError,
                                              QString *outExitText) {
    QCommandLineParser parser;
    parser.setApplicationDescription("In-memory todo list over HTTP");

    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption addressOption(
        {"a", "address"}, "Address to bind (default 127.0.0.1).", "host",
        "127.0.0.1");
    const QCommandLineOption portOption({"p", "port"},
                                        "TCP port to listen on (default 9000).",
                                        "port", "9000");
    const QCommandLineOption workersOption(
        {"w", "workers"}, "Worker threads serving requests (default: CPU count).",
        "n");
    const QCommandLineOption logFileOption(
        {"l", "log-file"}, "Also append log lines to this file.", "path");

    parser.addOption(addressOption);
    parser.addOption(portOption);
    parser.addOption(workersOption);
    parser.addOption(logFileOption);

    if (!parser.parse(arguments)) {
        setError(outError, parser.errorText());
        return std::nullopt;
    }

    if (parser.isSet(helpOption) || parser.isSet(versionOption)) {
        if (outExitText) {
            *outExitText = parser.isSet(helpOption)
                               ? parser.helpText()
                               : QCoreApplication::applicationName() + ' ' +
                                     QCoreApplication::applicationVersion();
        }
        setError(outError, QString());
        return std::nullopt;
    }

    if (!parser.positionalArguments().isEmpty()) {
        setError(outError, QString("Unexpected argument: %1")
                               .arg(parser.positionalArguments().first()));
        return std::nullopt;
    }

    ServerConfig config;

    const QString addressString = parser.value(addressOption);
    if (!config.address.setAddress(addressString)) {
        setError(outError, QString("Invalid address: %1").arg(addressString));
        return std::nullopt;
    }

    bool ok = false;
    const uint port = parser.value(portOption).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        setError(outError,
                 QString("Invalid port: %1").arg(parser.value(portOption)));
        return std::nullopt;
    }
    config.port = static_cast<quint16>(port);

    if (parser.isSet(workersOption)) {
        const int workers = parser.value(workersOption).toInt(&ok);
        if (!ok || workers < 1) {
            setError(outError, QString("Invalid worker count: %1")
                                   .arg(parser.value(workersOption)));
            return std::nullopt;
        }
        config.workers = workers;
    }

    config.logFile = parser.value(logFileOption);

    return config;
}
