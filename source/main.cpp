#include <QCoreApplication>
#include <QtHttpServer/QHttpServer>
#include <QTcpServer>
#include <QThread>
#include <QThreadPool>
#include <QDebug>

#include <cstdio>
#include <memory>

#include "InMemoryTodoStore.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "TodoHandlers.hpp"
#include "TodoRouter.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("todod");
    QCoreApplication::setApplicationVersion("0.1.0");

    // ──────────────────────────────
    // 1. Options
    // ──────────────────────────────
    QString configError;
    QString exitText;
    const auto config = parseServerConfig(app.arguments(), &configError, &exitText);
    if (!config) {
        if (!exitText.isEmpty()) {
            fprintf(stdout, "%s\n", qPrintable(exitText));
            return 0;
        }
        fprintf(stderr, "todod: %s\n", qPrintable(configError));
        return 1;
    }

    if (!initLogging(config->logFile)) {
        qCritical(appCore) << "Cannot write log file, exiting";
        shutdownLogging();
        return 1;
    }

    QLoggingCategory::setFilterRules("todod.*=true\n"
                                     "qt.network.ssl.warning=false\n");

    // ──────────────────────────────
    // 2. Store and handlers
    // ──────────────────────────────
    auto store = std::make_shared<InMemoryTodoStore>();
    auto handlers = std::make_shared<TodoHandlers>(store);

    // ──────────────────────────────
    // 3. Worker pool
    // ──────────────────────────────
    QThreadPool workers;
    workers.setMaxThreadCount(config->workers > 0 ? config->workers
                                                  : QThread::idealThreadCount());

    // ──────────────────────────────
    // 4. Routes
    // ──────────────────────────────
    QHttpServer server;
    TodoRouter router(handlers, &workers);
    router.registerRoutes(server);

    // ──────────────────────────────
    // 5. Bind and run
    // ──────────────────────────────
    auto tcp = new QTcpServer(&app);
    if (!tcp->listen(config->address, config->port) || !server.bind(tcp)) {
        qCritical(appCore) << "Server failed to start on"
                           << config->address.toString() << config->port << ":"
                           << tcp->errorString();
        shutdownLogging();
        return 1;
    }

    qInfo(appCore) << "Server running on" << config->address.toString()
                   << "port" << tcp->serverPort() << "with"
                   << workers.maxThreadCount() << "workers";

    const int rc = app.exec();
    workers.waitForDone();
    shutdownLogging();
    return rc;
}
