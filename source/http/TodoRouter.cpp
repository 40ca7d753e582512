#include <QtConcurrent/QtConcurrentRun>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <utility>

#include "ErrorHandler.hpp"
#include "Logger.hpp"
#include "TodoRouter.hpp"

TodoRouter::TodoRouter(std::shared_ptr<TodoHandlers> handlers, QThreadPool *pool)
    : m_handlers(std::move(handlers)), m_pool(pool) {}

template <typename Fn>
QFuture<QHttpServerResponse> TodoRouter::dispatch(const char *routeName,
                                                  Fn fn) const {
    return QtConcurrent::run(m_pool, [routeName, fn = std::move(fn)]() {
        return invokeSafe(routeName, fn);
    });
}

void TodoRouter::registerRoutes(QHttpServer &server) {
    // The request object is only valid inside the route callback, so each
    // route copies the path argument and body before leaving the server thread.
    const auto mirrorRoute = [&server](const char *path,
                                       QHttpServerRequest::Method method,
                                       auto handler) {
        server.route(path, method, handler);
        QString withSlash = QString::fromLatin1(path);
        if (!withSlash.endsWith('/')) {
            withSlash.append('/');
            server.route(withSlash, method, handler);
        }
    };

    const auto handlers = m_handlers;

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /
    // ─────────────────────────────────────────────────────────────────────────────
    server.route("/", QHttpServerRequest::Method::Get, [this, handlers]() {
        return dispatch("GET /", [handlers] { return handlers->listTodos(); });
    });

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /
    // ─────────────────────────────────────────────────────────────────────────────
    server.route("/", QHttpServerRequest::Method::Post,
                 [this, handlers](const QHttpServerRequest &request) {
                     qDebug(appHttp) << "[POST] / bytes=" << request.body().size();

                     const QByteArray body = request.body();
                     return dispatch("POST /", [handlers, body] {
                         return handlers->createTodo(body);
                     });
                 });

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /
    // ─────────────────────────────────────────────────────────────────────────────
    server.route("/", QHttpServerRequest::Method::Delete, [this, handlers]() {
        return dispatch("DELETE /", [handlers] { return handlers->clearTodos(); });
    });

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /<id>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute("/<arg>", QHttpServerRequest::Method::Get,
                [this, handlers](const QString &id, const QHttpServerRequest &) {
                    return dispatch("GET /<id>", [handlers, id] {
                        return handlers->getTodo(id);
                    });
                });

    // ─────────────────────────────────────────────────────────────────────────────
    // PATCH /<id>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute("/<arg>", QHttpServerRequest::Method::Patch,
                [this, handlers](const QString &id,
                                 const QHttpServerRequest &request) {
                    qDebug(appHttp) << "[PATCH] /" << id
                                    << "bytes=" << request.body().size();

                    const QByteArray body = request.body();
                    return dispatch("PATCH /<id>", [handlers, id, body] {
                        return handlers->updateTodo(id, body);
                    });
                });

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /<id>
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute("/<arg>", QHttpServerRequest::Method::Delete,
                [this, handlers](const QString &id, const QHttpServerRequest &) {
                    return dispatch("DELETE /<id>", [handlers, id] {
                        return handlers->deleteTodo(id);
                    });
                });

    // ─────────────────────────────────────────────────────────────────────────────
    // 404 fallback
    // ─────────────────────────────────────────────────────────────────────────────
    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        sendNotFound(responder, request);
    });
}
