#ifndef TODOD_HTTP_TODOROUTER_HPP
#define TODOD_HTTP_TODOROUTER_HPP

#include <QFuture>
#include <QThreadPool>
#include <QtHttpServer/QHttpServerResponse>
#include <memory>

#include "IRouter.hpp"
#include "TodoHandlers.hpp"

// Registers the todo routes. Each request body runs on `pool`, which must
// outlive the server.
class TodoRouter : public IRouter {
public:
    TodoRouter(std::shared_ptr<TodoHandlers> handlers, QThreadPool *pool);

    void registerRoutes(QHttpServer &server) override;

private:
    template <typename Fn>
    QFuture<QHttpServerResponse> dispatch(const char *routeName, Fn fn) const;

    std::shared_ptr<TodoHandlers> m_handlers;
    QThreadPool *m_pool;
};

#endif // TODOD_HTTP_TODOROUTER_HPP
