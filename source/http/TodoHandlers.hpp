#ifndef TODOD_HTTP_TODOHANDLERS_HPP
#define TODOD_HTTP_TODOHANDLERS_HPP

#include <QByteArray>
#include <QString>
#include <QtHttpServer/QHttpServerResponse>
#include <memory>

#include "ITodoStore.hpp"

// Maps the CRUD protocol onto an ITodoStore. Knows nothing about sockets or
// routing: callers pass the raw path segment and body bytes.
class TodoHandlers {
public:
    explicit TodoHandlers(std::shared_ptr<ITodoStore> store);

    QHttpServerResponse listTodos() const;
    QHttpServerResponse clearTodos();

    QHttpServerResponse getTodo(const QString &idString) const;
    QHttpServerResponse createTodo(const QByteArray &body);
    QHttpServerResponse updateTodo(const QString &idString, const QByteArray &body);
    QHttpServerResponse deleteTodo(const QString &idString);

private:
    std::shared_ptr<ITodoStore> m_store;
};

#endif // TODOD_HTTP_TODOHANDLERS_HPP
