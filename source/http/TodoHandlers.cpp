#include "TodoHandlers.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <utility>

#include "ErrorHandler.hpp"
#include "IdUtils.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "TodoPatch.hpp"

namespace {

QHttpServerResponse makeInvalidId(const QString &idString) {
    return makeBadRequest(QStringLiteral("Invalid id (expected canonical UUID)"),
                          QJsonObject{{"id", idString}});
}

QHttpServerResponse makeEmptyOk() {
    return QHttpServerResponse(QHttpServerResponse::StatusCode::Ok);
}

} // namespace

TodoHandlers::TodoHandlers(std::shared_ptr<ITodoStore> store)
    : m_store(std::move(store)) {}

// ─────────────────────────────────────────────────────────────────────────────
// GET /
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::listTodos() const {
    const auto todos = m_store->list();
    qDebug(appHttp) << "Listing" << todos.size() << "todos";

    return makeJsonArray(toJsonArray(todos));
}

// ─────────────────────────────────────────────────────────────────────────────
// DELETE /
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::clearTodos() {
    m_store->clear();
    return makeEmptyOk();
}

// ─────────────────────────────────────────────────────────────────────────────
// GET /<id>
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::getTodo(const QString &idString) const {
    const auto id = parseTodoId(idString);
    if (!id) {
        return makeInvalidId(idString);
    }

    const auto todo = m_store->get(*id);
    if (!todo) {
        return makeNotFound(*id);
    }

    return makeJson(todo->toJson());
}

// ─────────────────────────────────────────────────────────────────────────────
// POST /
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::createTodo(const QByteArray &body) {
    QString parseError;
    const auto payload = parseBodyObject(body, &parseError);
    if (!payload) {
        return makeBadRequest("Invalid JSON: " + parseError);
    }

    const QJsonValue titleVal = payload->value("title");
    if (!titleVal.isString()) {
        return makeBadRequest(
            QStringLiteral("Field 'title' is required and must be a string"),
            QJsonObject{{"field", "title"}});
    }

    const Todo created = m_store->add(titleVal.toString());

    return makeJson(
        QJsonObject{{"id", created.id.toString(QUuid::WithoutBraces)}},
        QHttpServerResponse::StatusCode::Created);
}

// ─────────────────────────────────────────────────────────────────────────────
// PATCH /<id>
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::updateTodo(const QString &idString,
                                             const QByteArray &body) {
    const auto id = parseTodoId(idString);
    if (!id) {
        return makeInvalidId(idString);
    }

    QString parseError;
    const auto payload = parseBodyObject(body, &parseError);
    if (!payload) {
        return makeBadRequest("Invalid JSON: " + parseError);
    }

    const auto patch = parseTodoPatch(*payload, &parseError);
    if (!patch) {
        return makeBadRequest(parseError);
    }

    if (!m_store->update(*id, *patch)) {
        return makeNotFound(*id);
    }

    return makeEmptyOk();
}

// ─────────────────────────────────────────────────────────────────────────────
// DELETE /<id>
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TodoHandlers::deleteTodo(const QString &idString) {
    const auto id = parseTodoId(idString);
    if (!id) {
        return makeInvalidId(idString);
    }

    if (!m_store->remove(*id)) {
        return makeNotFound(*id);
    }

    return makeEmptyOk();
}
