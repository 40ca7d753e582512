#ifndef TODOD_UTILS_JSONUTILS_HPP
#define TODOD_UTILS_JSONUTILS_HPP

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtHttpServer/QHttpServerResponse>
#include <optional>
#include <vector>

#include "Todo.hpp"

inline QHttpServerResponse makeJson(const QJsonObject &obj,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(obj).toJson(QJsonDocument::Compact),
        status);
}

inline QHttpServerResponse
makeJsonArray(const QJsonArray &arr, QHttpServerResponse::StatusCode status =
                                     QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(arr).toJson(QJsonDocument::Compact),
        status);
}

inline std::optional<QJsonObject> parseBodyObject(const QByteArray &body,
                                                  QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (outError) {
            *outError = parseError.errorString();
        }
        return std::nullopt;
    }

    if (!doc.isObject()) {
        if (outError) {
            *outError = QStringLiteral("expected a JSON object");
        }
        return std::nullopt;
    }

    return doc.object();
}

inline QJsonArray toJsonArray(const std::vector<Todo> &todos) {
    QJsonArray items;
    for (const Todo &todo : todos) {
        items.append(todo.toJson());
    }
    return items;
}

#endif // TODOD_UTILS_JSONUTILS_HPP
