#ifndef TODOD_UTILS_ERRORHANDLER_HPP
#define TODOD_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>
#include <exception>
#include <utility>

#include "JsonUtils.hpp"
#include "Logger.hpp"

inline QString newRequestId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

inline QHttpServerResponse
makeApiError(QHttpServerResponse::StatusCode status, const QString &message,
             const QString &type = QStringLiteral("error"),
             QJsonObject details = {}, const QString &requestId = {}) {
    QJsonObject obj{
                    {"ok", false},
                    {"type", type},
                    {"message", message},
                    {"status", static_cast<int>(status)},
                    {"requestId", requestId.isEmpty() ? newRequestId() : requestId},
                    {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)}};
    if (!details.isEmpty())
        obj.insert("details", details);

    return makeJson(obj, status);
}

inline QHttpServerResponse makeBadRequest(const QString &message,
                                          QJsonObject details = {}) {
    return makeApiError(QHttpServerResponse::StatusCode::BadRequest, message,
                        QStringLiteral("bad_request"), std::move(details));
}

inline QHttpServerResponse makeNotFound(const QUuid &id) {
    const QString idString = id.toString(QUuid::WithoutBraces);
    return makeApiError(QHttpServerResponse::StatusCode::NotFound,
                        QString("Todo with id=%1 not found").arg(idString),
                        QStringLiteral("not_found"),
                        QJsonObject{{"id", idString}});
}

// Runs one route body on the calling (worker) thread: tags it with a request
// id, times it, and turns an escaping exception into a 500 envelope.
template <typename Fn>
QHttpServerResponse invokeSafe(const char *routeName, Fn &&fn) {
    const QString requestId = newRequestId();
    const qint64 started = QDateTime::currentMSecsSinceEpoch();

    qInfo(appHttp) << "[START]" << routeName << "| requestId=" << requestId;

    try {
        QHttpServerResponse resp = fn();
        qInfo(appHttp) << "[DONE]" << routeName
                       << "| requestId=" << requestId
                       << "| status=" << static_cast<int>(resp.statusCode())
                       << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
        return resp;
    } catch (const std::exception &e) {
        qCritical(appHttp) << "[EXC]" << routeName
                           << "| requestId=" << requestId
                           << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                           << "| what=" << e.what();
        return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                            QStringLiteral("Internal error"),
                            QStringLiteral("internal_error"),
                            QJsonObject{{"what", e.what()}}, requestId);
    } catch (...) {
        qCritical(appHttp) << "[EXC]" << routeName
                           << "| requestId=" << requestId
                           << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                           << "| unknown exception";
        return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                            QStringLiteral("Internal error"),
                            QStringLiteral("internal_error"),
                            QJsonObject{{"what", "unknown"}}, requestId);
    }
}

namespace detail {

// Only the verbs a client is likely to aim at this service get a name.
inline QString methodName(QHttpServerRequest::Method method) {
    switch (method) {
    case QHttpServerRequest::Method::Get: return QStringLiteral("GET");
    case QHttpServerRequest::Method::Post: return QStringLiteral("POST");
    case QHttpServerRequest::Method::Patch: return QStringLiteral("PATCH");
    case QHttpServerRequest::Method::Delete: return QStringLiteral("DELETE");
    case QHttpServerRequest::Method::Put: return QStringLiteral("PUT");
    case QHttpServerRequest::Method::Head: return QStringLiteral("HEAD");
    default: return QStringLiteral("OTHER");
    }
}

} // namespace detail

inline void sendNotFound(QHttpServerResponder &responder,
                         const QHttpServerRequest &request) {
    const QString methodString = detail::methodName(request.method());
    const QString urlString = request.url().toString();
    qWarning(appHttp) << "404 no route for" << methodString << urlString;

    QHttpServerResponse response = makeApiError(
        QHttpServerResponse::StatusCode::NotFound,
        QStringLiteral("Route not found"), QStringLiteral("not_found"),
        QJsonObject{{"method", methodString},
                    {"path", urlString},
                    {"hint", "Use / or /<id> with GET, POST, PATCH or DELETE"}});
    responder.sendResponse(response);
}

#endif // TODOD_UTILS_ERRORHANDLER_HPP
