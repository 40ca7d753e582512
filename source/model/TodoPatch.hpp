#ifndef TODOD_MODEL_TODOPATCH_HPP
#define TODOD_MODEL_TODOPATCH_HPP

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

#include "Todo.hpp"

// Partial update of a Todo. An unset field leaves the attribute untouched.
struct TodoPatch {
    std::optional<QString> title;
    std::optional<bool> completed;

    bool isEmpty() const { return !title && !completed; }

    void applyTo(Todo &todo) const {
        if (title) {
            todo.title = *title;
        }
        if (completed) {
            todo.completed = *completed;
        }
    }
};

// Supported keys:
//  - "title": string | null
//  - "completed": bool | null
// null counts as absent. Unknown keys are ignored.
inline std::optional<TodoPatch> parseTodoPatch(const QJsonObject &obj,
                                               QString *outError = nullptr) {
    TodoPatch patch;

    const QJsonValue titleVal = obj.value("title");
    if (titleVal.isString()) {
        patch.title = titleVal.toString();
    } else if (!titleVal.isUndefined() && !titleVal.isNull()) {
        if (outError) {
            *outError = QStringLiteral("Field 'title' must be a string");
        }
        return std::nullopt;
    }

    const QJsonValue completedVal = obj.value("completed");
    if (completedVal.isBool()) {
        patch.completed = completedVal.toBool();
    } else if (!completedVal.isUndefined() && !completedVal.isNull()) {
        if (outError) {
            *outError = QStringLiteral("Field 'completed' must be a boolean");
        }
        return std::nullopt;
    }

    return patch;
}

#endif // TODOD_MODEL_TODOPATCH_HPP
