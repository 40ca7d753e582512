#ifndef TODOD_MODEL_TODO_HPP
#define TODOD_MODEL_TODO_HPP

#include <QJsonObject>
#include <QString>
#include <QUuid>

struct Todo {
    QUuid id;
    QString title;
    bool completed = false;

    QJsonObject toJson() const {
        return QJsonObject{{"id", id.toString(QUuid::WithoutBraces)},
                           {"title", title},
                           {"completed", completed}};
    }

    // New items always start open.
    static Todo fromTitle(const QString &title) {
        Todo todo;
        todo.id = QUuid::createUuid();
        todo.title = title;
        todo.completed = false;

        return todo;
    }

    bool operator==(const Todo &other) const {
        return id == other.id && title == other.title &&
               completed == other.completed;
    }

    bool operator!=(const Todo &other) const { return !(*this == other); }
};

#endif // TODOD_MODEL_TODO_HPP
