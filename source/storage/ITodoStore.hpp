#ifndef TODOD_STORAGE_ITODOSTORE_HPP
#define TODOD_STORAGE_ITODOSTORE_HPP

#include <QString>
#include <QUuid>
#include <optional>
#include <vector>

#include "Todo.hpp"
#include "TodoPatch.hpp"

class ITodoStore {
public:
    virtual ~ITodoStore() = default;

    virtual std::vector<Todo> list() const = 0;
    virtual std::optional<Todo> get(const QUuid &id) const = 0;

    virtual Todo add(const QString &title) = 0;
    virtual bool update(const QUuid &id, const TodoPatch &patch) = 0;
    virtual bool remove(const QUuid &id) = 0;
    virtual void clear() = 0;
};

#endif // TODOD_STORAGE_ITODOSTORE_HPP
