#ifndef TODOD_STORAGE_INMEMORYTODOSTORE_HPP
#define TODOD_STORAGE_INMEMORYTODOSTORE_HPP

#include <QMutex>
#include <vector>

#include "ITodoStore.hpp"

// Process-local todo list. Every call, reads included, holds the same
// mutex, so callers always observe a whole update or none of it.
class InMemoryTodoStore : public ITodoStore {
public:
    InMemoryTodoStore() = default;

    std::vector<Todo> list() const override;
    std::optional<Todo> get(const QUuid &id) const override;

    Todo add(const QString &title) override;
    bool update(const QUuid &id, const TodoPatch &patch) override;
    bool remove(const QUuid &id) override;
    void clear() override;

private:
    std::vector<Todo>::iterator findLocked(const QUuid &id);
    std::vector<Todo>::const_iterator findLocked(const QUuid &id) const;

    mutable QMutex m_mutex;
    std::vector<Todo> m_items;
};

#endif // TODOD_STORAGE_INMEMORYTODOSTORE_HPP
