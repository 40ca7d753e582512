#include "InMemoryTodoStore.hpp"

#include <QMutexLocker>
#include <algorithm>

#include "Logger.hpp"

// ───────────────────────────────────────────────
// lookup (caller holds m_mutex)
// ───────────────────────────────────────────────

std::vector<Todo>::iterator InMemoryTodoStore::findLocked(const QUuid &id) {
    return std::find_if(m_items.begin(), m_items.end(),
                        [&id](const Todo &todo) { return todo.id == id; });
}

std::vector<Todo>::const_iterator
InMemoryTodoStore::findLocked(const QUuid &id) const {
    return std::find_if(m_items.cbegin(), m_items.cend(),
                        [&id](const Todo &todo) { return todo.id == id; });
}

// ───────────────────────────────────────────────
// reads
// ───────────────────────────────────────────────

std::vector<Todo> InMemoryTodoStore::list() const {
    QMutexLocker lock(&m_mutex);
    return m_items;
}

std::optional<Todo> InMemoryTodoStore::get(const QUuid &id) const {
    QMutexLocker lock(&m_mutex);

    const auto it = findLocked(id);
    if (it == m_items.cend()) {
        return std::nullopt;
    }
    return *it;
}

// ───────────────────────────────────────────────
// writes
// ───────────────────────────────────────────────

Todo InMemoryTodoStore::add(const QString &title) {
    const Todo todo = Todo::fromTitle(title);

    {
        QMutexLocker lock(&m_mutex);
        m_items.push_back(todo);
    }

    qInfo(appCore) << "[Store] Todo added (id=" << todo.id.toString(QUuid::WithoutBraces)
                   << ")";
    return todo;
}

bool InMemoryTodoStore::update(const QUuid &id, const TodoPatch &patch) {
    if (patch.isEmpty()) {
        qDebug(appCore) << "[Store] Update with no fields (id="
                        << id.toString(QUuid::WithoutBraces) << ")";
    }

    {
        QMutexLocker lock(&m_mutex);

        const auto it = findLocked(id);
        if (it != m_items.end()) {
            patch.applyTo(*it);
            lock.unlock();

            qInfo(appCore) << "[Store] Todo updated (id="
                           << id.toString(QUuid::WithoutBraces) << ")";
            return true;
        }
    }

    qWarning(appCore) << "[Store] Update of unknown todo (id="
                      << id.toString(QUuid::WithoutBraces) << ")";
    return false;
}

bool InMemoryTodoStore::remove(const QUuid &id) {
    {
        QMutexLocker lock(&m_mutex);

        const auto it = findLocked(id);
        if (it != m_items.end()) {
            m_items.erase(it);
            lock.unlock();

            qInfo(appCore) << "[Store] Todo deleted (id="
                           << id.toString(QUuid::WithoutBraces) << ")";
            return true;
        }
    }

    qWarning(appCore) << "[Store] Delete of unknown todo (id="
                      << id.toString(QUuid::WithoutBraces) << ")";
    return false;
}

void InMemoryTodoStore::clear() {
    std::vector<Todo> dropped;

    {
        QMutexLocker lock(&m_mutex);
        dropped.swap(m_items);
    }

    qInfo(appCore) << "[Store] All todos deleted (" << dropped.size() << "items)";
}
