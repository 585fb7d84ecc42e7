#ifndef ENTITYRECONCILER_H
#define ENTITYRECONCILER_H

#include <QDateTime>
#include <QList>
#include <QSet>
#include <QString>
#include <algorithm>

/**
 * @brief One state transition produced by a reconciliation pass.
 *
 * The entity is a copy of the record taken after the pass finished updating it.
 */
template<typename Entity>
struct EntityChange
{
    enum Kind {
        Added,          // first observation of this identity key
        StateChanged,   // presence flag flipped while present in the snapshot
        Refreshed,      // present in the snapshot, descriptive fields refreshed
        Vanished        // was present, missing from the snapshot
    };

    Kind kind;
    Entity entity;
};

/**
 * @brief Merges one snapshot into the known entity list.
 *
 * Entity must provide getUniqueKey() and refreshFrom(const Entity&). Traits
 * supplies the kind-specific parts:
 *   static bool isPresent(const Entity&);
 *   static void setPresent(Entity&, bool);
 *   static void stampCreated(Entity&, const QDateTime&);
 *   static void stampSeen(Entity&, const QDateTime&);
 *
 * New records are appended to both @p entities and @p history. Known records
 * keep their identity and creation stamp. Records missing from the snapshot are
 * flipped to not present and never removed.
 *
 * The returned list is ordered by phase: every Added change, then
 * StateChanged/Refreshed per found record, then every Vanished change.
 * Within a phase the order follows the snapshot, or the entity list for Vanished.
 * Duplicate keys inside one snapshot are matched once; the first one wins.
 */
template<typename Entity, typename Traits>
QList<EntityChange<Entity>> reconcileEntities(QList<Entity>& entities,
                                              QList<Entity>& history,
                                              const QList<Entity>& snapshot,
                                              const QDateTime& now)
{
    using Change = EntityChange<Entity>;

    QList<Change> added;
    QList<Change> updated;
    QList<Change> vanished;
    QSet<QString> observedKeys;

    for (const Entity& observed : snapshot) {
        const QString key = observed.getUniqueKey();
        if (observedKeys.contains(key)) {
            continue;
        }
        observedKeys.insert(key);

        auto existing = std::find_if(entities.begin(), entities.end(),
                                     [&key](const Entity& entity) { return entity.getUniqueKey() == key; });

        if (existing == entities.end()) {
            Entity record = observed;
            Traits::stampCreated(record, now);
            entities.append(record);
            history.append(record);
            added.append(Change{Change::Added, record});
            continue;
        }

        const bool present = Traits::isPresent(observed);
        const bool flipped = Traits::isPresent(*existing) != present;

        existing->refreshFrom(observed);
        Traits::stampSeen(*existing, now);
        if (flipped) {
            Traits::setPresent(*existing, present);
            updated.append(Change{Change::StateChanged, *existing});
        }
        updated.append(Change{Change::Refreshed, *existing});
    }

    for (Entity& entity : entities) {
        if (observedKeys.contains(entity.getUniqueKey()) || !Traits::isPresent(entity)) {
            continue;
        }
        Traits::setPresent(entity, false);
        vanished.append(Change{Change::Vanished, entity});
    }

    QList<Change> changes;
    changes.reserve(added.size() + updated.size() + vanished.size());
    changes.append(added);
    changes.append(updated);
    changes.append(vanished);
    return changes;
}

#endif // ENTITYRECONCILER_H
