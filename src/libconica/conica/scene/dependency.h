// =====================================================================
//  src/libconica/conica/scene/dependency.h — Dependency graph
// =====================================================================
//
//  Explicit directed edges between entities.  An edge points from a
//  dependent entity to the entity it reads during resolution.  Every
//  reference an entity holds (onLineId, pivotPointId, p1Id, p2Id and the
//  generic operand list) maps to exactly one edge kind.
//
//  The graph is assumed acyclic; it is not validated.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_DEPENDENCY_H
#define CONICA_SCENE_DEPENDENCY_H

#include "entity.h"

#include <QHash>
#include <QSet>
#include <QVector>

namespace conica {
namespace scene {

// =====================================================================
//  Edges
// =====================================================================

enum class EdgeKind {
    OnLine,        ///< Point projected onto a line
    Pivot,         ///< Line rotating about a point
    FirstPoint,    ///< Two-point line, first point
    SecondPoint,   ///< Two-point line, second point
    Operand        ///< Entry of the generic dependency list
};

struct DependencyEdge {
    EntityId dependent = NoEntity;     ///< Entity that reads
    EntityId dependency = NoEntity;    ///< Entity that is read
    EdgeKind kind = EdgeKind::Operand;
    int operandIndex = -1;             ///< Position in the operand list (Operand only)

    bool operator==(const DependencyEdge& o) const
    {
        return dependent == o.dependent && dependency == o.dependency
            && kind == o.kind && operandIndex == o.operandIndex;
    }
};

/// Outgoing edges of one entity
CONICA_EXPORT QVector<DependencyEdge> dependencyEdges(const Entity& entity);

/// Check if an entity holds any reference to `id`
CONICA_EXPORT bool referencesEntity(const Entity& entity, EntityId id);

/// Human-readable edge kind name
CONICA_EXPORT const char* edgeKindName(EdgeKind kind);

// =====================================================================
//  Graph
// =====================================================================

/// Reverse-indexed dependency graph over a collection snapshot
class CONICA_EXPORT DependencyGraph {
public:
    DependencyGraph() = default;
    explicit DependencyGraph(const QVector<Entity>& entities);

    /// All edges, in collection order
    const QVector<DependencyEdge>& edges() const { return m_edges; }

    /// Ids of entities holding a direct reference to `id`
    QVector<EntityId> directDependents(EntityId id) const;

    /// Ids of all entities that transitively depend on `id`
    /// (excluding `id` itself)
    QSet<EntityId> transitiveDependents(EntityId id) const;

    /// Edges whose target is not in the collection
    QVector<DependencyEdge> danglingEdges() const;

private:
    QVector<DependencyEdge> m_edges;
    QHash<EntityId, QVector<EntityId>> m_dependents;
    QSet<EntityId> m_ids;
};

// =====================================================================
//  Cascade Deletion
// =====================================================================

/// Set of ids removed when `root` is deleted: the root plus every
/// entity that references a member of the set, to a fixed point
CONICA_EXPORT QSet<EntityId> cascadeDeletionSet(const QVector<Entity>& entities,
                                                EntityId root);

/// Collection without `root` and everything depending on it, in the
/// original order.  A root that is not in the collection still removes
/// the entities that reference it.
CONICA_EXPORT QVector<Entity> cascadeDelete(const QVector<Entity>& entities,
                                            EntityId root,
                                            QVector<EntityId>* removed = nullptr);

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_DEPENDENCY_H
