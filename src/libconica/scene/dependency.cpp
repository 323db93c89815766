// =====================================================================
//  src/libconica/scene/dependency.cpp — Dependency graph
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/dependency.h>
#include <conica/logging.h>

#include <QQueue>

namespace conica {
namespace scene {

// =====================================================================
//  Edges
// =====================================================================

QVector<DependencyEdge> dependencyEdges(const Entity& entity)
{
    QVector<DependencyEdge> edges;

    auto add = [&](EntityId target, EdgeKind kind, int index = -1) {
        if (target == NoEntity) return;
        DependencyEdge edge;
        edge.dependent = entity.id;
        edge.dependency = target;
        edge.kind = kind;
        edge.operandIndex = index;
        edges.append(edge);
    };

    if (const PointData* p = entity.point()) {
        add(p->onLineId, EdgeKind::OnLine);
    } else if (const LineData* l = entity.line()) {
        add(l->pivotPointId, EdgeKind::Pivot);
        add(l->p1Id, EdgeKind::FirstPoint);
        add(l->p2Id, EdgeKind::SecondPoint);
    }

    for (int i = 0; i < entity.dependencies.size(); ++i) {
        add(entity.dependencies[i], EdgeKind::Operand, i);
    }

    return edges;
}

bool referencesEntity(const Entity& entity, EntityId id)
{
    if (id == NoEntity) return false;

    if (entity.dependencies.contains(id)) return true;

    if (const PointData* p = entity.point()) {
        return p->onLineId == id;
    }
    if (const LineData* l = entity.line()) {
        return l->pivotPointId == id || l->p1Id == id || l->p2Id == id;
    }
    return false;
}

const char* edgeKindName(EdgeKind kind)
{
    switch (kind) {
    case EdgeKind::OnLine:      return "On Line";
    case EdgeKind::Pivot:       return "Pivot";
    case EdgeKind::FirstPoint:  return "First Point";
    case EdgeKind::SecondPoint: return "Second Point";
    case EdgeKind::Operand:     return "Operand";
    }
    return "Unknown";
}

// =====================================================================
//  Graph
// =====================================================================

DependencyGraph::DependencyGraph(const QVector<Entity>& entities)
{
    for (const Entity& e : entities) {
        m_ids.insert(e.id);
        const QVector<DependencyEdge> out = dependencyEdges(e);
        for (const DependencyEdge& edge : out) {
            m_edges.append(edge);
            QVector<EntityId>& dependents = m_dependents[edge.dependency];
            if (!dependents.contains(edge.dependent)) {
                dependents.append(edge.dependent);
            }
        }
    }
}

QVector<EntityId> DependencyGraph::directDependents(EntityId id) const
{
    return m_dependents.value(id);
}

QSet<EntityId> DependencyGraph::transitiveDependents(EntityId id) const
{
    QSet<EntityId> visited;
    QQueue<EntityId> queue;
    queue.enqueue(id);

    while (!queue.isEmpty()) {
        const EntityId current = queue.dequeue();
        const QVector<EntityId> next = m_dependents.value(current);
        for (EntityId dependent : next) {
            if (dependent == id || visited.contains(dependent)) continue;
            visited.insert(dependent);
            queue.enqueue(dependent);
        }
    }

    return visited;
}

QVector<DependencyEdge> DependencyGraph::danglingEdges() const
{
    QVector<DependencyEdge> dangling;
    for (const DependencyEdge& edge : m_edges) {
        if (!m_ids.contains(edge.dependency)) {
            dangling.append(edge);
        }
    }
    return dangling;
}

// =====================================================================
//  Cascade Deletion
// =====================================================================

QSet<EntityId> cascadeDeletionSet(const QVector<Entity>& entities, EntityId root)
{
    QSet<EntityId> doomed = DependencyGraph(entities).transitiveDependents(root);
    doomed.insert(root);
    return doomed;
}

QVector<Entity> cascadeDelete(const QVector<Entity>& entities, EntityId root,
                              QVector<EntityId>* removed)
{
    const QSet<EntityId> doomed = cascadeDeletionSet(entities, root);

    QVector<Entity> survivors;
    survivors.reserve(entities.size());

    for (const Entity& e : entities) {
        if (doomed.contains(e.id)) {
            if (removed) removed->append(e.id);
        } else {
            survivors.append(e);
        }
    }

    qCDebug(lcScene) << "cascade delete of" << root << "removed"
                     << (entities.size() - survivors.size()) << "entities";

    return survivors;
}

}  // namespace scene
}  // namespace conica
