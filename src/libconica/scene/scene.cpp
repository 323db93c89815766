// =====================================================================
//  src/libconica/scene/scene.cpp — Scene holder
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/scene.h>
#include <conica/scene/constructions.h>
#include <conica/scene/dependency.h>
#include <conica/geometry/intersections.h>
#include <conica/geometry/utils.h>
#include <conica/logging.h>

#include <QSet>
#include <QtMath>

namespace conica {
namespace scene {

Scene::Scene() = default;

Scene::Scene(const ResolverOptions& options)
    : m_options(options)
{
}

const Entity* Scene::find(EntityId id) const
{
    return findEntityById(m_entities, id);
}

void Scene::setOptions(const ResolverOptions& options)
{
    m_options = options;
}

void Scene::replace(const QVector<Entity>& next)
{
    m_entities = next;
}

// =====================================================================
//  Actions
// =====================================================================

EntityId Scene::create(const Entity& entity)
{
    Entity added = entity;
    if (added.id == NoEntity) {
        added.id = nextEntityId(m_entities);
    } else if (find(added.id)) {
        qCWarning(lcScene) << "create: id" << added.id << "already in use";
        return NoEntity;
    }
    if (added.name.isEmpty()) {
        added.name = defaultName(m_entities, added.kind());
    }

    replace(createEntity(m_entities, added, m_options, &m_lastReport));
    return added.id;
}

bool Scene::createAll(const QVector<Entity>& entities)
{
    if (entities.isEmpty()) return false;

    for (const Entity& e : entities) {
        if (e.id == NoEntity || find(e.id)) {
            qCWarning(lcScene) << "createAll: id" << e.id << "is invalid or already in use";
            return false;
        }
    }

    replace(createEntities(m_entities, entities, m_options, &m_lastReport));
    return true;
}

bool Scene::update(EntityId id, const EntityPatch& patch)
{
    if (!find(id)) {
        qCWarning(lcScene) << "update: unknown entity" << id;
        return false;
    }

    replace(updateEntity(m_entities, id, patch, m_options, &m_lastReport));
    return true;
}

QVector<EntityId> Scene::remove(EntityId id)
{
    QVector<EntityId> removed;
    const QVector<Entity> survivors = cascadeDelete(m_entities, id, &removed);
    replace(resolve(survivors, m_options, &m_lastReport));
    return removed;
}

void Scene::apply(const Action& action)
{
    replace(scene::apply(m_entities, action, m_options, &m_lastReport));
}

void Scene::clear()
{
    m_entities.clear();
    m_lastReport = ResolveReport();
}

void Scene::loadDemo()
{
    replace(resolve(buildDemoScene(), m_options, &m_lastReport));
}

// =====================================================================
//  Direct Manipulation
// =====================================================================

bool Scene::movePoint(EntityId id, const QPointF& position)
{
    const Entity* e = find(id);
    const PointData* p = e ? e->point() : nullptr;
    if (!p || (!p->isFree && p->onLineId == NoEntity)) {
        qCWarning(lcScene) << "movePoint: entity" << id << "is not a movable point";
        return false;
    }

    return update(id, movePointPatch(position));
}

bool Scene::translateLine(EntityId id, double dx, double dy)
{
    const Entity* e = find(id);
    const LineData* l = e ? e->line() : nullptr;
    if (!l || !l->isFree || l->hasPivot() || l->hasTwoPoints()) {
        qCWarning(lcScene) << "translateLine: entity" << id << "is not a free line";
        return false;
    }

    EntityPatch patch;
    patch.lineCoefficients = geometry::translateLine(l->coeffs, dx, dy);
    return update(id, patch);
}

bool Scene::aimPivotLine(EntityId id, const QPointF& target)
{
    const Entity* e = find(id);
    const LineData* l = e ? e->line() : nullptr;
    const Entity* pivot = (l && l->hasPivot()) ? find(l->pivotPointId) : nullptr;
    if (!pivot || !pivot->point()) {
        qCWarning(lcScene) << "aimPivotLine: entity" << id << "is not a pivot line";
        return false;
    }

    const QPointF d = target - pivot->point()->position;
    EntityPatch patch;
    patch.angle = qAtan2(d.y(), d.x());
    return update(id, patch);
}

// =====================================================================
//  Queries
// =====================================================================

QVector<EntityId> Scene::entitiesNear(const QPointF& position, double radius) const
{
    QVector<EntityId> hits;
    for (const Entity& e : m_entities) {
        if (e.hidden) continue;

        if (const PointData* p = e.point()) {
            const QPointF d = p->position - position;
            if (qSqrt(d.x() * d.x() + d.y() * d.y()) <= radius) hits.append(e.id);
        } else if (const LineData* l = e.line()) {
            if (l->coeffs.isDegenerate()) continue;
            if (geometry::pointToLineDistance(position, l->coeffs) <= radius) hits.append(e.id);
        }
    }
    return hits;
}

QVector<EntityId> Scene::eraseNear(const QPointF& position, double radius)
{
    const QVector<EntityId> hits = entitiesNear(position, radius);
    if (hits.isEmpty()) return {};

    QSet<EntityId> doomed;
    for (EntityId id : hits) {
        doomed.unite(cascadeDeletionSet(m_entities, id));
    }

    QVector<Entity> survivors;
    QVector<EntityId> removed;
    for (const Entity& e : m_entities) {
        if (doomed.contains(e.id)) {
            removed.append(e.id);
        } else {
            survivors.append(e);
        }
    }

    qCDebug(lcScene) << "erased" << removed.size() << "entities near" << position;
    replace(resolve(survivors, m_options, &m_lastReport));
    return removed;
}

}  // namespace scene
}  // namespace conica
