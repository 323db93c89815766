// =====================================================================
//  src/libconica/scene/operations.cpp — Scene operations
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/operations.h>
#include <conica/scene/dependency.h>
#include <conica/geometry/conics.h>
#include <conica/logging.h>

#include <QSet>

namespace conica {
namespace scene {

using namespace geometry;

// =====================================================================
//  Partial Updates
// =====================================================================

namespace {

void detachEntity(Entity& e)
{
    e.dependencies.clear();

    if (PointData* p = e.point()) {
        p->isFree = true;
        p->onLineId = NoEntity;
        p->solutionIndex.reset();
        e.hidden = false;
    } else if (LineData* l = e.line()) {
        l->isFree = true;
        l->p1Id = NoEntity;
        l->p2Id = NoEntity;
        l->pivotPointId = NoEntity;
        l->angle.reset();
    }
}

void warnIgnored(const Entity& e, const char* field)
{
    qCWarning(lcScene) << "ignoring" << field << "for"
                       << entityKindName(e.kind()) << e.id;
}

}  // namespace

Entity applyPatch(const Entity& entity, const EntityPatch& patch)
{
    Entity e = entity;

    if (patch.detach) detachEntity(e);

    if (patch.name) e.name = *patch.name;
    if (patch.color) e.color = *patch.color;
    if (patch.hidden) e.hidden = *patch.hidden;

    // ---- Point fields ----

    if (PointData* p = e.point()) {
        if (patch.position) p->position = *patch.position;
        if (patch.isFree) p->isFree = *patch.isFree;
        if (patch.onLineId) p->onLineId = *patch.onLineId;
    } else if (patch.position || patch.onLineId) {
        warnIgnored(e, "point fields");
    }

    // ---- Line fields ----

    if (LineData* l = e.line()) {
        if (patch.isFree) l->isFree = *patch.isFree;
        if (patch.lineCoefficients) l->coeffs = *patch.lineCoefficients;
        if (patch.angle) l->angle = *patch.angle;
    } else if (patch.lineCoefficients || patch.angle) {
        warnIgnored(e, "line fields");
    }

    // ---- Conic fields ----

    if (ConicData* c = e.conic()) {
        if (patch.conicCoefficients) {
            c->coeffs = *patch.conicCoefficients;
            const StandardConversion standard = generalToStandard(*patch.conicCoefficients);
            if (standard.complete) {
                c->params = standard.params;
            } else {
                c->params.type = standard.type;
            }
        }
        if (patch.conicType) c->params.type = *patch.conicType;
        if (patch.center) {
            c->params.cx = patch.center->x();
            c->params.cy = patch.center->y();
        }
        if (patch.semiAxisA) c->params.a = *patch.semiAxisA;
        if (patch.semiAxisB) c->params.b = *patch.semiAxisB;
        if (patch.rotation) c->params.rotation = *patch.rotation;
    } else if (patch.conicCoefficients || patch.conicType || patch.center
               || patch.semiAxisA || patch.semiAxisB || patch.rotation) {
        warnIgnored(e, "conic fields");
    }

    return e;
}

EntityPatch movePointPatch(const QPointF& position)
{
    EntityPatch patch;
    patch.position = position;
    return patch;
}

EntityPatch editLineCoefficientsPatch(const LineCoefficients& coeffs)
{
    EntityPatch patch;
    patch.detach = true;
    patch.lineCoefficients = coeffs;
    return patch;
}

// =====================================================================
//  Operations
// =====================================================================

QVector<Entity> createEntity(const QVector<Entity>& entities, const Entity& entity,
                             const ResolverOptions& options, ResolveReport* report)
{
    Entity added = entity;
    if (added.id == NoEntity) {
        added.id = nextEntityId(entities);
    }
    return createEntities(entities, { added }, options, report);
}

QVector<Entity> createEntities(const QVector<Entity>& entities,
                               const QVector<Entity>& added,
                               const ResolverOptions& options,
                               ResolveReport* report)
{
    QSet<EntityId> used;
    for (const Entity& e : entities) used.insert(e.id);

    for (const Entity& e : added) {
        if (e.id == NoEntity || used.contains(e.id)) {
            qCWarning(lcScene) << "rejecting insert: id" << e.id
                               << "is invalid or already in use";
            return resolve(entities, options, report);
        }
        used.insert(e.id);
    }

    QVector<Entity> next = entities;
    next.append(added);

    // Unresolved references are kept; the entity stays put until they exist
    const QVector<DependencyEdge> dangling = DependencyGraph(next).danglingEdges();
    for (const DependencyEdge& edge : dangling) {
        const Entity* owner = findEntityById(added, edge.dependent);
        if (!owner) continue;
        qCWarning(lcScene) << entityKindName(owner->kind()) << edge.dependent
                           << "references missing entity" << edge.dependency
                           << "(" << edgeKindName(edge.kind) << ")";
    }

    return resolve(next, options, report);
}

QVector<Entity> updateEntity(const QVector<Entity>& entities, EntityId id,
                             const EntityPatch& patch,
                             const ResolverOptions& options, ResolveReport* report)
{
    const int index = indexOfEntity(entities, id);
    if (index < 0) {
        qCWarning(lcScene) << "update of unknown entity" << id;
        return resolve(entities, options, report);
    }

    QVector<Entity> next = entities;
    next[index] = applyPatch(entities[index], patch);
    return resolve(next, options, report);
}

QVector<Entity> deleteEntity(const QVector<Entity>& entities, EntityId id,
                             const ResolverOptions& options, QVector<EntityId>* removed)
{
    return resolve(cascadeDelete(entities, id, removed), options);
}

// =====================================================================
//  Actions
// =====================================================================

namespace {

struct ActionVisitor {
    const QVector<Entity>& entities;
    const ResolverOptions& options;
    ResolveReport* report;

    QVector<Entity> operator()(const CreateAction& action) const
    {
        if (action.entities.size() == 1) {
            return createEntity(entities, action.entities.first(), options, report);
        }
        return createEntities(entities, action.entities, options, report);
    }

    QVector<Entity> operator()(const UpdateAction& action) const
    {
        return updateEntity(entities, action.id, action.patch, options, report);
    }

    QVector<Entity> operator()(const DeleteAction& action) const
    {
        return resolve(cascadeDelete(entities, action.id), options, report);
    }
};

}  // namespace

QVector<Entity> apply(const QVector<Entity>& entities, const Action& action,
                      const ResolverOptions& options, ResolveReport* report)
{
    return std::visit(ActionVisitor{ entities, options, report }, action);
}

}  // namespace scene
}  // namespace conica
