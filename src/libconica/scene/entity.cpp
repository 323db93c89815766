// =====================================================================
//  src/libconica/scene/entity.cpp — Scene entity implementation
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/entity.h>
#include <conica/geometry/conics.h>

#include <algorithm>

namespace conica {
namespace scene {

namespace {

// Per-kind defaults used by the factories
const char* const kPointColor = "#ffffff";
const char* const kLineColor = "#3b82f6";
const char* const kPolarColor = "#ef4444";
const char* const kConicColor = "#f59e0b";

bool fuzzyEqual(double x, double y, double tolerance)
{
    return qAbs(x - y) <= tolerance * qMax(1.0, qMax(qAbs(x), qAbs(y)));
}

bool pointsEquivalent(const QPointF& p, const QPointF& q, double tolerance)
{
    return fuzzyEqual(p.x(), q.x(), tolerance) && fuzzyEqual(p.y(), q.y(), tolerance);
}

}  // namespace

// =====================================================================
//  Entity
// =====================================================================

EntityKind Entity::kind() const
{
    if (isLine()) return EntityKind::Line;
    if (isConic()) return EntityKind::Conic;
    return EntityKind::Point;
}

bool Entity::isFree() const
{
    if (const PointData* p = point()) return p->isFree;
    if (const LineData* l = line()) return l->isFree;
    return true;  // conic params are always authoritative
}

// =====================================================================
//  Entity Factory Functions
// =====================================================================

Entity createPoint(EntityId id, const QPointF& position)
{
    Entity e;
    e.id = id;
    e.color = QString::fromLatin1(kPointColor);

    PointData p;
    p.position = position;
    p.isFree = true;
    e.data = p;
    return e;
}

Entity createPointOnLine(EntityId id, EntityId lineId, const QPointF& position)
{
    Entity e = createPoint(id, position);
    PointData* p = e.point();
    p->isFree = false;
    p->onLineId = lineId;
    return e;
}

Entity createLineLinePoint(EntityId id, EntityId line1, EntityId line2)
{
    Entity e = createPoint(id, QPointF());
    e.point()->isFree = false;
    e.dependencies = { line1, line2 };
    return e;
}

Entity createLineConicPoint(EntityId id, EntityId lineId, EntityId conicId,
                            int solutionIndex)
{
    Entity e = createPoint(id, QPointF());
    PointData* p = e.point();
    p->isFree = false;
    p->solutionIndex = solutionIndex;
    e.dependencies = { lineId, conicId };
    return e;
}

Entity createLine(EntityId id, const geometry::LineCoefficients& coeffs)
{
    Entity e;
    e.id = id;
    e.color = QString::fromLatin1(kLineColor);

    LineData l;
    l.coeffs = coeffs;
    l.isFree = true;
    e.data = l;
    return e;
}

Entity createTwoPointLine(EntityId id, EntityId p1, EntityId p2)
{
    Entity e = createLine(id, geometry::LineCoefficients());
    LineData* l = e.line();
    l->isFree = false;
    l->p1Id = p1;
    l->p2Id = p2;
    return e;
}

Entity createPivotLine(EntityId id, EntityId pivot, double angle)
{
    // Pivot lines stay draggable (angle is user-authoritative)
    Entity e = createLine(id, geometry::LineCoefficients());
    LineData* l = e.line();
    l->pivotPointId = pivot;
    l->angle = angle;
    return e;
}

Entity createPolarLine(EntityId id, EntityId pointId, EntityId conicId)
{
    Entity e = createLine(id, geometry::LineCoefficients());
    e.color = QString::fromLatin1(kPolarColor);
    e.line()->isFree = false;
    e.dependencies = { pointId, conicId };
    return e;
}

Entity createConic(EntityId id, const geometry::ConicParams& params)
{
    Entity e;
    e.id = id;
    e.color = QString::fromLatin1(kConicColor);

    ConicData c;
    c.params = params;
    c.coeffs = geometry::standardToGeneral(params);
    e.data = c;
    return e;
}

// =====================================================================
//  Entity Query Functions
// =====================================================================

const char* entityKindName(EntityKind kind)
{
    switch (kind) {
    case EntityKind::Point: return "Point";
    case EntityKind::Line:  return "Line";
    case EntityKind::Conic: return "Conic";
    }
    return "Unknown";
}

const Entity* findEntityById(const QVector<Entity>& entities, EntityId id)
{
    for (const Entity& e : entities) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

int indexOfEntity(const QVector<Entity>& entities, EntityId id)
{
    for (int i = 0; i < entities.size(); ++i) {
        if (entities[i].id == id) return i;
    }
    return -1;
}

EntityId nextEntityId(const QVector<Entity>& entities)
{
    EntityId maxId = NoEntity;
    for (const Entity& e : entities) {
        maxId = std::max(maxId, e.id);
    }
    return maxId + 1;
}

bool entitiesEquivalent(const Entity& e1, const Entity& e2, double tolerance)
{
    if (e1.id != e2.id || e1.name != e2.name || e1.color != e2.color
        || e1.hidden != e2.hidden || e1.dependencies != e2.dependencies
        || e1.kind() != e2.kind()) {
        return false;
    }

    if (const PointData* p1 = e1.point()) {
        const PointData* p2 = e2.point();
        return p1->isFree == p2->isFree
            && p1->onLineId == p2->onLineId
            && p1->solutionIndex == p2->solutionIndex
            && pointsEquivalent(p1->position, p2->position, tolerance);
    }

    if (const LineData* l1 = e1.line()) {
        const LineData* l2 = e2.line();
        return l1->isFree == l2->isFree
            && l1->p1Id == l2->p1Id
            && l1->p2Id == l2->p2Id
            && l1->pivotPointId == l2->pivotPointId
            && l1->angle == l2->angle
            && fuzzyEqual(l1->coeffs.a, l2->coeffs.a, tolerance)
            && fuzzyEqual(l1->coeffs.b, l2->coeffs.b, tolerance)
            && fuzzyEqual(l1->coeffs.c, l2->coeffs.c, tolerance);
    }

    const ConicData* c1 = e1.conic();
    const ConicData* c2 = e2.conic();
    const geometry::ConicCoefficients& k1 = c1->coeffs;
    const geometry::ConicCoefficients& k2 = c2->coeffs;
    return c1->params == c2->params
        && fuzzyEqual(k1.A, k2.A, tolerance) && fuzzyEqual(k1.B, k2.B, tolerance)
        && fuzzyEqual(k1.C, k2.C, tolerance) && fuzzyEqual(k1.D, k2.D, tolerance)
        && fuzzyEqual(k1.E, k2.E, tolerance) && fuzzyEqual(k1.F, k2.F, tolerance);
}

}  // namespace scene
}  // namespace conica
