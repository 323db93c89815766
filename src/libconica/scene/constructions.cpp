// =====================================================================
//  src/libconica/scene/constructions.cpp — Compound constructions
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/constructions.h>
#include <conica/logging.h>

#include <QtMath>

namespace conica {
namespace scene {

namespace {

/// Resolve two operand ids of kinds (A, B) given in either order
bool orderOperands(const QVector<Entity>& entities, EntityId first, EntityId second,
                   EntityKind kindA, EntityKind kindB,
                   const Entity*& a, const Entity*& b)
{
    const Entity* e1 = findEntityById(entities, first);
    const Entity* e2 = findEntityById(entities, second);
    if (!e1 || !e2 || e1->id == e2->id) return false;

    if (e1->kind() == kindA && e2->kind() == kindB) {
        a = e1;
        b = e2;
        return true;
    }
    if (e1->kind() == kindB && e2->kind() == kindA) {
        a = e2;
        b = e1;
        return true;
    }
    return false;
}

const Entity* findOfKind(const QVector<Entity>& entities, EntityId id, EntityKind kind)
{
    const Entity* e = findEntityById(entities, id);
    return (e && e->kind() == kind) ? e : nullptr;
}

QVector<Entity> rejected(const char* construction)
{
    qCWarning(lcScene) << "cannot build" << construction << "from the given operands";
    return {};
}

Entity named(Entity e, const QString& name, const char* color = nullptr)
{
    e.name = name;
    if (color) e.color = QString::fromLatin1(color);
    return e;
}

}  // namespace

// =====================================================================
//  Presentation Defaults
// =====================================================================

QStringList colorPalette()
{
    return {
        QStringLiteral("#3b82f6"),  // Blue
        QStringLiteral("#ef4444"),  // Red
        QStringLiteral("#10b981"),  // Green
        QStringLiteral("#f59e0b"),  // Amber
        QStringLiteral("#8b5cf6"),  // Violet
        QStringLiteral("#ec4899"),  // Pink
    };
}

QString defaultName(const QVector<Entity>& entities, EntityKind kind)
{
    int count = 0;
    for (const Entity& e : entities) {
        if (e.kind() == kind) ++count;
    }

    switch (kind) {
    case EntityKind::Point: return QStringLiteral("P%1").arg(count + 1);
    case EntityKind::Line:  return QStringLiteral("L%1").arg(count + 1);
    case EntityKind::Conic: return QStringLiteral("C%1").arg(count + 1);
    }
    return QString();
}

// =====================================================================
//  Single Entities
// =====================================================================

QVector<Entity> buildFreePoint(const QVector<Entity>& entities, const QPointF& position)
{
    const EntityId id = nextEntityId(entities);
    return { named(createPoint(id, position), defaultName(entities, EntityKind::Point)) };
}

QVector<Entity> buildPointOnLine(const QVector<Entity>& entities, EntityId lineId,
                                 const QPointF& position)
{
    if (!findOfKind(entities, lineId, EntityKind::Line)) return rejected("point on line");

    const EntityId id = nextEntityId(entities);
    return { named(createPointOnLine(id, lineId, position),
                   defaultName(entities, EntityKind::Point)) };
}

QVector<Entity> buildFreeLine(const QVector<Entity>& entities, const QPointF& position)
{
    // x - y + (y0 - x0) = 0
    geometry::LineCoefficients coeffs;
    coeffs.a = 1.0;
    coeffs.b = -1.0;
    coeffs.c = position.y() - position.x();

    const EntityId id = nextEntityId(entities);
    return { named(createLine(id, coeffs), defaultName(entities, EntityKind::Line)) };
}

QVector<Entity> buildPivotLine(const QVector<Entity>& entities, EntityId pivotId)
{
    const Entity* pivot = findOfKind(entities, pivotId, EntityKind::Point);
    if (!pivot) return rejected("pivot line");

    const EntityId id = nextEntityId(entities);
    return { named(createPivotLine(id, pivotId, 0.0),
                   QStringLiteral("L(%1)").arg(pivot->name)) };
}

QVector<Entity> buildTwoPointLine(const QVector<Entity>& entities, EntityId p1, EntityId p2)
{
    const Entity* first = findOfKind(entities, p1, EntityKind::Point);
    const Entity* second = findOfKind(entities, p2, EntityKind::Point);
    if (!first || !second || p1 == p2) return rejected("two-point line");

    const EntityId id = nextEntityId(entities);
    return { named(createTwoPointLine(id, p1, p2),
                   QStringLiteral("L(%1,%2)").arg(first->name, second->name)) };
}

QVector<Entity> buildDefaultConic(const QVector<Entity>& entities, const QPointF& center)
{
    geometry::ConicParams params;
    params.type = geometry::ConicType::Ellipse;
    params.cx = center.x();
    params.cy = center.y();
    params.a = 2.0;
    params.b = 1.0;
    params.rotation = 0.0;

    const EntityId id = nextEntityId(entities);
    return { named(createConic(id, params), defaultName(entities, EntityKind::Conic)) };
}

// =====================================================================
//  Intersections and Duality
// =====================================================================

QVector<Entity> buildLineLineIntersection(const QVector<Entity>& entities,
                                          EntityId line1, EntityId line2)
{
    const Entity* l1 = findOfKind(entities, line1, EntityKind::Line);
    const Entity* l2 = findOfKind(entities, line2, EntityKind::Line);
    if (!l1 || !l2 || line1 == line2) return rejected("line-line intersection");

    const EntityId id = nextEntityId(entities);
    return { named(createLineLinePoint(id, line1, line2),
                   QStringLiteral("I(%1,%2)").arg(l1->name, l2->name)) };
}

QVector<Entity> buildLineConicIntersections(const QVector<Entity>& entities,
                                            EntityId first, EntityId second)
{
    const Entity* line = nullptr;
    const Entity* conic = nullptr;
    if (!orderOperands(entities, first, second, EntityKind::Line, EntityKind::Conic,
                       line, conic)) {
        return rejected("line-conic intersections");
    }

    const EntityId id = nextEntityId(entities);
    const QString suffix = QStringLiteral("(%1,%2)").arg(line->name, conic->name);

    return {
        named(createLineConicPoint(id, line->id, conic->id, 0), QStringLiteral("I1") + suffix),
        named(createLineConicPoint(id + 1, line->id, conic->id, 1), QStringLiteral("I2") + suffix),
    };
}

QVector<Entity> buildPolarLine(const QVector<Entity>& entities,
                               EntityId first, EntityId second)
{
    const Entity* pole = nullptr;
    const Entity* conic = nullptr;
    if (!orderOperands(entities, first, second, EntityKind::Point, EntityKind::Conic,
                       pole, conic)) {
        return rejected("polar line");
    }

    const EntityId id = nextEntityId(entities);
    return { named(createPolarLine(id, pole->id, conic->id),
                   QStringLiteral("Polar(%1)").arg(pole->name)) };
}

QVector<Entity> buildTangents(const QVector<Entity>& entities,
                              EntityId first, EntityId second)
{
    const Entity* pole = nullptr;
    const Entity* conic = nullptr;
    if (!orderOperands(entities, first, second, EntityKind::Point, EntityKind::Conic,
                       pole, conic)) {
        return rejected("tangents");
    }

    const EntityId polarId = nextEntityId(entities);
    const EntityId t1Id = polarId + 1;
    const EntityId t2Id = polarId + 2;

    Entity polar = named(createPolarLine(polarId, pole->id, conic->id),
                         QStringLiteral("Polar(%1)").arg(pole->name), colors::HELPER);
    polar.hidden = true;

    return {
        polar,
        named(createLineConicPoint(t1Id, polarId, conic->id, 0),
              QStringLiteral("T1"), colors::TANGENCY),
        named(createLineConicPoint(t2Id, polarId, conic->id, 1),
              QStringLiteral("T2"), colors::TANGENCY),
        named(createTwoPointLine(polarId + 3, pole->id, t1Id),
              QStringLiteral("Tan1(%1)").arg(pole->name), colors::TANGENT),
        named(createTwoPointLine(polarId + 4, pole->id, t2Id),
              QStringLiteral("Tan2(%1)").arg(pole->name), colors::TANGENT),
    };
}

QVector<Entity> buildSelfPolarTriangle(const QVector<Entity>& entities,
                                       EntityId first, EntityId second)
{
    const Entity* vertex = nullptr;
    const Entity* conic = nullptr;
    if (!orderOperands(entities, first, second, EntityKind::Point, EntityKind::Conic,
                       vertex, conic)) {
        return rejected("self-polar triangle");
    }

    const EntityId side1 = nextEntityId(entities);
    const EntityId vertex2 = side1 + 1;
    const EntityId side2 = side1 + 2;
    const EntityId vertex3 = side1 + 3;
    const EntityId side3 = side1 + 4;

    const QString name1 = vertex->name;
    const QString name2 = name1 + QLatin1Char('\'');
    const QString name3 = name1 + QStringLiteral("''");

    // P' slides on p(P); seeded at the origin and projected on resolution
    Entity p2 = named(createPoint(vertex2, QPointF(0.0, 0.0)), name2, colors::POINT);
    p2.point()->onLineId = side1;

    return {
        named(createPolarLine(side1, vertex->id, conic->id),
              QStringLiteral("p(%1)").arg(name1), colors::HELPER),
        p2,
        named(createPolarLine(side2, vertex2, conic->id),
              QStringLiteral("p(%1)").arg(name2), colors::HELPER),
        named(createLineLinePoint(vertex3, side1, side2), name3, colors::POINT),
        named(createPolarLine(side3, vertex3, conic->id),
              QStringLiteral("p(%1)").arg(name3), colors::HELPER),
    };
}

// =====================================================================
//  Demo Scene
// =====================================================================

QVector<Entity> buildDemoScene()
{
    geometry::ConicParams ellipse;
    ellipse.type = geometry::ConicType::Ellipse;
    ellipse.cx = 0.0;
    ellipse.cy = 0.0;
    ellipse.a = 3.0;
    ellipse.b = 2.0;
    ellipse.rotation = 0.0;

    const QStringList palette = colorPalette();

    Entity c1 = named(createConic(1, ellipse), QStringLiteral("Ellipse"));
    Entity pA = named(createPoint(2, QPointF(-4.0, 3.0)), QStringLiteral("A"));
    Entity pB = named(createPoint(3, QPointF(-1.0, 4.0)), QStringLiteral("B"));
    Entity lAB = named(createTwoPointLine(4, 2, 3), QStringLiteral("L(AB)"));
    lAB.color = palette[4];

    Entity pivot = named(createPoint(5, QPointF(2.0, -2.0)), QStringLiteral("Pivot"));
    pivot.color = palette[2];
    Entity rot = named(createPivotLine(6, 5, M_PI / 3.0), QStringLiteral("RotLine"));
    rot.color = palette[2];

    Entity i1 = named(createLineConicPoint(7, 6, 1, 0), QStringLiteral("I1"));
    i1.color = palette[5];
    Entity i2 = named(createLineConicPoint(8, 6, 1, 1), QStringLiteral("I2"));
    i2.color = palette[5];

    return { c1, pA, pB, lAB, pivot, rot, i1, i2 };
}

}  // namespace scene
}  // namespace conica
