// =====================================================================
//  src/libconica/conica/scene/constructions.h — Compound constructions
// =====================================================================
//
//  Builders for everything an editing tool can add to a scene.  Each
//  builder validates its operands against the current collection and
//  returns the entities to insert, with ids allocated after every id
//  already in use.  An empty result means the operands were wrong.
//
//  Nothing is inserted or resolved here; pass the result to
//  createEntities() or Scene::createAll().
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_CONSTRUCTIONS_H
#define CONICA_SCENE_CONSTRUCTIONS_H

#include "entity.h"
#include "../core.h"

#include <QPointF>
#include <QString>
#include <QStringList>
#include <QVector>

namespace conica {
namespace scene {

// =====================================================================
//  Presentation Defaults
// =====================================================================

namespace colors {
constexpr const char* POINT = "#ffffff";
constexpr const char* LINE = "#3b82f6";
constexpr const char* CONIC = "#f59e0b";
constexpr const char* POLAR = "#ef4444";
constexpr const char* TANGENT = "#a78bfa";
constexpr const char* TANGENCY = "#d1d5db";
constexpr const char* HELPER = "#666666";
}  // namespace colors

/// The six-color default palette
CONICA_EXPORT QStringList colorPalette();

/// Next automatic name for a kind: P<n>, L<n> or C<n>, where n is one
/// more than the number of entities of that kind
CONICA_EXPORT QString defaultName(const QVector<Entity>& entities, EntityKind kind);

// =====================================================================
//  Single Entities
// =====================================================================

/// Free point at `position`
CONICA_EXPORT QVector<Entity> buildFreePoint(const QVector<Entity>& entities,
                                             const QPointF& position);

/// Point bound to a line, seeded at `position`
CONICA_EXPORT QVector<Entity> buildPointOnLine(const QVector<Entity>& entities,
                                               EntityId lineId, const QPointF& position);

/// Free line of slope 1 through `position`
CONICA_EXPORT QVector<Entity> buildFreeLine(const QVector<Entity>& entities,
                                            const QPointF& position);

/// Line through a point at angle 0, rotatable by editing its angle
CONICA_EXPORT QVector<Entity> buildPivotLine(const QVector<Entity>& entities,
                                             EntityId pivotId);

/// Line through two distinct points
CONICA_EXPORT QVector<Entity> buildTwoPointLine(const QVector<Entity>& entities,
                                                EntityId p1, EntityId p2);

/// Ellipse centered at `center` with a = 2, b = 1
CONICA_EXPORT QVector<Entity> buildDefaultConic(const QVector<Entity>& entities,
                                                const QPointF& center);

// =====================================================================
//  Intersections and Duality
// =====================================================================

/// Intersection point of two distinct lines
CONICA_EXPORT QVector<Entity> buildLineLineIntersection(const QVector<Entity>& entities,
                                                        EntityId line1, EntityId line2);

/// Both intersection points of a line and a conic (operands in either
/// order).  Returns the points with solution index 0 and 1.
CONICA_EXPORT QVector<Entity> buildLineConicIntersections(const QVector<Entity>& entities,
                                                          EntityId first, EntityId second);

/// Polar line of a point w.r.t. a conic (operands in either order)
CONICA_EXPORT QVector<Entity> buildPolarLine(const QVector<Entity>& entities,
                                             EntityId first, EntityId second);

/// Tangent lines from a point to a conic (operands in either order)
///
/// Adds five entities: the hidden polar of the point, the two tangency
/// points T1/T2 on it and the lines from the point through each.  The
/// tangency points hide when the point is inside the conic.
CONICA_EXPORT QVector<Entity> buildTangents(const QVector<Entity>& entities,
                                            EntityId first, EntityId second);

/// Self-polar triangle of a conic from a point P (operands in either
/// order)
///
/// Adds p(P), a point P' free to slide on p(P), p(P'), the vertex
/// P'' = p(P) x p(P') and p(P'').  Each vertex is then the pole of the
/// opposite side.  The chain is five levels deep, so it settles over
/// several resolutions.
CONICA_EXPORT QVector<Entity> buildSelfPolarTriangle(const QVector<Entity>& entities,
                                                     EntityId first, EntityId second);

// =====================================================================
//  Demo Scene
// =====================================================================

/// Starter scene: an ellipse, a line through two points and a pivot
/// line with its two intersections with the ellipse (unresolved)
CONICA_EXPORT QVector<Entity> buildDemoScene();

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_CONSTRUCTIONS_H
