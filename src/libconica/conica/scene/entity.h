// =====================================================================
//  src/libconica/conica/scene/entity.h — Scene entity types
// =====================================================================
//
//  A scene is a flat collection of entities addressed by stable integer
//  ids.  Each entity is a tagged variant of Point, Line or Conic data
//  plus the presentation attributes shared by all kinds.
//
//  Derived attributes (coordinates of constructed points, coefficients
//  of constructed lines, general coefficients of conics) are written by
//  the resolver; free attributes are written by edits.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_ENTITY_H
#define CONICA_SCENE_ENTITY_H

#include "../core.h"
#include "../geometry/types.h"

#include <QPointF>
#include <QString>
#include <QVector>

#include <optional>
#include <variant>

namespace conica {
namespace scene {

/// Stable entity key.  Valid ids are positive.
using EntityId = int;

/// "No entity" marker for optional references
constexpr EntityId NoEntity = 0;

// =====================================================================
//  Entity Kinds
// =====================================================================

enum class EntityKind {
    Point,
    Line,
    Conic
};

/// A point: free, projected onto a line, or an intersection
struct PointData {
    QPointF position;
    bool isFree = true;                    ///< Coordinates are user-authoritative
    EntityId onLineId = NoEntity;          ///< Reprojected onto this line every pass
    std::optional<int> solutionIndex;      ///< Selects a line-conic solution (0 or 1)
};

/// A line a*x + b*y + c = 0
///
/// Construction mode, in resolver priority order:
///  - pivot + angle (pivotPointId and angle set)
///  - two points (p1Id and p2Id set)
///  - polar of a point w.r.t. a conic (two entries in `dependencies`)
///  - free-standing (coefficients authoritative)
struct LineData {
    geometry::LineCoefficients coeffs;
    bool isFree = true;
    EntityId p1Id = NoEntity;
    EntityId p2Id = NoEntity;
    EntityId pivotPointId = NoEntity;
    std::optional<double> angle;           ///< Radians, for pivot lines

    bool hasPivot() const { return pivotPointId != NoEntity && angle.has_value(); }
    bool hasTwoPoints() const { return p1Id != NoEntity && p2Id != NoEntity; }
};

/// A conic: standard parameters are authoritative, coefficients are
/// a cached function of them after every resolution pass
struct ConicData {
    geometry::ConicParams params;
    geometry::ConicCoefficients coeffs;
};

using EntityData = std::variant<PointData, LineData, ConicData>;

// =====================================================================
//  Entity
// =====================================================================

struct CONICA_EXPORT Entity {
    EntityId id = NoEntity;
    QString name;
    QString color;                         ///< "#rrggbb"
    bool hidden = false;

    /// Generic operand list.  Meaning depends on kind:
    ///  Point: [line, line] or [line, conic] (any order)
    ///  Line:  [point, conic] (any order) for a polar line
    QVector<EntityId> dependencies;

    EntityData data = PointData();

    EntityKind kind() const;

    bool isPoint() const { return std::holds_alternative<PointData>(data); }
    bool isLine() const { return std::holds_alternative<LineData>(data); }
    bool isConic() const { return std::holds_alternative<ConicData>(data); }

    /// Typed access; nullptr when the entity is of another kind
    const PointData* point() const { return std::get_if<PointData>(&data); }
    PointData* point() { return std::get_if<PointData>(&data); }
    const LineData* line() const { return std::get_if<LineData>(&data); }
    LineData* line() { return std::get_if<LineData>(&data); }
    const ConicData* conic() const { return std::get_if<ConicData>(&data); }
    ConicData* conic() { return std::get_if<ConicData>(&data); }

    /// True if the entity's primary attributes are user-authoritative
    bool isFree() const;
};

// =====================================================================
//  Entity Factory Functions
// =====================================================================

/// Free point
CONICA_EXPORT Entity createPoint(EntityId id, const QPointF& position);

/// Point projected onto a line every pass (seeded at `position`)
CONICA_EXPORT Entity createPointOnLine(EntityId id, EntityId lineId,
                                       const QPointF& position);

/// Intersection of two lines
CONICA_EXPORT Entity createLineLinePoint(EntityId id, EntityId line1, EntityId line2);

/// One of the two intersections of a line with a conic
CONICA_EXPORT Entity createLineConicPoint(EntityId id, EntityId lineId,
                                          EntityId conicId, int solutionIndex);

/// Free line with explicit coefficients
CONICA_EXPORT Entity createLine(EntityId id, const geometry::LineCoefficients& coeffs);

/// Line through two points
CONICA_EXPORT Entity createTwoPointLine(EntityId id, EntityId p1, EntityId p2);

/// Line through a pivot point at an angle (radians)
CONICA_EXPORT Entity createPivotLine(EntityId id, EntityId pivot, double angle);

/// Polar line of a point w.r.t. a conic
CONICA_EXPORT Entity createPolarLine(EntityId id, EntityId pointId, EntityId conicId);

/// Conic from standard parameters (coefficients filled immediately)
CONICA_EXPORT Entity createConic(EntityId id, const geometry::ConicParams& params);

// =====================================================================
//  Entity Query Functions
// =====================================================================

/// Human-readable kind name ("Point", "Line", "Conic")
CONICA_EXPORT const char* entityKindName(EntityKind kind);

/// Find an entity by id, or nullptr
CONICA_EXPORT const Entity* findEntityById(const QVector<Entity>& entities, EntityId id);

/// Index of an entity in the collection, or -1
CONICA_EXPORT int indexOfEntity(const QVector<Entity>& entities, EntityId id);

/// Smallest id greater than every id in the collection (at least 1)
CONICA_EXPORT EntityId nextEntityId(const QVector<Entity>& entities);

/// Compare two entities, allowing `tolerance` on every real-valued
/// attribute.  Ids, names, flags and references must match exactly.
CONICA_EXPORT bool entitiesEquivalent(const Entity& e1, const Entity& e2,
                                      double tolerance = 1e-9);

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_ENTITY_H
