// =====================================================================
//  src/libconica/conica/geometry/intersections.h — Intersection functions
// =====================================================================
//
//  Intersections and projections between implicit lines and conics.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_GEOMETRY_INTERSECTIONS_H
#define CONICA_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace conica {
namespace geometry {

// =====================================================================
//  Line Intersections
// =====================================================================

/// Intersect two implicit lines
/// @return parallel == true when |a1*b2 - a2*b1| < DEFAULT_TOLERANCE
///         (parallel, coincident or degenerate lines)
CONICA_EXPORT LineLineIntersection lineLineIntersection(
    const LineCoefficients& l1, const LineCoefficients& l2);

// =====================================================================
//  Line-Conic Intersections
// =====================================================================

/// Intersect an implicit line with a conic in general form
///
/// A near-vertical line (|b| < DEFAULT_TOLERANCE) is solved as a
/// quadratic in y at x = -c/a; any other line is written as y = kx + m
/// and solved as a quadratic in x.  A negative discriminant gives no
/// points; otherwise both roots are returned in (+sqrt, -sqrt) order.
///
/// When the quadratic term vanishes (line parallel to an asymptote or
/// to a parabola's axis) the single linear root fills both slots.
/// A degenerate line intersects nothing.
CONICA_EXPORT LineConicIntersection lineConicIntersection(
    const LineCoefficients& line, const ConicCoefficients& conic);

// =====================================================================
//  Projection
// =====================================================================

/// Foot of the perpendicular from a point to a line
/// Returns the point unchanged when a^2 + b^2 == 0.
CONICA_EXPORT QPointF closestPointOnLine(
    const QPointF& point, const LineCoefficients& line);

/// Distance from a point to a line (0 for a degenerate line)
CONICA_EXPORT double pointToLineDistance(
    const QPointF& point, const LineCoefficients& line);

}  // namespace geometry
}  // namespace conica

#endif  // CONICA_GEOMETRY_INTERSECTIONS_H
