// =====================================================================
//  src/libconica/conica/geometry/utils.h — Line construction utilities
// =====================================================================
//
//  Closed-form line constructors and small helpers on implicit lines.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_GEOMETRY_UTILS_H
#define CONICA_GEOMETRY_UTILS_H

#include "types.h"

namespace conica {
namespace geometry {

// =====================================================================
//  Line Construction
// =====================================================================

/// Line through two points: a = y1 - y2, b = x2 - x1, c = -a x1 - b y1
/// Coincident points give the zero line (0, 0, 0).
CONICA_EXPORT LineCoefficients lineFromTwoPoints(const QPointF& p1, const QPointF& p2);

/// Line through a point with direction angle (radians, CCW from +X)
/// The normal is (-sin, cos), so the result is always unit-normalized.
CONICA_EXPORT LineCoefficients lineFromPointAndAngle(const QPointF& point, double angle);

/// Translate a line by (dx, dy): c' = c - a dx - b dy
CONICA_EXPORT LineCoefficients translateLine(const LineCoefficients& line,
                                             double dx, double dy);

// =====================================================================
//  Line Queries
// =====================================================================

/// Direction angle of a line in radians, in (-pi, pi]
/// The direction is (b, -a); a degenerate line returns 0.
CONICA_EXPORT double lineAngle(const LineCoefficients& line);

/// Scale (a, b, c) so that a^2 + b^2 = 1 (degenerate lines unchanged)
CONICA_EXPORT LineCoefficients normalizeLine(const LineCoefficients& line);

/// Check if two lines describe the same set of points within tolerance
CONICA_EXPORT bool sameLine(const LineCoefficients& l1, const LineCoefficients& l2,
                            double tolerance = 1e-6);

/// Check if a point lies on a conic within tolerance
CONICA_EXPORT bool pointOnConic(const QPointF& point, const ConicCoefficients& conic,
                                double tolerance = 1e-6);

}  // namespace geometry
}  // namespace conica

#endif  // CONICA_GEOMETRY_UTILS_H
