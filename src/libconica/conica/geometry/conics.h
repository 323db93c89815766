// =====================================================================
//  src/libconica/conica/geometry/conics.h — Conic conversions and duality
// =====================================================================
//
//  Conversions between the standard parameters of a conic and its
//  general second-degree equation, classification by discriminant,
//  and pole/polar duality through the conic matrix.
//
//  All functions are total: singular inputs produce a documented
//  fallback instead of NaN or an exception.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_GEOMETRY_CONICS_H
#define CONICA_GEOMETRY_CONICS_H

#include "types.h"

namespace conica {
namespace geometry {

// =====================================================================
//  Standard <-> General Form
// =====================================================================

/// Expand standard parameters into general coefficients (A..F)
///
/// Ellipse / hyperbola: rotated and translated x'^2/a^2 +/- y'^2/b^2 = 1.
/// Parabola: rotated and translated y'^2 = 4 a x'.
///
/// An ellipse or hyperbola with a zero semi-axis has no finite
/// expansion; all-zero coefficients are returned for it.
CONICA_EXPORT ConicCoefficients standardToGeneral(const ConicParams& params);

/// Recover standard parameters from general coefficients
///
/// Classifies by B^2 - 4AC with DEFAULT_TOLERANCE.  Ellipses and
/// hyperbolas get center, rotation in (-pi/2, pi/2] and semi-axes
/// (non-finite axes fall back to 1).  For a parabola only the type is
/// returned (complete == false).
///
/// The recovered (a, rotation) pair is canonical: an ellipse whose
/// major axis lies along its rotated y' axis comes back with a and b
/// swapped and rotation shifted by pi/2.  Both describe the same curve.
CONICA_EXPORT StandardConversion generalToStandard(const ConicCoefficients& coeffs);

/// Classify general coefficients by discriminant
CONICA_EXPORT ConicType classifyConic(const ConicCoefficients& coeffs,
                                      double tolerance = DEFAULT_TOLERANCE);

// =====================================================================
//  Conic Matrix and Duality
// =====================================================================

/// Symmetric matrix [[A, B/2, D/2], [B/2, C, E/2], [D/2, E/2, F]]
CONICA_EXPORT ConicMatrix conicMatrix(const ConicCoefficients& coeffs);

/// Polar line of a point with respect to a conic
///
/// The homogeneous point (px, py, 1) times the conic matrix gives the
/// line coefficients directly.  A point on the conic yields the tangent
/// at that point; the center of a central conic yields a zero line.
CONICA_EXPORT LineCoefficients polarLine(const QPointF& pole,
                                         const ConicCoefficients& coeffs);

/// Pole of a line with respect to a conic (inverse of polarLine)
///
/// Returns nullopt for a degenerate conic matrix or when the pole lies
/// at infinity (e.g. a line through the center of an ellipse).
CONICA_EXPORT std::optional<QPointF> poleOfLine(const LineCoefficients& line,
                                                const ConicCoefficients& coeffs);

}  // namespace geometry
}  // namespace conica

#endif  // CONICA_GEOMETRY_CONICS_H
