// =====================================================================
//  src/libconica/conica/geometry/types.h — Basic analytic geometry types
// =====================================================================
//
//  Lightweight value types for lines in implicit form, conics in
//  standard and general form, and the results of intersection queries.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_GEOMETRY_TYPES_H
#define CONICA_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QVector>
#include <QtMath>

#include <array>
#include <optional>

namespace conica {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Tolerance for determinants, discriminants and near-zero coefficients
constexpr double DEFAULT_TOLERANCE = 1e-9;

// =====================================================================
//  Lines
// =====================================================================

/// Line in implicit form: a*x + b*y + c = 0
///
/// (0, 0, c) is a degenerate "zero line".  It appears transiently, e.g.
/// when the two defining points of a line coincide mid-drag, and every
/// function in this library accepts it.
struct LineCoefficients {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;

    /// True if (a, b) is a zero-length normal
    bool isDegenerate() const { return a * a + b * b == 0.0; }

    /// Evaluate a*x + b*y + c at a point (signed, not normalized)
    double evaluate(const QPointF& p) const { return a * p.x() + b * p.y() + c; }

    bool operator==(const LineCoefficients& o) const
    {
        return a == o.a && b == o.b && c == o.c;
    }
    bool operator!=(const LineCoefficients& o) const { return !(*this == o); }
};

// =====================================================================
//  Conics
// =====================================================================

/// Conic classification
enum class ConicType {
    Ellipse,     ///< B^2 - 4AC < 0
    Hyperbola,   ///< B^2 - 4AC > 0
    Parabola     ///< B^2 - 4AC = 0
};

/// General equation: A x^2 + B xy + C y^2 + D x + E y + F = 0
struct CONICA_EXPORT ConicCoefficients {
    double A = 0.0;
    double B = 0.0;
    double C = 0.0;
    double D = 0.0;
    double E = 0.0;
    double F = 0.0;

    /// Discriminant B^2 - 4AC
    double discriminant() const { return B * B - 4.0 * A * C; }

    /// Evaluate the left-hand side at a point
    double evaluate(const QPointF& p) const;

    bool operator==(const ConicCoefficients& o) const
    {
        return A == o.A && B == o.B && C == o.C
            && D == o.D && E == o.E && F == o.F;
    }
    bool operator!=(const ConicCoefficients& o) const { return !(*this == o); }
};

/// Standard parameters of a conic
///
/// Ellipse / hyperbola: x'^2/a^2 +/- y'^2/b^2 = 1 in a frame rotated by
/// `rotation` (radians, CCW) and centered at (cx, cy).
/// Parabola: y'^2 = 4 a x' with vertex at (cx, cy); b is unused.
struct ConicParams {
    ConicType type = ConicType::Ellipse;
    double cx = 0.0;
    double cy = 0.0;
    double a = 1.0;          ///< Semi-major axis, or focal distance for a parabola
    double b = 1.0;          ///< Semi-minor axis (ellipse / hyperbola)
    double rotation = 0.0;   ///< Radians

    QPointF center() const { return QPointF(cx, cy); }

    bool operator==(const ConicParams& o) const
    {
        return type == o.type && cx == o.cx && cy == o.cy
            && a == o.a && b == o.b && rotation == o.rotation;
    }
    bool operator!=(const ConicParams& o) const { return !(*this == o); }
};

/// Symmetric 3x3 matrix of a conic: X^T M X = 0 with X = (x, y, 1)
using ConicMatrix = std::array<std::array<double, 3>, 3>;

/// Result of converting general coefficients back to standard form
///
/// For a parabola only `type` is meaningful; `params` is not filled and
/// `complete` is false.
struct StandardConversion {
    ConicType type = ConicType::Ellipse;
    bool complete = false;        ///< Whether params carries cx, cy, a, b, rotation
    ConicParams params;
};

// =====================================================================
//  Intersection Results
// =====================================================================

/// Result of a line-line intersection
struct LineLineIntersection {
    bool intersects = false;      ///< Whether the lines meet in one point
    bool parallel = false;        ///< Parallel or coincident (|det| below tolerance)
    QPointF point;                ///< Intersection point (if intersects)
};

/// Result of a line-conic intersection
///
/// Real intersections are always reported as a pair in a fixed order:
/// point1 uses +sqrt(disc), point2 uses -sqrt(disc).  A tangent line
/// yields two equal points.  count is 0 or 2.
struct CONICA_EXPORT LineConicIntersection {
    int count = 0;                ///< 0 (no real points) or 2
    QPointF point1;               ///< Root taken with +sqrt(disc)
    QPointF point2;               ///< Root taken with -sqrt(disc)
    double discriminant = 0.0;    ///< Discriminant of the substituted quadratic

    /// Solution by index (0 or 1), or nullopt if absent
    std::optional<QPointF> solution(int index) const;

    /// Solutions as a vector (empty or two points)
    QVector<QPointF> points() const;
};

// =====================================================================
//  Naming
// =====================================================================

/// Human-readable conic type name ("Ellipse", "Hyperbola", "Parabola")
CONICA_EXPORT const char* conicTypeName(ConicType type);

}  // namespace geometry
}  // namespace conica

#endif  // CONICA_GEOMETRY_TYPES_H
