// =====================================================================
//  src/libconica/geometry/types.cpp — Basic analytic geometry types
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/geometry/types.h>

namespace conica {
namespace geometry {

// =====================================================================
//  ConicCoefficients
// =====================================================================

double ConicCoefficients::evaluate(const QPointF& p) const
{
    const double x = p.x();
    const double y = p.y();
    return A * x * x + B * x * y + C * y * y + D * x + E * y + F;
}

// =====================================================================
//  LineConicIntersection
// =====================================================================

std::optional<QPointF> LineConicIntersection::solution(int index) const
{
    if (count < 2) return std::nullopt;
    if (index == 0) return point1;
    if (index == 1) return point2;
    return std::nullopt;
}

QVector<QPointF> LineConicIntersection::points() const
{
    if (count < 2) return {};
    return { point1, point2 };
}

// =====================================================================
//  Naming
// =====================================================================

const char* conicTypeName(ConicType type)
{
    switch (type) {
    case ConicType::Ellipse:   return "Ellipse";
    case ConicType::Hyperbola: return "Hyperbola";
    case ConicType::Parabola:  return "Parabola";
    }
    return "Unknown";
}

}  // namespace geometry
}  // namespace conica
