// =====================================================================
//  src/libconica/geometry/utils.cpp — Line construction utilities
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/geometry/utils.h>

#include <cmath>

namespace conica {
namespace geometry {

// =====================================================================
//  Line Construction
// =====================================================================

LineCoefficients lineFromTwoPoints(const QPointF& p1, const QPointF& p2)
{
    LineCoefficients line;
    line.a = p1.y() - p2.y();
    line.b = p2.x() - p1.x();
    line.c = -line.a * p1.x() - line.b * p1.y();
    return line;
}

LineCoefficients lineFromPointAndAngle(const QPointF& point, double angle)
{
    LineCoefficients line;
    line.a = -std::sin(angle);
    line.b = std::cos(angle);
    line.c = -line.a * point.x() - line.b * point.y();
    return line;
}

LineCoefficients translateLine(const LineCoefficients& line, double dx, double dy)
{
    LineCoefficients moved = line;
    moved.c = line.c - line.a * dx - line.b * dy;
    return moved;
}

// =====================================================================
//  Line Queries
// =====================================================================

double lineAngle(const LineCoefficients& line)
{
    if (line.isDegenerate()) return 0.0;
    return std::atan2(-line.a, line.b);
}

LineCoefficients normalizeLine(const LineCoefficients& line)
{
    const double norm = std::sqrt(line.a * line.a + line.b * line.b);
    if (norm == 0.0) return line;

    LineCoefficients n;
    n.a = line.a / norm;
    n.b = line.b / norm;
    n.c = line.c / norm;
    return n;
}

bool sameLine(const LineCoefficients& l1, const LineCoefficients& l2, double tolerance)
{
    if (l1.isDegenerate() || l2.isDegenerate()) {
        return l1.isDegenerate() && l2.isDegenerate();
    }

    const LineCoefficients n1 = normalizeLine(l1);
    const LineCoefficients n2 = normalizeLine(l2);

    auto close = [tolerance](const LineCoefficients& p, const LineCoefficients& q, double s) {
        return qAbs(p.a - s * q.a) < tolerance
            && qAbs(p.b - s * q.b) < tolerance
            && qAbs(p.c - s * q.c) < tolerance;
    };

    return close(n1, n2, 1.0) || close(n1, n2, -1.0);
}

bool pointOnConic(const QPointF& point, const ConicCoefficients& conic, double tolerance)
{
    return qAbs(conic.evaluate(point)) < tolerance;
}

}  // namespace geometry
}  // namespace conica
