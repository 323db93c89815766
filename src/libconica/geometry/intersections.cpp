// =====================================================================
//  src/libconica/geometry/intersections.cpp — Intersection functions
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/geometry/intersections.h>

#include <cmath>

namespace conica {
namespace geometry {

// =====================================================================
//  Line-Line Intersection
// =====================================================================

LineLineIntersection lineLineIntersection(
    const LineCoefficients& l1, const LineCoefficients& l2)
{
    LineLineIntersection result;

    const double det = l1.a * l2.b - l2.a * l1.b;

    if (qAbs(det) < DEFAULT_TOLERANCE) {
        result.parallel = true;
        return result;
    }

    result.point = QPointF((l1.b * l2.c - l2.b * l1.c) / det,
                           (l1.c * l2.a - l2.c * l1.a) / det);
    result.intersects = true;
    return result;
}

// =====================================================================
//  Line-Conic Intersection
// =====================================================================

namespace {

/// qa t^2 + qb t + qc = 0, with the summed magnitudes of the terms each
/// coefficient is built from.  Thresholds are relative to these, so they
/// follow the scale of the conic.
struct Quadratic {
    double qa = 0.0;
    double qb = 0.0;
    double qc = 0.0;
    double qaSize = 0.0;
    double qbSize = 0.0;
    double qcSize = 0.0;
};

/// Roots in (+sqrt, -sqrt) order.  Returns false when there is no real root.
bool solveQuadratic(const Quadratic& q, double& t1, double& t2, double& disc)
{
    // Quadratic term cancels out: the line runs along an asymptotic
    // direction (parabola axis, hyperbola asymptote)
    if (qAbs(q.qa) <= DEFAULT_TOLERANCE * q.qaSize) {
        // Linear: one crossing, reported in both slots
        if (q.qb == 0.0) return false;
        t1 = t2 = -q.qc / q.qb;
        disc = q.qb * q.qb;
        return true;
    }

    disc = q.qb * q.qb - 4.0 * q.qa * q.qc;

    if (disc < 0.0) {
        // Rounding noise on an exact tangency must not drop the pair
        const double scale = qMax(q.qbSize * q.qbSize, 4.0 * q.qaSize * q.qcSize);
        if (-disc > DEFAULT_TOLERANCE * scale) return false;
        disc = 0.0;
    }

    const double s = std::sqrt(disc);
    t1 = (-q.qb + s) / (2.0 * q.qa);
    t2 = (-q.qb - s) / (2.0 * q.qa);
    return true;
}

}  // namespace

LineConicIntersection lineConicIntersection(
    const LineCoefficients& line, const ConicCoefficients& k)
{
    LineConicIntersection result;

    const double a = line.a;
    const double b = line.b;
    const double c = line.c;

    if (qAbs(a) < DEFAULT_TOLERANCE && qAbs(b) < DEFAULT_TOLERANCE) {
        // Degenerate line
        return result;
    }

    Quadratic q;

    if (qAbs(b) < DEFAULT_TOLERANCE) {
        // Near-vertical: x fixed, quadratic in y
        //   C y^2 + (B x + E) y + (A x^2 + D x + F) = 0
        const double x = -c / a;
        q.qa = k.C;
        q.qb = k.B * x + k.E;
        q.qc = k.A * x * x + k.D * x + k.F;
        q.qaSize = qAbs(k.C);
        q.qbSize = qAbs(k.B * x) + qAbs(k.E);
        q.qcSize = qAbs(k.A * x * x) + qAbs(k.D * x) + qAbs(k.F);

        double y1 = 0.0, y2 = 0.0;
        if (!solveQuadratic(q, y1, y2, result.discriminant)) {
            return result;
        }

        result.count = 2;
        result.point1 = QPointF(x, y1);
        result.point2 = QPointF(x, y2);
        return result;
    }

    // y = k x + m
    const double slope = -a / b;
    const double m = -c / b;

    q.qa = k.A + k.B * slope + k.C * slope * slope;
    q.qb = k.B * m + 2.0 * k.C * slope * m + k.D + k.E * slope;
    q.qc = k.C * m * m + k.E * m + k.F;
    q.qaSize = qAbs(k.A) + qAbs(k.B * slope) + qAbs(k.C * slope * slope);
    q.qbSize = qAbs(k.B * m) + qAbs(2.0 * k.C * slope * m) + qAbs(k.D) + qAbs(k.E * slope);
    q.qcSize = qAbs(k.C * m * m) + qAbs(k.E * m) + qAbs(k.F);

    double x1 = 0.0, x2 = 0.0;
    if (!solveQuadratic(q, x1, x2, result.discriminant)) {
        return result;
    }

    result.count = 2;
    result.point1 = QPointF(x1, slope * x1 + m);
    result.point2 = QPointF(x2, slope * x2 + m);
    return result;
}

// =====================================================================
//  Projection
// =====================================================================

QPointF closestPointOnLine(const QPointF& point, const LineCoefficients& line)
{
    const double a = line.a;
    const double b = line.b;
    const double c = line.c;

    const double denom = a * a + b * b;
    if (denom == 0.0) {
        return point;
    }

    const double px = point.x();
    const double py = point.y();
    return QPointF((b * (b * px - a * py) - a * c) / denom,
                   (a * (a * py - b * px) - b * c) / denom);
}

double pointToLineDistance(const QPointF& point, const LineCoefficients& line)
{
    const double norm = std::sqrt(line.a * line.a + line.b * line.b);
    if (norm == 0.0) {
        return 0.0;
    }
    return qAbs(line.evaluate(point)) / norm;
}

}  // namespace geometry
}  // namespace conica
