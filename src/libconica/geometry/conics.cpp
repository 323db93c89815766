// =====================================================================
//  src/libconica/geometry/conics.cpp — Conic conversions and duality
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/geometry/conics.h>

#include <cmath>

namespace conica {
namespace geometry {

// =====================================================================
//  Standard -> General
// =====================================================================

namespace {

ConicCoefficients centralConicToGeneral(const ConicParams& p, double sign)
{
    ConicCoefficients k;

    if (qAbs(p.a) < DEFAULT_TOLERANCE || qAbs(p.b) < DEFAULT_TOLERANCE) {
        // Collapsed axis: no finite expansion
        return k;
    }

    const double cs = std::cos(p.rotation);
    const double sn = std::sin(p.rotation);

    // Axis-aligned at origin: A0 x'^2 + C0 y'^2 = 1
    const double A0 = 1.0 / (p.a * p.a);
    const double C0 = sign / (p.b * p.b);

    // Rotate by `rotation`
    k.A = A0 * cs * cs + C0 * sn * sn;
    k.B = 2.0 * (A0 - C0) * cs * sn;
    k.C = A0 * sn * sn + C0 * cs * cs;

    // Translate to (cx, cy)
    k.D = -2.0 * k.A * p.cx - k.B * p.cy;
    k.E = -k.B * p.cx - 2.0 * k.C * p.cy;
    k.F = k.A * p.cx * p.cx + k.B * p.cx * p.cy + k.C * p.cy * p.cy - 1.0;

    return k;
}

ConicCoefficients parabolaToGeneral(const ConicParams& p)
{
    ConicCoefficients k;

    const double cs = std::cos(p.rotation);
    const double sn = std::sin(p.rotation);

    // y'^2 - 4 a x' = 0 with x' = (x-cx) cos + (y-cy) sin,
    //                       y' = -(x-cx) sin + (y-cy) cos
    k.A = sn * sn;
    k.B = -2.0 * sn * cs;
    k.C = cs * cs;

    const double L1 = -4.0 * p.a * cs;
    const double L2 = -4.0 * p.a * sn;

    k.D = -2.0 * k.A * p.cx - k.B * p.cy + L1;
    k.E = -k.B * p.cx - 2.0 * k.C * p.cy + L2;
    k.F = k.A * p.cx * p.cx + k.B * p.cx * p.cy + k.C * p.cy * p.cy
        - L1 * p.cx - L2 * p.cy;

    return k;
}

}  // namespace

ConicCoefficients standardToGeneral(const ConicParams& params)
{
    switch (params.type) {
    case ConicType::Ellipse:
        return centralConicToGeneral(params, 1.0);
    case ConicType::Hyperbola:
        return centralConicToGeneral(params, -1.0);
    case ConicType::Parabola:
        return parabolaToGeneral(params);
    }
    return ConicCoefficients();
}

// =====================================================================
//  General -> Standard
// =====================================================================

ConicType classifyConic(const ConicCoefficients& coeffs, double tolerance)
{
    const double delta = coeffs.discriminant();
    if (qAbs(delta) < tolerance) return ConicType::Parabola;
    return delta > 0.0 ? ConicType::Hyperbola : ConicType::Ellipse;
}

StandardConversion generalToStandard(const ConicCoefficients& coeffs)
{
    StandardConversion result;
    result.type = classifyConic(coeffs);

    if (result.type == ConicType::Parabola) {
        // Vertex/focal recovery is not implemented; type only.
        return result;
    }

    const double A = coeffs.A;
    const double B = coeffs.B;
    const double C = coeffs.C;
    const double D = coeffs.D;
    const double E = coeffs.E;
    const double F = coeffs.F;

    // Center: [[2A, B], [B, 2C]] (cx, cy) = (-D, -E)
    // det = 4AC - B^2 = -discriminant, nonzero past classification
    const double det = 4.0 * A * C - B * B;
    const double cx = (B * E - 2.0 * C * D) / det;
    const double cy = (B * D - 2.0 * A * E) / det;

    // Constant term after translating to the center
    const double Fp = F + (D * cx + E * cy) / 2.0;

    double theta = 0.0;
    if (qAbs(B) >= DEFAULT_TOLERANCE) {
        theta = 0.5 * std::atan2(B, A - C);
    }

    const double ct = std::cos(theta);
    const double st = std::sin(theta);
    const double Ap = A * ct * ct + B * st * ct + C * st * st;
    const double Cp = A * st * st - B * st * ct + C * ct * ct;

    // Ap u^2 + Cp v^2 = -Fp
    double a = std::sqrt(qAbs(Fp / Ap));
    double b = std::sqrt(qAbs(Fp / Cp));

    result.complete = true;
    result.params.type = result.type;
    result.params.cx = cx;
    result.params.cy = cy;
    result.params.a = std::isfinite(a) ? a : 1.0;
    result.params.b = std::isfinite(b) ? b : 1.0;
    result.params.rotation = theta;

    return result;
}

// =====================================================================
//  Conic Matrix and Duality
// =====================================================================

ConicMatrix conicMatrix(const ConicCoefficients& k)
{
    ConicMatrix m;
    m[0] = { k.A,       k.B / 2.0, k.D / 2.0 };
    m[1] = { k.B / 2.0, k.C,       k.E / 2.0 };
    m[2] = { k.D / 2.0, k.E / 2.0, k.F       };
    return m;
}

LineCoefficients polarLine(const QPointF& pole, const ConicCoefficients& coeffs)
{
    const ConicMatrix m = conicMatrix(coeffs);
    const double v[3] = { pole.x(), pole.y(), 1.0 };

    LineCoefficients line;
    line.a = m[0][0] * v[0] + m[0][1] * v[1] + m[0][2] * v[2];
    line.b = m[1][0] * v[0] + m[1][1] * v[1] + m[1][2] * v[2];
    line.c = m[2][0] * v[0] + m[2][1] * v[1] + m[2][2] * v[2];
    return line;
}

std::optional<QPointF> poleOfLine(const LineCoefficients& line,
                                  const ConicCoefficients& coeffs)
{
    const ConicMatrix m = conicMatrix(coeffs);

    // Adjugate of the symmetric matrix (cofactors)
    const double c00 = m[1][1] * m[2][2] - m[1][2] * m[2][1];
    const double c01 = m[1][2] * m[2][0] - m[1][0] * m[2][2];
    const double c02 = m[1][0] * m[2][1] - m[1][1] * m[2][0];
    const double c11 = m[0][0] * m[2][2] - m[0][2] * m[2][0];
    const double c12 = m[0][1] * m[2][0] - m[0][0] * m[2][1];
    const double c22 = m[0][0] * m[1][1] - m[0][1] * m[1][0];

    const double det = m[0][0] * c00 + m[0][1] * c01 + m[0][2] * c02;
    if (qAbs(det) < DEFAULT_TOLERANCE) {
        return std::nullopt;
    }

    // X ~ adj(M) * L; the 1/det factor cancels in the dehomogenization
    const double x = c00 * line.a + c01 * line.b + c02 * line.c;
    const double y = c01 * line.a + c11 * line.b + c12 * line.c;
    const double w = c02 * line.a + c12 * line.b + c22 * line.c;

    if (qAbs(w) < DEFAULT_TOLERANCE) {
        return std::nullopt;
    }

    return QPointF(x / w, y / w);
}

}  // namespace geometry
}  // namespace conica
