// =====================================================================
//  tests/test_constructions.cpp — Compound constructions
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <conica/geometry/conics.h>
#include <conica/geometry/utils.h>
#include <conica/scene/constructions.h>
#include <conica/scene/operations.h>

#include <QtMath>

using namespace conica_test;
using namespace conica::geometry;

namespace {

// Ellipse C1 (id 1) and point P (id 2) at (5, 0)
QVector<Entity> conicAndPoint(const QPointF& position = QPointF(5, 0))
{
    Entity c = createConic(1, ellipseParams(0, 0, 3, 2));
    c.name = QStringLiteral("C1");
    return { c, namedPoint(2, "P", position.x(), position.y()) };
}

QVector<Entity> insert(const QVector<Entity>& base, const QVector<Entity>& added,
                       int passCount = 3, ResolveReport* report = nullptr)
{
    ResolverOptions options;
    options.passCount = passCount;
    return createEntities(base, added, options, report);
}

}  // namespace

// ---- Defaults ------------------------------------------------------

TEST(Constructions, PaletteHasSixColors)
{
    const QStringList palette = colorPalette();
    ASSERT_EQ(palette.size(), 6);
    EXPECT_EQ(palette.first(), QStringLiteral("#3b82f6"));
    EXPECT_EQ(palette.last(), QStringLiteral("#ec4899"));
}

TEST(Constructions, DefaultNamesCountPerKind)
{
    const QVector<Entity> entities = conicAndPoint();
    EXPECT_EQ(defaultName(entities, EntityKind::Point), QStringLiteral("P2"));
    EXPECT_EQ(defaultName(entities, EntityKind::Line), QStringLiteral("L1"));
    EXPECT_EQ(defaultName(entities, EntityKind::Conic), QStringLiteral("C2"));
}

// ---- Single entities -----------------------------------------------

TEST(Constructions, FreePointAndLine)
{
    const QVector<Entity> point = buildFreePoint({}, QPointF(1, 2));
    ASSERT_EQ(point.size(), 1);
    EXPECT_EQ(point[0].id, 1);
    EXPECT_EQ(point[0].name, QStringLiteral("P1"));
    EXPECT_TRUE(point[0].isFree());

    // Slope 1 through the click point
    const QVector<Entity> line = buildFreeLine(point, QPointF(1, 2));
    ASSERT_EQ(line.size(), 1);
    EXPECT_EQ(line[0].id, 2);
    EXPECT_EQ(line[0].line()->coeffs, lineCoeffs(1, -1, 1));
    EXPECT_NEAR(line[0].line()->coeffs.evaluate(QPointF(1, 2)), 0.0, kEps);
}

TEST(Constructions, PointOnLineNeedsALine)
{
    const QVector<Entity> base = { createLine(1, lineCoeffs(1, 0, 0)), createPoint(2, QPointF()) };

    const QVector<Entity> bound = buildPointOnLine(base, 1, QPointF(3, 3));
    ASSERT_EQ(bound.size(), 1);
    EXPECT_EQ(bound[0].point()->onLineId, 1);
    EXPECT_FALSE(bound[0].isFree());

    EXPECT_TRUE(buildPointOnLine(base, 2, QPointF()).isEmpty());
    EXPECT_TRUE(buildPointOnLine(base, 9, QPointF()).isEmpty());
}

TEST(Constructions, PivotLineStartsHorizontal)
{
    const QVector<Entity> pivot = buildPivotLine(conicAndPoint(), 2);
    ASSERT_EQ(pivot.size(), 1);
    EXPECT_EQ(pivot[0].name, QStringLiteral("L(P)"));
    EXPECT_TRUE(pivot[0].isFree());
    EXPECT_DOUBLE_EQ(*pivot[0].line()->angle, 0.0);
    EXPECT_TRUE(buildPivotLine(conicAndPoint(), 1).isEmpty());
}

TEST(Constructions, TwoPointLineNeedsDistinctPoints)
{
    QVector<Entity> base = conicAndPoint();
    base.append(namedPoint(3, "Q", 0, 4));

    const QVector<Entity> line = buildTwoPointLine(base, 2, 3);
    ASSERT_EQ(line.size(), 1);
    EXPECT_EQ(line[0].name, QStringLiteral("L(P,Q)"));

    EXPECT_TRUE(buildTwoPointLine(base, 2, 2).isEmpty());
    EXPECT_TRUE(buildTwoPointLine(base, 1, 2).isEmpty());
}

TEST(Constructions, DefaultConicIsEllipseAtClick)
{
    const QVector<Entity> conic = buildDefaultConic({}, QPointF(1, -1));
    ASSERT_EQ(conic.size(), 1);
    EXPECT_EQ(conic[0].name, QStringLiteral("C1"));
    EXPECT_EQ(conic[0].conic()->params, ellipseParams(1, -1, 2, 1));
}

// ---- Intersections and duality -------------------------------------

TEST(Constructions, LineLineIntersection)
{
    Entity l1 = createLine(1, lineCoeffs(1, 0, -2));
    l1.name = QStringLiteral("L1");
    Entity l2 = createLine(2, lineCoeffs(0, 1, -3));
    l2.name = QStringLiteral("L2");

    const QVector<Entity> point = buildLineLineIntersection({ l1, l2 }, 1, 2);
    ASSERT_EQ(point.size(), 1);
    EXPECT_EQ(point[0].name, QStringLiteral("I(L1,L2)"));

    const QVector<Entity> out = insert({ l1, l2 }, point);
    EXPECT_POINT_NEAR(positionOf(out, 3), 2.0, 3.0, kEps);

    EXPECT_TRUE(buildLineLineIntersection({ l1, l2 }, 1, 1).isEmpty());
}

TEST(Constructions, LineConicIntersectionsInEitherOrder)
{
    QVector<Entity> base = conicAndPoint();
    Entity line = createLine(3, lineCoeffs(1, 0, -2));
    line.name = QStringLiteral("L1");
    base.append(line);

    const QVector<Entity> a = buildLineConicIntersections(base, 3, 1);
    const QVector<Entity> b = buildLineConicIntersections(base, 1, 3);
    ASSERT_EQ(a.size(), 2);
    ASSERT_EQ(b.size(), 2);
    EXPECT_EQ(a[0].name, QStringLiteral("I1(L1,C1)"));
    EXPECT_EQ(a[1].name, QStringLiteral("I2(L1,C1)"));
    EXPECT_EQ(*a[0].point()->solutionIndex, 0);
    EXPECT_EQ(*a[1].point()->solutionIndex, 1);
    EXPECT_EQ(a[0].dependencies, b[0].dependencies);

    const QVector<Entity> out = insert(base, a);
    const double y = 2.0 * qSqrt(1.0 - 4.0 / 9.0);
    EXPECT_POINT_NEAR(positionOf(out, 4), 2.0, y, kLoose);
    EXPECT_POINT_NEAR(positionOf(out, 5), 2.0, -y, kLoose);

    EXPECT_TRUE(buildLineConicIntersections(base, 2, 1).isEmpty());
}

TEST(Constructions, PolarLine)
{
    const QVector<Entity> base = conicAndPoint();
    const QVector<Entity> polar = buildPolarLine(base, 1, 2);
    ASSERT_EQ(polar.size(), 1);
    EXPECT_EQ(polar[0].name, QStringLiteral("Polar(P)"));
    EXPECT_EQ(polar[0].color, QStringLiteral("#ef4444"));
    EXPECT_EQ(polar[0].dependencies, (QVector<EntityId>{ 2, 1 }));

    const QVector<Entity> out = insert(base, polar);
    EXPECT_TRUE(sameLine(lineOf(out, 3), lineCoeffs(1, 0, -1.8)));
}

TEST(Constructions, TangentsFromExternalPoint)
{
    const QVector<Entity> base = conicAndPoint();
    const QVector<Entity> added = buildTangents(base, 2, 1);
    ASSERT_EQ(added.size(), 5);

    // polar, T1, T2, Tan1, Tan2
    EXPECT_TRUE(added[0].hidden);
    EXPECT_EQ(added[1].name, QStringLiteral("T1"));
    EXPECT_EQ(added[2].name, QStringLiteral("T2"));
    EXPECT_EQ(added[3].name, QStringLiteral("Tan1(P)"));
    EXPECT_EQ(added[4].name, QStringLiteral("Tan2(P)"));
    EXPECT_EQ(added[3].color, QStringLiteral("#a78bfa"));

    ResolveReport report;
    const QVector<Entity> out = insert(base, added, 3, &report);
    EXPECT_TRUE(report.converged);

    EXPECT_POINT_NEAR(positionOf(out, 4), 1.8, 1.6, kLoose);
    EXPECT_POINT_NEAR(positionOf(out, 5), 1.8, -1.6, kLoose);

    const ConicCoefficients k = standardToGeneral(ellipseParams(0, 0, 3, 2));
    for (EntityId tangent : { 6, 7 }) {
        const LineCoefficients l = lineOf(out, tangent);
        EXPECT_NEAR(l.evaluate(QPointF(5, 0)), 0.0, kLoose);

        // Touches the ellipse exactly once
        const LineConicIntersection hits = lineConicIntersection(l, k);
        ASSERT_EQ(hits.count, 2);
        EXPECT_NEAR(hits.point1.x(), hits.point2.x(), 1e-4);
        EXPECT_NEAR(hits.point1.y(), hits.point2.y(), 1e-4);
    }
}

TEST(Constructions, TangentsFromInsidePointHide)
{
    const QVector<Entity> base = conicAndPoint(QPointF(1, 0));
    const QVector<Entity> out = insert(base, buildTangents(base, 1, 2));

    EXPECT_TRUE(entityById(out, 4).hidden);
    EXPECT_TRUE(entityById(out, 5).hidden);
}

TEST(Constructions, SelfPolarTriangle)
{
    const QVector<Entity> base = conicAndPoint(QPointF(5, 1));
    const QVector<Entity> added = buildSelfPolarTriangle(base, 1, 2);
    ASSERT_EQ(added.size(), 5);
    EXPECT_EQ(added[0].name, QStringLiteral("p(P)"));
    EXPECT_EQ(added[1].name, QStringLiteral("P'"));
    EXPECT_EQ(added[2].name, QStringLiteral("p(P')"));
    EXPECT_EQ(added[3].name, QStringLiteral("P''"));
    EXPECT_EQ(added[4].name, QStringLiteral("p(P'')"));
    EXPECT_TRUE(added[1].isFree());
    EXPECT_EQ(added[1].point()->onLineId, added[0].id);

    // Five levels deep: give it enough passes
    ResolveReport report;
    const QVector<Entity> out = insert(base, added, 8, &report);
    EXPECT_TRUE(report.converged);

    const QPointF p = positionOf(out, 2);
    const QPointF p1 = positionOf(out, 4);
    const QPointF p2 = positionOf(out, 6);
    const LineCoefficients side = lineOf(out, 3);
    const LineCoefficients side1 = lineOf(out, 5);
    const LineCoefficients side2 = lineOf(out, 7);

    // Each vertex lies on the polars of the other two
    EXPECT_NEAR(side.evaluate(p1), 0.0, kLoose);
    EXPECT_NEAR(side.evaluate(p2), 0.0, kLoose);
    EXPECT_NEAR(side1.evaluate(p), 0.0, kLoose);
    EXPECT_NEAR(side1.evaluate(p2), 0.0, kLoose);
    EXPECT_NEAR(side2.evaluate(p), 0.0, kLoose);
    EXPECT_NEAR(side2.evaluate(p1), 0.0, kLoose);
}

TEST(Constructions, SelfPolarTriangleNeedsPointAndConic)
{
    EXPECT_TRUE(buildSelfPolarTriangle(conicAndPoint(), 1, 1).isEmpty());
    EXPECT_TRUE(buildSelfPolarTriangle(conicAndPoint(), 2, 7).isEmpty());
}

// ---- Demo ----------------------------------------------------------

TEST(Constructions, DemoScene)
{
    const QVector<Entity> demo = buildDemoScene();
    ASSERT_EQ(demo.size(), 8);
    EXPECT_EQ(demo[0].kind(), EntityKind::Conic);
    EXPECT_EQ(demo[0].conic()->params, ellipseParams(0, 0, 3, 2));
    EXPECT_EQ(demo[3].line()->p1Id, 2);
    EXPECT_EQ(demo[3].line()->p2Id, 3);
    EXPECT_NEAR(*demo[5].line()->angle, M_PI / 3.0, kEps);
    EXPECT_TRUE(demo[5].isFree());
    EXPECT_EQ(demo[6].color, QStringLiteral("#ec4899"));
    EXPECT_EQ(nextEntityId(demo), 9);
}
