// =====================================================================
//  tests/test_entity.cpp — Entity model
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <conica/geometry/conics.h>

using namespace conica_test;

TEST(EntityFactory, FreePoint)
{
    const Entity e = createPoint(4, QPointF(1, 2));
    EXPECT_EQ(e.id, 4);
    EXPECT_EQ(e.kind(), EntityKind::Point);
    EXPECT_TRUE(e.isFree());
    EXPECT_EQ(e.color, QStringLiteral("#ffffff"));
    ASSERT_NE(e.point(), nullptr);
    EXPECT_EQ(e.point()->position, QPointF(1, 2));
    EXPECT_EQ(e.point()->onLineId, NoEntity);
    EXPECT_FALSE(e.point()->solutionIndex.has_value());
    EXPECT_EQ(e.line(), nullptr);
}

TEST(EntityFactory, ConstructedPoints)
{
    const Entity onLine = createPointOnLine(2, 1, QPointF(3, 3));
    EXPECT_FALSE(onLine.isFree());
    EXPECT_EQ(onLine.point()->onLineId, 1);
    EXPECT_TRUE(onLine.dependencies.isEmpty());

    const Entity crossing = createLineLinePoint(3, 1, 2);
    EXPECT_FALSE(crossing.isFree());
    EXPECT_EQ(crossing.dependencies, (QVector<EntityId>{ 1, 2 }));
    EXPECT_FALSE(crossing.point()->solutionIndex.has_value());

    const Entity second = createLineConicPoint(4, 1, 9, 1);
    EXPECT_EQ(second.dependencies, (QVector<EntityId>{ 1, 9 }));
    ASSERT_TRUE(second.point()->solutionIndex.has_value());
    EXPECT_EQ(*second.point()->solutionIndex, 1);
}

TEST(EntityFactory, Lines)
{
    const Entity free = createLine(1, lineCoeffs(1, -1, 0));
    EXPECT_TRUE(free.isFree());
    EXPECT_EQ(free.color, QStringLiteral("#3b82f6"));

    const Entity through = createTwoPointLine(2, 5, 6);
    EXPECT_FALSE(through.isFree());
    EXPECT_TRUE(through.line()->hasTwoPoints());
    EXPECT_FALSE(through.line()->hasPivot());

    const Entity pivot = createPivotLine(3, 5, 0.5);
    EXPECT_TRUE(pivot.isFree());
    EXPECT_TRUE(pivot.line()->hasPivot());

    const Entity polar = createPolarLine(4, 5, 7);
    EXPECT_FALSE(polar.isFree());
    EXPECT_EQ(polar.color, QStringLiteral("#ef4444"));
    EXPECT_EQ(polar.dependencies, (QVector<EntityId>{ 5, 7 }));
}

TEST(EntityFactory, ConicFillsCoefficients)
{
    const Entity c = createConic(1, ellipseParams(0, 0, 3, 2));
    EXPECT_EQ(c.kind(), EntityKind::Conic);
    EXPECT_TRUE(c.isFree());
    EXPECT_EQ(c.color, QStringLiteral("#f59e0b"));
    EXPECT_EQ(c.conic()->coeffs, geometry::standardToGeneral(ellipseParams(0, 0, 3, 2)));
}

TEST(EntityQuery, FindAndIndex)
{
    const QVector<Entity> entities = { createPoint(3, QPointF()), createPoint(7, QPointF()) };

    EXPECT_EQ(findEntityById(entities, 7), &entities[1]);
    EXPECT_EQ(findEntityById(entities, 5), nullptr);
    EXPECT_EQ(indexOfEntity(entities, 3), 0);
    EXPECT_EQ(indexOfEntity(entities, 5), -1);
}

TEST(EntityQuery, NextEntityId)
{
    EXPECT_EQ(nextEntityId({}), 1);
    EXPECT_EQ(nextEntityId({ createPoint(3, QPointF()), createPoint(7, QPointF()) }), 8);
}

TEST(EntityQuery, KindNames)
{
    EXPECT_STREQ(entityKindName(EntityKind::Point), "Point");
    EXPECT_STREQ(entityKindName(EntityKind::Line), "Line");
    EXPECT_STREQ(entityKindName(EntityKind::Conic), "Conic");
}

TEST(EntitiesEquivalent, AllowsToleranceOnReals)
{
    const Entity a = createPoint(1, QPointF(1.0, 2.0));
    const Entity b = createPoint(1, QPointF(1.0 + 1e-12, 2.0));
    const Entity c = createPoint(1, QPointF(1.1, 2.0));

    EXPECT_TRUE(entitiesEquivalent(a, b));
    EXPECT_FALSE(entitiesEquivalent(a, c));
}

TEST(EntitiesEquivalent, ComparesFlagsExactly)
{
    const Entity a = createPoint(1, QPointF(1.0, 2.0));
    Entity hidden = a;
    hidden.hidden = true;
    Entity renamed = a;
    renamed.name = QStringLiteral("Q");

    EXPECT_FALSE(entitiesEquivalent(a, hidden));
    EXPECT_FALSE(entitiesEquivalent(a, renamed));
    EXPECT_FALSE(entitiesEquivalent(a, createLine(1, lineCoeffs(1, 0, 0))));
}
