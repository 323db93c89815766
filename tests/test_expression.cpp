// =====================================================================
//  tests/test_expression.cpp — Numeric expression evaluator
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <conica/scene/expression.h>

#include <QtMath>

using namespace conica_test;

namespace {

double value(const char* text)
{
    QString error;
    const std::optional<double> v = evaluateExpression(QString::fromLatin1(text), &error);
    EXPECT_TRUE(v.has_value()) << text << ": " << error.toStdString();
    return v.value_or(0.0);
}

bool rejects(const char* text)
{
    return !evaluateExpression(QString::fromLatin1(text)).has_value();
}

}  // namespace

TEST(Expression, Numbers)
{
    EXPECT_DOUBLE_EQ(value("3"), 3.0);
    EXPECT_DOUBLE_EQ(value("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(value(".5"), 0.5);
}

TEST(Expression, OperatorPrecedence)
{
    EXPECT_DOUBLE_EQ(value("1+2*3"), 7.0);
    EXPECT_DOUBLE_EQ(value("(1+2)*3"), 9.0);
    EXPECT_DOUBLE_EQ(value("10-4-3"), 3.0);
    EXPECT_DOUBLE_EQ(value("8/4/2"), 1.0);
}

TEST(Expression, PowerIsRightAssociative)
{
    EXPECT_DOUBLE_EQ(value("2^3^2"), 512.0);
    EXPECT_DOUBLE_EQ(value("2*3^2"), 18.0);
}

TEST(Expression, UnarySigns)
{
    EXPECT_DOUBLE_EQ(value("-3"), -3.0);
    EXPECT_DOUBLE_EQ(value("+3"), 3.0);
    EXPECT_DOUBLE_EQ(value("2*-3"), -6.0);
    EXPECT_DOUBLE_EQ(value("--2"), 2.0);
}

TEST(Expression, ConstantsAndFunctions)
{
    EXPECT_DOUBLE_EQ(value("pi"), M_PI);
    EXPECT_DOUBLE_EQ(value("e"), M_E);
    EXPECT_DOUBLE_EQ(value("sqrt(16)"), 4.0);
    EXPECT_NEAR(value("sin(pi/2)"), 1.0, kEps);
    EXPECT_NEAR(value("cos(0)"), 1.0, kEps);
    EXPECT_NEAR(value("tan(pi/4)"), 1.0, kEps);
    EXPECT_NEAR(value("sqrt(2)/2"), qSqrt(2.0) / 2.0, kEps);
}

TEST(Expression, NamesAreCaseInsensitive)
{
    EXPECT_DOUBLE_EQ(value("PI"), M_PI);
    EXPECT_DOUBLE_EQ(value("Sqrt(9)"), 3.0);
}

TEST(Expression, WhitespaceIsIgnored)
{
    EXPECT_DOUBLE_EQ(value("  1 +  2 * ( 3 - 1 ) "), 5.0);
    EXPECT_DOUBLE_EQ(value("sqrt (4)"), 2.0);
}

TEST(Expression, RejectsMalformedInput)
{
    EXPECT_TRUE(rejects(""));
    EXPECT_TRUE(rejects("   "));
    EXPECT_TRUE(rejects("2+"));
    EXPECT_TRUE(rejects("(1+2"));
    EXPECT_TRUE(rejects("1+2)"));
    EXPECT_TRUE(rejects("2 3"));
    EXPECT_TRUE(rejects("1.2.3"));
    EXPECT_TRUE(rejects("x+1"));
    EXPECT_TRUE(rejects("abs(-1)"));
    EXPECT_TRUE(rejects("3 % 2"));
}

TEST(Expression, RejectsNonFiniteResults)
{
    EXPECT_TRUE(rejects("1/0"));
    EXPECT_TRUE(rejects("0/0"));
    EXPECT_TRUE(rejects("sqrt(-1)"));
    EXPECT_TRUE(rejects("10^400"));
}

TEST(Expression, ReportsError)
{
    QString error;
    EXPECT_FALSE(evaluateExpression(QStringLiteral("sqrt(4"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(evaluateExpression(QStringLiteral("1/0"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}

TEST(Expression, ModerateNestingIsAccepted)
{
    const QString nested = QString(50, QLatin1Char('(')) + QStringLiteral("-+-2")
                         + QString(50, QLatin1Char(')'));
    const std::optional<double> v = evaluateExpression(nested);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 2.0);
}

TEST(Expression, RejectsRunawayNesting)
{
    QString error;
    const QString parens = QString(100000, QLatin1Char('(')) + QStringLiteral("1")
                         + QString(100000, QLatin1Char(')'));
    EXPECT_FALSE(evaluateExpression(parens, &error).has_value());
    EXPECT_EQ(error, QStringLiteral("Expression nested too deeply"));

    const QString signs = QString(100000, QLatin1Char('-')) + QStringLiteral("1");
    EXPECT_FALSE(evaluateExpression(signs).has_value());
}

TEST(Expression, LongPowerChainIsNotNesting)
{
    QString powers = QStringLiteral("1");
    for (int i = 0; i < 100000; ++i)
        powers += QStringLiteral("^2");

    const std::optional<double> v = evaluateExpression(powers);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1.0);
}
