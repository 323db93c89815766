// =====================================================================
//  src/libconica/scene/expression.cpp — Numeric expression evaluator
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/expression.h>
#include <conica/logging.h>

#include <QVector>
#include <QtMath>

#include <cmath>
#include <stdexcept>

namespace conica {
namespace scene {

namespace {

const int MAX_NESTING = 256;

// Recursive descent, one level per precedence:
//   sum     := product (('+' | '-') product)*
//   product := power (('*' | '/') power)*
//   power   := unary ('^' power)?
//   unary   := ('+' | '-') unary | primary
//   primary := number | '(' sum ')' | constant | function '(' sum ')'
//
// power is folded iteratively, so every recursive path passes through
// unary(), which carries the depth limit.
class ExpressionParser {
public:
    explicit ExpressionParser(const QString& text)
        : m_text(text)
    {
    }

    double parse()
    {
        const double value = sum();
        if (!peek().isNull()) {
            throw std::runtime_error(
                QStringLiteral("Unexpected character at position %1").arg(m_pos).toStdString());
        }
        return value;
    }

private:
    /// Next non-space character, or a null QChar at the end of input
    QChar peek()
    {
        while (m_pos < m_text.length() && m_text.at(m_pos).isSpace())
            ++m_pos;
        return m_pos < m_text.length() ? m_text.at(m_pos) : QChar();
    }

    bool accept(char c)
    {
        if (peek() != QLatin1Char(c))
            return false;
        ++m_pos;
        return true;
    }

    void expect(char c)
    {
        if (!accept(c)) {
            throw std::runtime_error(
                QStringLiteral("Expected '%1' at position %2")
                    .arg(QChar::fromLatin1(c)).arg(m_pos).toStdString());
        }
    }

    double sum()
    {
        double value = product();
        for (;;) {
            if (accept('+'))
                value += product();
            else if (accept('-'))
                value -= product();
            else
                return value;
        }
    }

    double product()
    {
        double value = power();
        for (;;) {
            if (accept('*'))
                value *= power();
            else if (accept('/'))
                value /= power();  // x/0 left to IEEE, rejected as non-finite
            else
                return value;
        }
    }

    // Right associative: operands are folded from the end
    double power()
    {
        QVector<double> operands{ unary() };
        while (accept('^'))
            operands.append(unary());

        double value = operands.takeLast();
        while (!operands.isEmpty())
            value = std::pow(operands.takeLast(), value);
        return value;
    }

    double unary()
    {
        if (m_depth >= MAX_NESTING)
            throw std::runtime_error("Expression nested too deeply");

        ++m_depth;
        double value = 0.0;
        if (accept('-'))
            value = -unary();
        else if (accept('+'))
            value = unary();
        else
            value = primary();
        --m_depth;
        return value;
    }

    double primary()
    {
        const QChar c = peek();
        if (c.isNull())
            throw std::runtime_error("Unexpected end of expression");

        if (accept('(')) {
            const double value = sum();
            expect(')');
            return value;
        }
        if (c.isDigit() || c == QLatin1Char('.'))
            return number();
        if (c.isLetter())
            return identifier();

        throw std::runtime_error(
            QStringLiteral("Unexpected character '%1'").arg(c).toStdString());
    }

    double number()
    {
        const int start = m_pos;
        while (m_pos < m_text.length()
               && (m_text.at(m_pos).isDigit() || m_text.at(m_pos) == QLatin1Char('.')))
            ++m_pos;

        const QString digits = m_text.mid(start, m_pos - start);
        bool ok = false;
        const double value = digits.toDouble(&ok);
        if (!ok) {
            throw std::runtime_error(
                QStringLiteral("Invalid number '%1'").arg(digits).toStdString());
        }
        return value;
    }

    double identifier()
    {
        const int start = m_pos;
        while (m_pos < m_text.length() && m_text.at(m_pos).isLetter())
            ++m_pos;
        const QString name = m_text.mid(start, m_pos - start).toLower();

        if (accept('(')) {
            const double arg = sum();
            expect(')');
            return call(name, arg);
        }

        if (name == QLatin1String("pi"))
            return M_PI;
        if (name == QLatin1String("e"))
            return M_E;

        throw std::runtime_error(
            QStringLiteral("Unknown name '%1'").arg(name).toStdString());
    }

    static double call(const QString& name, double arg)
    {
        if (name == QLatin1String("sqrt"))
            return std::sqrt(arg);
        if (name == QLatin1String("sin"))
            return std::sin(arg);
        if (name == QLatin1String("cos"))
            return std::cos(arg);
        if (name == QLatin1String("tan"))
            return std::tan(arg);

        throw std::runtime_error(
            QStringLiteral("Unknown function '%1'").arg(name).toStdString());
    }

    QString m_text;
    int m_pos = 0;
    int m_depth = 0;
};

}  // namespace

std::optional<double> evaluateExpression(const QString& expression, QString* errorMsg)
{
    double result = 0.0;
    try {
        result = ExpressionParser(expression).parse();
    } catch (const std::exception& e) {
        const QString error = QString::fromLatin1(e.what());
        qCDebug(lcExpression) << "rejected" << expression << ":" << error;
        if (errorMsg) *errorMsg = error;
        return std::nullopt;
    }

    if (!std::isfinite(result)) {
        qCDebug(lcExpression) << "rejected" << expression << ": result is not finite";
        if (errorMsg) *errorMsg = QStringLiteral("Result is not a finite number");
        return std::nullopt;
    }

    return result;
}

}  // namespace scene
}  // namespace conica
