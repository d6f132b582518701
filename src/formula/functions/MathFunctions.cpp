/**
 * @file MathFunctions.cpp
 * @brief math and aggregate categories
 */

#include "BuiltinFunctions.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace Formula {
namespace Builtins {

bool collectNumbers(const QVariantList &args, QVector<double> &out,
                    QString *error) {
  for (const QVariant &arg : args) {
    if (typeOf(arg) == ValueType::Array) {
      for (const QVariant &item : toList(arg)) {
        if (!isNumber(item)) {
          *error = QString("expected numbers but the array contains %1")
                       .arg(typeName(typeOf(item)));
          return false;
        }
        out.append(item.toDouble());
      }
    } else if (isNumber(arg)) {
      out.append(arg.toDouble());
    } else {
      *error = QString("expected number but got %1").arg(typeName(typeOf(arg)));
      return false;
    }
  }
  return true;
}

static const ValueTypes kNumberOrArray = ValueType::Number | ValueType::Array;

// ═══════════════════════════════════════════════════════════════════
// math
// ═══════════════════════════════════════════════════════════════════

void registerMathFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("math");

  registry.add(define(
      "SUM", cat, "Adds numbers together",
      {variadicParam("values", kNumberOrArray, "Numbers or arrays of numbers",
                     false)},
      ValueType::Number, {{"SUM(1, 2, 3)", "6"}, {"SUM([1, 2], 3)", "6"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QVector<double> values;
        if (!collectNumbers(args, values, error))
          return QVariant();
        double sum = 0.0;
        for (double v : values)
          sum += v;
        return sum;
      }));

  registry.add(define(
      "AVERAGE", cat, "Arithmetic mean of numbers (0 when there are none)",
      {variadicParam("values", kNumberOrArray, "Numbers or arrays of numbers",
                     false)},
      ValueType::Number, {{"AVERAGE(1, 2, 3, 4)", "2.5"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QVector<double> values;
        if (!collectNumbers(args, values, error))
          return QVariant();
        if (values.isEmpty())
          return 0.0;
        double sum = 0.0;
        for (double v : values)
          sum += v;
        return sum / values.size();
      }));

  registry.add(define(
      "MIN", cat, "Smallest of the given numbers",
      {variadicParam("values", kNumberOrArray, "Numbers or arrays of numbers")},
      ValueType::Number, {{"MIN(5, 2, 8, 1)", "1"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QVector<double> values;
        if (!collectNumbers(args, values, error))
          return QVariant();
        if (values.isEmpty()) {
          *error = QStringLiteral("no values to compare");
          return QVariant();
        }
        return *std::min_element(values.begin(), values.end());
      }));

  registry.add(define(
      "MAX", cat, "Largest of the given numbers",
      {variadicParam("values", kNumberOrArray, "Numbers or arrays of numbers")},
      ValueType::Number, {{"MAX(5, 2, 8, 1)", "8"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QVector<double> values;
        if (!collectNumbers(args, values, error))
          return QVariant();
        if (values.isEmpty()) {
          *error = QStringLiteral("no values to compare");
          return QVariant();
        }
        return *std::max_element(values.begin(), values.end());
      }));

  registry.add(define(
      "ABS", cat, "Absolute value",
      {param("number", ValueType::Number, "Number")}, ValueType::Number,
      {{"ABS(-5)", "5"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return std::fabs(args[0].toDouble()); }));

  registry.add(define(
      "ROUND", cat, "Rounds half away from zero to a number of decimal places",
      {param("number", ValueType::Number, "Number to round"),
       optionalParam("digits", ValueType::Number, "Decimal places", 0.0)},
      ValueType::Number, {{"ROUND(3.7)", "4"}, {"ROUND(3.14159, 2)", "3.14"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double x = args[0].toDouble();
        qint64 digits = 0;
        if (!wholeNumberArg(args[1].toDouble(), -308, 308, QStringLiteral("digits"),
                            digits, error))
          return QVariant();
        if (digits == 0)
          return std::round(x);
        const double factor = std::pow(10.0, static_cast<double>(std::llabs(digits)));
        if (digits > 0) {
          const double scaled = x * factor;
          // Already more precise than the requested digits
          if (!std::isfinite(scaled))
            return x;
          return std::round(scaled) / factor;
        }
        return std::round(x / factor) * factor;
      }));

  registry.add(define(
      "FLOOR", cat, "Rounds down to the nearest integer",
      {param("number", ValueType::Number, "Number")}, ValueType::Number,
      {{"FLOOR(3.7)", "3"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return std::floor(args[0].toDouble()); }));

  registry.add(define(
      "CEIL", cat, "Rounds up to the nearest integer",
      {param("number", ValueType::Number, "Number")}, ValueType::Number,
      {{"CEIL(3.2)", "4"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return std::ceil(args[0].toDouble()); }));

  registry.add(define(
      "POWER", cat, "Raises a base to an exponent",
      {param("base", ValueType::Number, "Base"),
       param("exponent", ValueType::Number, "Exponent")},
      ValueType::Number, {{"POWER(2, 3)", "8"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double r = std::pow(args[0].toDouble(), args[1].toDouble());
        if (std::isnan(r)) {
          *error = QStringLiteral("result is not a real number");
          return QVariant();
        }
        return r;
      }));

  registry.add(define(
      "SQRT", cat, "Square root",
      {param("number", ValueType::Number, "Non-negative number")},
      ValueType::Number, {{"SQRT(16)", "4"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double v = args[0].toDouble();
        if (v < 0) {
          *error = QStringLiteral("square root of negative number");
          return QVariant();
        }
        return std::sqrt(v);
      }));

  registry.add(define(
      "MOD", cat, "Remainder of a division (sign follows the dividend)",
      {param("dividend", ValueType::Number, "Number to divide"),
       param("divisor", ValueType::Number, "Number to divide by")},
      ValueType::Number, {{"MOD(10, 3)", "1"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double divisor = args[1].toDouble();
        if (divisor == 0.0) {
          *error = QStringLiteral("division by zero");
          return QVariant();
        }
        return std::fmod(args[0].toDouble(), divisor);
      }));

  // ═══════════════════════════════════════════════════════════════════
  // aggregate
  // ═══════════════════════════════════════════════════════════════════

  const QString agg = QStringLiteral("aggregate");

  registry.add(define(
      "COUNT", agg, "Counts the non-null arguments",
      {variadicParam("values", ValueType::Any, "Values to count", false)},
      ValueType::Number, {{"COUNT(1, null, \"a\")", "2"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        int n = 0;
        for (const QVariant &v : args) {
          if (!isNull(v))
            ++n;
        }
        return static_cast<double>(n);
      }));

  registry.add(define(
      "COUNTIF", agg, "Counts the array elements equal to a value",
      {param("array", ValueType::Array, "Array to search"),
       param("match", ValueType::Any, "Value to match")},
      ValueType::Number,
      {{"COUNTIF([\"done\", \"open\", \"done\"], \"done\")", "2"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        int n = 0;
        for (const QVariant &v : toList(args[0])) {
          if (valuesEqual(v, args[1]))
            ++n;
        }
        return static_cast<double>(n);
      }));

  registry.add(define(
      "SUMIF", agg,
      "Sums the values whose parallel condition equals the match value",
      {param("values", ValueType::Array, "Values to sum"),
       param("conditions", ValueType::Array, "Conditions, parallel to values"),
       param("match", ValueType::Any, "Condition value to match")},
      ValueType::Number,
      {{"SUMIF([10, 20, 30], [\"a\", \"b\", \"a\"], \"a\")", "40"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const QVariantList values = toList(args[0]);
        const QVariantList conditions = toList(args[1]);
        double sum = 0.0;
        for (int i = 0; i < values.size() && i < conditions.size(); ++i) {
          if (!valuesEqual(conditions[i], args[2]))
            continue;
          if (!isNumber(values[i])) {
            *error = QString("value at index %1 is %2, not a number")
                         .arg(i)
                         .arg(typeName(typeOf(values[i])));
            return QVariant();
          }
          sum += values[i].toDouble();
        }
        return sum;
      }));
}

} // namespace Builtins
} // namespace Formula
