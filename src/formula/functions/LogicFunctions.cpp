/**
 * @file LogicFunctions.cpp
 * @brief logic category
 *
 * IF is dispatched lazily by FormulaEvaluator (only the chosen branch is
 * evaluated); the implementation below is used when arguments are already
 * values.
 */

#include "BuiltinFunctions.h"

namespace Formula {
namespace Builtins {

void registerLogicFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("logic");

  registry.add(define(
      "IF", cat, "Returns one value when the condition is truthy, another otherwise",
      {param("condition", ValueType::Any, "Condition to test"),
       param("whenTrue", ValueType::Any, "Result when truthy"),
       optionalParam("whenFalse", ValueType::Any, "Result when falsy")},
      ValueType::Any,
      {{"IF(95 > 90, \"A\", \"B\")", "A"}, {"IF(false, 1)", "null"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        return isTruthy(args[0]) ? args[1] : args[2];
      }));

  registry.add(define(
      "IFS", cat,
      "Result paired with the first truthy condition, null when none is",
      {variadicParam("pairs", ValueType::Any, "condition, result, ...")},
      ValueType::Any,
      {{"IFS(85 >= 90, \"A\", 85 >= 80, \"B\", true, \"C\")", "B"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        if (args.size() % 2 != 0) {
          *error = QStringLiteral("expects condition/result pairs");
          return QVariant();
        }
        for (int i = 0; i + 1 < args.size(); i += 2) {
          if (isTruthy(args[i]))
            return args[i + 1];
        }
        return QVariant();
      }));

  registry.add(define(
      "SWITCH", cat,
      "Result paired with the first case equal to the value; a trailing odd "
      "argument is the default",
      {param("value", ValueType::Any, "Value to match"),
       variadicParam("cases", ValueType::Any, "case, result, ..., [default]")},
      ValueType::Any,
      {{"SWITCH(\"I\", \"A\", \"Active\", \"I\", \"Inactive\", \"Unknown\")",
        "Inactive"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const int cases = args.size() - 1;
        for (int i = 1; i + 1 < args.size(); i += 2) {
          if (valuesEqual(args[0], args[i]))
            return args[i + 1];
        }
        return cases % 2 == 1 ? args.last() : QVariant();
      }));

  registry.add(define(
      "AND", cat, "True when every argument is truthy",
      {variadicParam("values", ValueType::Any, "Values to test")},
      ValueType::Boolean, {{"AND(true, 1, \"x\")", "true"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        for (const QVariant &v : args) {
          if (!isTruthy(v))
            return false;
        }
        return true;
      }));

  registry.add(define(
      "OR", cat, "True when any argument is truthy",
      {variadicParam("values", ValueType::Any, "Values to test")},
      ValueType::Boolean, {{"OR(false, 0, \"x\")", "true"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        for (const QVariant &v : args) {
          if (isTruthy(v))
            return true;
        }
        return false;
      }));

  registry.add(define(
      "NOT", cat, "Boolean negation of truthiness",
      {param("value", ValueType::Any, "Value to negate")}, ValueType::Boolean,
      {{"NOT(true)", "false"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return !isTruthy(args[0]); }));

  registry.add(define(
      "ISBLANK", cat, "True for null and for the empty string",
      {param("value", ValueType::Any, "Value to test")}, ValueType::Boolean,
      {{"ISBLANK(\"\")", "true"}, {"ISBLANK(0)", "false"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QVariant &v = args[0];
        return isNull(v) ||
               (typeOf(v) == ValueType::String && v.toString().isEmpty());
      }));

  registry.add(define(
      "COALESCE", cat, "First non-null argument, null when all are null",
      {variadicParam("values", ValueType::Any, "Candidates")}, ValueType::Any,
      {{"COALESCE(null, \"fallback\")", "fallback"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        for (const QVariant &v : args) {
          if (!isNull(v))
            return v;
        }
        return QVariant();
      }));
}

} // namespace Builtins
} // namespace Formula
