/**
 * @file ArrayFunctions.cpp
 * @brief array category
 */

#include "BuiltinFunctions.h"
#include <algorithm>
#include <cmath>

namespace Formula {
namespace Builtins {

namespace {

// Total order used by SORT: values of one kind by compareValues, different
// kinds by kind (null < boolean < number < string < date < array < object).
bool sortLess(const QVariant &a, const QVariant &b) {
  const ValueType ta = typeOf(a);
  const ValueType tb = typeOf(b);
  if (ta != tb)
    return static_cast<int>(ta) < static_cast<int>(tb);
  bool comparable = false;
  const int c = compareValues(a, b, &comparable);
  return comparable && c < 0;
}

} // namespace

void registerArrayFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("array");
  const QVector<FunctionParameter> arrayParam = {
      param("array", ValueType::Array, "Array")};

  registry.add(define(
      "FIRST", cat, "First element, null for an empty array", arrayParam,
      ValueType::Any, {{"FIRST([10, 20, 30])", "10"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QVariantList list = toList(args[0]);
        return list.isEmpty() ? QVariant() : list.first();
      }));

  registry.add(define(
      "LAST", cat, "Last element, null for an empty array", arrayParam,
      ValueType::Any, {{"LAST([10, 20, 30])", "30"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QVariantList list = toList(args[0]);
        return list.isEmpty() ? QVariant() : list.last();
      }));

  registry.add(define(
      "INDEX", cat, "Element at a 0-based index, null when out of range",
      {param("array", ValueType::Array, "Array"),
       param("index", ValueType::Number, "Index (0-based)")},
      ValueType::Any, {{"INDEX([\"a\", \"b\", \"c\"], 2)", "c"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QVariantList list = toList(args[0]);
        const double index = args[1].toDouble();
        if (index < 0 || index >= list.size() || index != std::floor(index))
          return QVariant();
        return list.at(static_cast<int>(index));
      }));

  registry.add(define(
      "LENGTH", cat, "Number of elements", arrayParam, ValueType::Number,
      {{"LENGTH([1, 2, 3])", "3"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        return static_cast<double>(toList(args[0]).size());
      }));

  registry.add(define(
      "CONTAINS", cat, "True when an element equals the value",
      {param("array", ValueType::Array, "Array to search"),
       param("value", ValueType::Any, "Value to find")},
      ValueType::Boolean, {{"CONTAINS([\"urgent\", \"new\"], \"urgent\")", "true"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        for (const QVariant &v : toList(args[0])) {
          if (valuesEqual(v, args[1]))
            return true;
        }
        return false;
      }));

  registry.add(define(
      "UNIQUE", cat, "Distinct elements in first-seen order", arrayParam,
      ValueType::Array, {{"UNIQUE([1, 2, 2, 3, 1])", "[1,2,3]"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QVariantList out;
        for (const QVariant &v : toList(args[0])) {
          const bool seen = std::any_of(
              out.begin(), out.end(),
              [&v](const QVariant &u) { return valuesEqual(u, v); });
          if (!seen)
            out.append(v);
        }
        return out;
      }));

  registry.add(define(
      "SORT", cat, "Stable sort, ascending unless descending is true",
      {param("array", ValueType::Array, "Array to sort"),
       optionalParam("descending", ValueType::Boolean, "Sort descending",
                     false)},
      ValueType::Array,
      {{"SORT([3, 1, 2])", "[1,2,3]"},
       {"SORT([\"b\", \"a\", \"c\"], true)", "[\"c\",\"b\",\"a\"]"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QVariantList list = toList(args[0]);
        if (args[1].toBool()) {
          std::stable_sort(list.begin(), list.end(),
                           [](const QVariant &a, const QVariant &b) {
                             return sortLess(b, a);
                           });
        } else {
          std::stable_sort(list.begin(), list.end(), sortLess);
        }
        return list;
      }));

  registry.add(define(
      "FILTER", cat, "Elements equal to the value",
      {param("array", ValueType::Array, "Array to filter"),
       param("value", ValueType::Any, "Value to keep")},
      ValueType::Array,
      {{"FILTER([\"active\", \"closed\", \"active\"], \"active\")",
        "[\"active\",\"active\"]"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QVariantList out;
        for (const QVariant &v : toList(args[0])) {
          if (valuesEqual(v, args[1]))
            out.append(v);
        }
        return out;
      }));
}

} // namespace Builtins
} // namespace Formula
