/**
 * @file LookupFunctions.cpp
 * @brief lookup category
 */

#include "BuiltinFunctions.h"
#include <cmath>

namespace Formula {
namespace Builtins {

void registerLookupFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("lookup");

  FunctionDefinition lookup = define(
      "LOOKUP", cat,
      "Value of returnField in the first dataset row whose keyField equals "
      "keyValue, null when no row matches",
      {param("dataset", ValueType::String, "Dataset name"),
       param("keyField", ValueType::String, "Column to match"),
       param("keyValue", ValueType::Any, "Value to find"),
       param("returnField", ValueType::String, "Column to return")},
      ValueType::Any,
      {{"LOOKUP(\"employees\", \"id\", 42, \"name\")", "Ada"}},
      [](const QVariantList &args, const EvaluationContext &context,
         QString *error) -> QVariant {
        const QString name = args[0].toString();
        if (!context.hasDataset(name)) {
          *error = QString("unknown dataset '%1'").arg(name);
          return QVariant();
        }
        const QString keyField = args[1].toString();
        const QString returnField = args[3].toString();
        const DatasetRows rows = context.datasets.value(name);
        for (const QVariantMap &row : rows) {
          if (valuesEqual(normalize(row.value(keyField)), args[2]))
            return normalize(row.value(returnField));
        }
        return QVariant();
      });
  lookup.readsContext = true;
  registry.add(lookup);

  registry.add(define(
      "VLOOKUP", cat,
      "Searches the first column of a table (array of row arrays) and returns "
      "the value in the given 1-based column",
      {param("searchValue", ValueType::Any, "Value to find"),
       param("table", ValueType::Array, "Rows, each an array"),
       param("column", ValueType::Number, "Column to return (1-based)"),
       optionalParam("exactMatch", ValueType::Boolean,
                     "Strict equality when true, text equality when false",
                     true)},
      ValueType::Any,
      {{"VLOOKUP(2, [[1, \"one\"], [2, \"two\"]], 2)", "two"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double column = args[2].toDouble();
        if (column < 1 || column != std::floor(column)) {
          *error = QStringLiteral("column must be a whole number of 1 or more");
          return QVariant();
        }
        const int col = column > 1e9 ? 1000000000 : static_cast<int>(column) - 1;
        const bool exact = args[3].toBool();

        for (const QVariant &row : toList(args[1])) {
          const QVariantList cells = toList(row);
          if (cells.isEmpty())
            continue;
          const bool match = exact ? valuesEqual(cells.first(), args[0])
                                   : toText(cells.first()) == toText(args[0]);
          if (match)
            return col < cells.size() ? cells.at(col) : QVariant();
        }
        return QVariant();
      }));
}

} // namespace Builtins
} // namespace Formula
