#ifndef FORMULA_CALCULATED_FIELDS_H
#define FORMULA_CALCULATED_FIELDS_H

/**
 * @file CalculatedFields.h
 * @brief Ordered recalculation of form fields defined by formulas
 *
 *   subtotal = quantity * price
 *   tax      = subtotal * 0.2
 *   total    = subtotal + tax
 *
 * buildDependencyGraph() derives dependencies from each formula's field
 * references and orders the calculated fields so that every field comes
 * after the calculated fields it reads. Fields on a dependency cycle are
 * reported and never recalculated.
 */

#include "formula/EvaluationContext.h"
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

namespace Formula {

class ExpressionService;

struct CalculatedFieldConfig {
    QString     id;
    QString     formula;
    QVariant    fallbackValue;      // used when evaluation fails; invalid = keep current value
    QStringList dependencies;       // filled in by buildDependencyGraph()
};

struct CalculationGraph {
    QMap<QString, CalculatedFieldConfig> nodes;
    QMap<QString, QStringList>           edges;    // field → calculated fields that read it
    QStringList                          order;    // evaluation order (cycle members excluded)
    QStringList                          cycles;   // fields that depend on themselves
};

CalculationGraph buildDependencyGraph(const QVector<CalculatedFieldConfig> &configs,
                                      const ExpressionService &service);

/**
 * Evaluates every calculated field in dependency order, starting from
 * `values` and feeding each result into the context of the fields after it.
 * Returns `values` updated with the calculated results.
 */
QVariantMap recalculateAll(const QVector<CalculatedFieldConfig> &configs,
                           const QVariantMap &values,
                           const QHash<QString, DatasetRows> &datasets,
                           const ExpressionService &service);

} // namespace Formula

#endif // FORMULA_CALCULATED_FIELDS_H
