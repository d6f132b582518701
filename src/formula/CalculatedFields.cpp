#include "formula/CalculatedFields.h"
#include "formula/ExpressionService.h"
#include <QDebug>
#include <QSet>

namespace Formula {

namespace {

// True when `id` can reach itself through dependencies between calculated fields
bool reachesItself(const QString &id, const QMap<QString, CalculatedFieldConfig> &nodes) {
  QSet<QString> seen;
  QStringList pending = nodes.value(id).dependencies;
  while (!pending.isEmpty()) {
    const QString current = pending.takeLast();
    if (current == id)
      return true;
    if (seen.contains(current) || !nodes.contains(current))
      continue;
    seen.insert(current);
    pending.append(nodes.value(current).dependencies);
  }
  return false;
}

} // namespace

CalculationGraph buildDependencyGraph(const QVector<CalculatedFieldConfig> &configs,
                                      const ExpressionService &service) {
  CalculationGraph graph;
  QStringList declared;     // ids in configuration order

  for (const CalculatedFieldConfig &config : configs) {
    if (graph.nodes.contains(config.id)) {
      qWarning() << "[CalculatedFields] Duplicate calculated field" << config.id
                 << "- later definition wins";
    } else {
      declared.append(config.id);
    }
    CalculatedFieldConfig node = config;
    node.dependencies = service.validate(config.formula).referencedFields;
    graph.nodes.insert(config.id, node);
    graph.edges.insert(config.id, QStringList());
  }

  for (const QString &id : declared) {
    for (const QString &dep : graph.nodes.value(id).dependencies) {
      if (graph.edges.contains(dep) && !graph.edges[dep].contains(id))
        graph.edges[dep].append(id);
    }
  }

  QSet<QString> cyclic;
  for (const QString &id : declared) {
    if (reachesItself(id, graph.nodes)) {
      cyclic.insert(id);
      graph.cycles.append(id);
    }
  }
  if (!graph.cycles.isEmpty())
    qWarning() << "[CalculatedFields] Circular dependency between" << graph.cycles;

  // Kahn's algorithm; cycle members count as plain inputs for the rest.
  // Ties are broken by declaration order so the result is stable.
  QSet<QString> placed;
  bool progress = true;
  while (progress) {
    progress = false;
    for (const QString &id : declared) {
      if (placed.contains(id) || cyclic.contains(id))
        continue;
      bool ready = true;
      for (const QString &dep : graph.nodes.value(id).dependencies) {
        if (graph.nodes.contains(dep) && !cyclic.contains(dep) &&
            !placed.contains(dep)) {
          ready = false;
          break;
        }
      }
      if (ready) {
        graph.order.append(id);
        placed.insert(id);
        progress = true;
        break;
      }
    }
  }

  return graph;
}

QVariantMap recalculateAll(const QVector<CalculatedFieldConfig> &configs,
                           const QVariantMap &values,
                           const QHash<QString, DatasetRows> &datasets,
                           const ExpressionService &service) {
  const CalculationGraph graph = buildDependencyGraph(configs, service);

  EvaluationContext context(values);
  context.datasets = datasets;
  QVariantMap results = values;

  for (const QString &id : graph.order) {
    const CalculatedFieldConfig &field = graph.nodes[id];
    const EvaluationResult r = service.evaluate(field.formula, context);

    if (r.success) {
      results.insert(id, r.value);
      context.fields.insert(id, r.value);
    } else if (field.fallbackValue.isValid()) {
      results.insert(id, field.fallbackValue);
      context.fields.insert(id, field.fallbackValue);
    } else {
      qDebug() << "[CalculatedFields] Field" << id
               << "not recalculated:" << r.error.message;
    }
  }

  return results;
}

} // namespace Formula
