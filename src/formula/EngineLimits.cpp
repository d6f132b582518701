#include "formula/EngineLimits.h"
#include "utils/ConfigLoader.h"
#include <QDebug>

namespace Formula {

static int readLimit(const ConfigLoader &config, const char *key,
                     int fallback) {
  const QString section = QStringLiteral("LIMITS");
  if (!config.contains(section, QLatin1String(key)))
    return fallback;

  const int value = config.getInt(section, QLatin1String(key), -1);
  if (value < 0) {
    qWarning() << "[EngineLimits] Invalid value for" << key
               << "- using default" << fallback;
    return fallback;
  }
  return value;
}

EngineLimits EngineLimits::unlimited() {
  EngineLimits limits;
  limits.maxFormulaLength = 0;
  limits.maxNodeCount = 0;
  limits.maxDepth = 0;
  limits.maxEvaluationDepth = 0;
  return limits;
}

EngineLimits EngineLimits::fromConfig(const ConfigLoader &config) {
  EngineLimits limits;
  limits.maxFormulaLength =
      readLimit(config, "max_formula_length", limits.maxFormulaLength);
  limits.maxNodeCount = readLimit(config, "max_node_count", limits.maxNodeCount);
  limits.maxDepth = readLimit(config, "max_depth", limits.maxDepth);
  limits.maxEvaluationDepth =
      readLimit(config, "max_evaluation_depth", limits.maxEvaluationDepth);

  qDebug() << "[EngineLimits] length" << limits.maxFormulaLength << "nodes"
           << limits.maxNodeCount << "depth" << limits.maxDepth
           << "evalDepth" << limits.maxEvaluationDepth;
  return limits;
}

} // namespace Formula
