/**
 * @file FunctionRegistry.cpp
 * @brief Registry storage, lookup and catalogue export
 *
 * The function tables themselves live in src/formula/functions/, one file
 * per category.
 */

#include "formula/FunctionRegistry.h"
#include "functions/BuiltinFunctions.h"
#include <QDebug>
#include <QJsonArray>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// FunctionDefinition
// ═══════════════════════════════════════════════════════════════════

int FunctionDefinition::minArgs() const {
  int n = 0;
  for (const FunctionParameter &p : parameters) {
    if (p.required)
      ++n;
  }
  return n;
}

int FunctionDefinition::maxArgs() const {
  if (!parameters.isEmpty() && parameters.last().variadic)
    return -1;
  return parameters.size();
}

QString FunctionDefinition::signature() const {
  QStringList parts;
  for (const FunctionParameter &p : parameters) {
    QString text = p.name;
    if (p.variadic)
      text += QStringLiteral("...");
    if (!p.required)
      text = QString("[%1]").arg(text);
    parts.append(text);
  }
  return QString("%1(%2)").arg(name, parts.join(QStringLiteral(", ")));
}

// ═══════════════════════════════════════════════════════════════════
// FunctionRegistry
// ═══════════════════════════════════════════════════════════════════

const FunctionRegistry &FunctionRegistry::builtins() {
  static const FunctionRegistry registry = [] {
    FunctionRegistry r;
    Builtins::registerMathFunctions(r);
    Builtins::registerTextFunctions(r);
    Builtins::registerDateFunctions(r);
    Builtins::registerLogicFunctions(r);
    Builtins::registerArrayFunctions(r);
    Builtins::registerLookupFunctions(r);
    Builtins::registerConversionFunctions(r);
    qDebug() << "[FunctionRegistry] Registered" << r.count()
             << "built-in functions in" << r.categories().size()
             << "categories";
    return r;
  }();
  return registry;
}

bool FunctionRegistry::add(const FunctionDefinition &def) {
  if (!def.isValid()) {
    qWarning() << "[FunctionRegistry] Rejected definition without name or"
                  " implementation:"
               << def.name;
    return false;
  }

  const QString key = def.name.toUpper();
  if (m_index.contains(key)) {
    qWarning() << "[FunctionRegistry] Duplicate function" << key;
    return false;
  }
  if (def.examples.isEmpty()) {
    qWarning() << "[FunctionRegistry] Function" << key << "has no examples";
    return false;
  }

  FunctionDefinition stored = def;
  stored.name = key;
  m_index.insert(key, m_functions.size());
  m_functions.append(stored);
  return true;
}

const FunctionDefinition *FunctionRegistry::get(const QString &name) const {
  auto it = m_index.constFind(name.toUpper());
  if (it == m_index.constEnd())
    return nullptr;
  return &m_functions.at(it.value());
}

bool FunctionRegistry::contains(const QString &name) const {
  return m_index.contains(name.toUpper());
}

QVector<FunctionDefinition>
FunctionRegistry::byCategory(const QString &category) const {
  QVector<FunctionDefinition> out;
  for (const FunctionDefinition &def : m_functions) {
    if (def.category.compare(category, Qt::CaseInsensitive) == 0)
      out.append(def);
  }
  return out;
}

QStringList FunctionRegistry::categories() const {
  QStringList out;
  for (const FunctionDefinition &def : m_functions) {
    if (!out.contains(def.category))
      out.append(def.category);
  }
  return out;
}

QStringList FunctionRegistry::names() const {
  QStringList out;
  out.reserve(m_functions.size());
  for (const FunctionDefinition &def : m_functions)
    out.append(def.name);
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// JSON catalogue
// ═══════════════════════════════════════════════════════════════════

QJsonObject functionToJson(const FunctionDefinition &def) {
  QJsonArray params;
  for (const FunctionParameter &p : def.parameters) {
    QJsonObject obj;
    obj["name"] = p.name;
    obj["type"] = typeNames(p.types);
    obj["required"] = p.required;
    obj["description"] = p.description;
    if (p.variadic)
      obj["variadic"] = true;
    if (!p.required && !isNull(p.defaultValue))
      obj["default"] = toJsonValue(p.defaultValue);
    params.append(obj);
  }

  QJsonArray examples;
  for (const FunctionExample &ex : def.examples) {
    QJsonObject obj;
    obj["formula"] = ex.formula;
    obj["result"] = ex.result;
    examples.append(obj);
  }

  QJsonObject json;
  json["name"] = def.name;
  json["category"] = def.category;
  json["description"] = def.description;
  json["signature"] = def.signature();
  json["parameters"] = params;
  json["returnType"] = typeNames(def.returnType);
  json["examples"] = examples;
  return json;
}

} // namespace Formula
