#include "formula/FormulaValidator.h"
#include "formula/EvaluationContext.h"
#include "formula/FormulaParser.h"
#include "formula/FunctionRegistry.h"
#include <QHash>

namespace Formula {

namespace {

struct References {
  QStringList fields;
  QHash<QString, int> fieldPositions;
  QStringList functions;
  QHash<QString, int> functionPositions;
  QVector<int> notCallable;   // positions of calls on non-identifiers
};

void collectRefs(const ASTNodePtr &node, References &refs) {
  if (!node)
    return;

  switch (node->kind) {
  case FormulaASTNode::Identifier:
    if (!refs.fieldPositions.contains(node->name)) {
      refs.fields.append(node->name);
      refs.fieldPositions.insert(node->name, node->start);
    }
    return;

  case FormulaASTNode::CallExpression: {
    const ASTNodePtr &callee = node->left;
    if (callee && callee->kind == FormulaASTNode::Identifier) {
      const QString name = callee->name.toUpper();
      if (!refs.functionPositions.contains(name)) {
        refs.functions.append(name);
        refs.functionPositions.insert(name, callee->start);
      }
    } else {
      refs.notCallable.append(node->start);
      collectRefs(callee, refs);
    }
    for (const auto &arg : node->elements)
      collectRefs(arg, refs);
    return;
  }

  default:
    break;
  }

  // Member property names and object keys are not field references; the
  // member object (left) and computed index (right) are walked as usual.
  collectRefs(node->left, refs);
  collectRefs(node->right, refs);
  collectRefs(node->middle, refs);
  for (const auto &child : node->elements)
    collectRefs(child, refs);
}

bool isKnownField(const QString &name, const QSet<QString> &known) {
  if (known.contains(name))
    return true;
  // Bound variables and context names are supplied at evaluation time
  if (name.startsWith(QLatin1Char('$')) || EvaluationContext::isReservedName(name))
    return true;
  const QString prefix = name + QLatin1Char('.');
  for (const QString &k : known) {
    if (k.startsWith(prefix))
      return true;
  }
  return false;
}

} // namespace

FormulaValidator::FormulaValidator(const FunctionRegistry &registry,
                                   const EngineLimits &limits)
    : m_registry(registry), m_limits(limits) {}

ValidationResult FormulaValidator::validate(const QString &source) const {
  return run(source, nullptr);
}

ValidationResult
FormulaValidator::validate(const QString &source,
                           const QSet<QString> &knownFieldNames) const {
  return run(source, &knownFieldNames);
}

ValidationResult FormulaValidator::run(const QString &source,
                                       const QSet<QString> *known) const {
  const ParseResult parsed = FormulaParser(m_limits).parse(source);
  if (!parsed.success) {
    ValidationResult result;
    ValidationIssue issue;
    issue.type = QStringLiteral("syntax");
    issue.message = parsed.error.message;
    issue.position = parsed.error.position;
    result.errors.append(issue);
    return result;
  }
  return analyze(parsed.ast, known);
}

ValidationResult
FormulaValidator::analyze(const ASTNodePtr &ast,
                          const QSet<QString> *known) const {
  ValidationResult result;
  References refs;
  collectRefs(ast, refs);

  result.referencedFields = refs.fields;
  result.referencedFunctions = refs.functions;

  for (int pos : refs.notCallable) {
    ValidationIssue issue;
    issue.type = QStringLiteral("unknown_function");
    issue.message = QStringLiteral("Expression is not callable");
    issue.position = pos;
    result.errors.append(issue);
  }

  for (const QString &fn : refs.functions) {
    if (m_registry.contains(fn))
      continue;
    ValidationIssue issue;
    issue.type = QStringLiteral("unknown_function");
    issue.message = QString("Unknown function '%1'").arg(fn);
    issue.position = refs.functionPositions.value(fn);
    result.errors.append(issue);
  }

  if (known) {
    for (const QString &field : refs.fields) {
      if (isKnownField(field, *known))
        continue;
      ValidationIssue issue;
      issue.type = QStringLiteral("unknown_field");
      issue.message = QString("Unknown field '%1'").arg(field);
      issue.position = refs.fieldPositions.value(field);
      result.errors.append(issue);
    }
  }

  result.valid = result.errors.isEmpty();
  return result;
}

} // namespace Formula
