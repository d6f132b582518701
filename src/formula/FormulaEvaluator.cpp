/**
 * @file FormulaEvaluator.cpp
 * @brief Tree-walking evaluation (semantics documented in FormulaEvaluator.h)
 */

#include "formula/FormulaEvaluator.h"
#include "formula/FunctionRegistry.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <exception>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// Result helpers / per-call state
// ═══════════════════════════════════════════════════════════════════

EvaluationResult EvaluationResult::ok(const QVariant &value) {
  EvaluationResult r;
  r.success = true;
  r.value = value;
  r.type = typeOf(value);
  return r;
}

EvaluationResult EvaluationResult::failure(const EvaluationError &error) {
  EvaluationResult r;
  r.error = error;
  return r;
}

struct FormulaEvaluator::State {
  explicit State(const EvaluationContext &c) : context(c) {}

  const EvaluationContext &context;
  int depth = 0;
  EvaluationError error;
};

namespace {

struct DepthGuard {
  explicit DepthGuard(int &counter) : m_counter(counter) { ++m_counter; }
  ~DepthGuard() { --m_counter; }
  int &m_counter;
};

QString describeType(const QVariant &v) { return typeName(typeOf(v)); }

// a.name on arrays, strings and objects
QVariant memberOf(const QVariant &object, const QString &name) {
  switch (typeOf(object)) {
  case ValueType::Object:
    return toMap(object).value(name);

  case ValueType::Array: {
    const QVariantList list = toList(object);
    if (name == QLatin1String("length"))
      return static_cast<double>(list.size());
    if (name == QLatin1String("first"))
      return list.isEmpty() ? QVariant() : list.first();
    if (name == QLatin1String("last"))
      return list.isEmpty() ? QVariant() : list.last();

    // Pluck the property from every object element
    QVariantList out;
    for (const QVariant &item : list) {
      if (typeOf(item) == ValueType::Object)
        out.append(toMap(item).value(name));
    }
    return out;
  }

  case ValueType::String:
    if (name == QLatin1String("length"))
      return static_cast<double>(object.toString().toUcs4().size());
    return QVariant();

  default:
    return QVariant();
  }
}

// a[key]: 0-based index into arrays and strings, key lookup on objects
QVariant indexOf(const QVariant &object, const QVariant &key) {
  const ValueType objectType = typeOf(object);

  if (isNumber(key) &&
      (objectType == ValueType::Array || objectType == ValueType::String)) {
    const double d = key.toDouble();
    if (d < 0 || d != std::floor(d))
      return QVariant();
    if (objectType == ValueType::Array) {
      const QVariantList list = toList(object);
      return d < list.size() ? list.at(static_cast<int>(d)) : QVariant();
    }
    const QVector<uint> cps = object.toString().toUcs4();
    if (d >= cps.size())
      return QVariant();
    return QString::fromUcs4(cps.constData() + static_cast<int>(d), 1);
  }

  if (typeOf(key) == ValueType::String)
    return memberOf(object, key.toString());

  return QVariant();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════════════

FormulaEvaluator::FormulaEvaluator(const FunctionRegistry &registry,
                                   const EngineLimits &limits)
    : m_registry(registry), m_limits(limits) {}

EvaluationResult
FormulaEvaluator::evaluate(const ASTNodePtr &ast,
                           const EvaluationContext &context) const {
  if (!ast) {
    EvaluationError err;
    err.kind = EvaluationError::Kind::Syntax;
    err.message = QStringLiteral("No expression to evaluate");
    return EvaluationResult::failure(err);
  }

  State st(context);
  bool ok = true;
  QVariant value = eval(ast.get(), st, &ok);
  if (!ok) {
    qDebug() << "[FormulaEvaluator]" << st.error.message << "at"
             << st.error.position;
    return EvaluationResult::failure(st.error);
  }
  return EvaluationResult::ok(value);
}

void FormulaEvaluator::fail(State &st, const QString &message,
                            const FormulaASTNode *node, bool *ok,
                            EvaluationError::Kind kind,
                            const QString &functionName) const {
  st.error.kind = kind;
  st.error.message = message;
  st.error.position = node ? node->start : 0;
  st.error.functionName = functionName;
  *ok = false;
}

// ═══════════════════════════════════════════════════════════════════
// Node dispatch
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::eval(const FormulaASTNode *node, State &st,
                                bool *ok) const {
  if (!node) {
    fail(st, QStringLiteral("Malformed expression"), node, ok);
    return QVariant();
  }

  DepthGuard guard(st.depth);
  if (m_limits.maxEvaluationDepth > 0 &&
      st.depth > m_limits.maxEvaluationDepth) {
    fail(st,
         QString("Evaluation nested too deeply (limit %1)")
             .arg(m_limits.maxEvaluationDepth),
         node, ok);
    return QVariant();
  }

  switch (node->kind) {
  case FormulaASTNode::Literal:
    return node->value;

  case FormulaASTNode::Identifier:
    return normalize(st.context.resolve(node->name));

  case FormulaASTNode::MemberExpression:
    return evalMember(node, st, ok);

  case FormulaASTNode::ArrayExpression: {
    QVariantList out;
    out.reserve(node->elements.size());
    for (const ASTNodePtr &element : node->elements) {
      QVariant v = eval(element.get(), st, ok);
      if (!*ok)
        return QVariant();
      out.append(v);
    }
    return out;
  }

  case FormulaASTNode::ObjectExpression: {
    QVariantMap out;
    for (int i = 0; i < node->elements.size() && i < node->keys.size(); ++i) {
      QVariant v = eval(node->elements[i].get(), st, ok);
      if (!*ok)
        return QVariant();
      out.insert(node->keys[i], v);
    }
    return out;
  }

  case FormulaASTNode::UnaryExpression:
    return evalUnary(node, st, ok);

  case FormulaASTNode::BinaryExpression:
    return evalBinary(node, st, ok);

  case FormulaASTNode::LogicalExpression:
    return evalLogical(node, st, ok);

  case FormulaASTNode::ConditionalExpression: {
    QVariant test = eval(node->left.get(), st, ok);
    if (!*ok)
      return QVariant();
    return isTruthy(test) ? eval(node->middle.get(), st, ok)
                          : eval(node->right.get(), st, ok);
  }

  case FormulaASTNode::CallExpression:
    return evalCall(node, st, ok);
  }

  fail(st, QString("Unsupported node kind %1").arg(nodeKindName(node->kind)),
       node, ok, EvaluationError::Kind::Internal);
  return QVariant();
}

QVariant FormulaEvaluator::evalMember(const FormulaASTNode *node, State &st,
                                     bool *ok) const {
  QVariant object = eval(node->left.get(), st, ok);
  if (!*ok)
    return QVariant();

  if (!node->computed)
    return memberOf(object, node->name);

  QVariant key = eval(node->right.get(), st, ok);
  if (!*ok)
    return QVariant();
  return indexOf(object, key);
}

QVariant FormulaEvaluator::evalUnary(const FormulaASTNode *node, State &st,
                                    bool *ok) const {
  QVariant operand = eval(node->left.get(), st, ok);
  if (!*ok)
    return QVariant();

  if (node->op == QLatin1String("!"))
    return !isTruthy(operand);

  if (!isNumber(operand)) {
    fail(st,
         QString("Unary '-' requires a number, got %1").arg(describeType(operand)),
         node, ok);
    return QVariant();
  }
  return -operand.toDouble();
}

QVariant FormulaEvaluator::evalLogical(const FormulaASTNode *node, State &st,
                                      bool *ok) const {
  QVariant left = eval(node->left.get(), st, ok);
  if (!*ok)
    return QVariant();

  const bool isAnd = node->op == QLatin1String("&&");
  const bool l = isTruthy(left);
  if (isAnd && !l)
    return false;
  if (!isAnd && l)
    return true;

  QVariant right = eval(node->right.get(), st, ok);
  if (!*ok)
    return QVariant();
  return isTruthy(right);
}

QVariant FormulaEvaluator::evalBinary(const FormulaASTNode *node, State &st,
                                     bool *ok) const {
  QVariant left = eval(node->left.get(), st, ok);
  if (!*ok)
    return QVariant();
  QVariant right = eval(node->right.get(), st, ok);
  if (!*ok)
    return QVariant();

  const QString &op = node->op;
  if (op == QLatin1String("==") || op == QLatin1String("!=") ||
      op == QLatin1String("<") || op == QLatin1String(">") ||
      op == QLatin1String("<=") || op == QLatin1String(">="))
    return compare(op, left, right, node, st, ok);

  return arithmetic(op, left, right, node, st, ok);
}

// ═══════════════════════════════════════════════════════════════════
// Operators
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::arithmetic(const QString &op, const QVariant &l,
                                      const QVariant &r,
                                      const FormulaASTNode *node, State &st,
                                      bool *ok) const {
  if (op == QLatin1String("&"))
    return toText(l) + toText(r);

  const bool numbers = isNumber(l) && isNumber(r);

  if (op == QLatin1String("+")) {
    if (numbers)
      return l.toDouble() + r.toDouble();
    if (typeOf(l) == ValueType::String || typeOf(r) == ValueType::String)
      return toText(l) + toText(r);
  }

  if (!numbers) {
    fail(st,
         QString("Operator '%1' cannot be applied to %2 and %3")
             .arg(op, describeType(l), describeType(r)),
         node, ok);
    return QVariant();
  }

  const double a = l.toDouble();
  const double b = r.toDouble();
  double result = 0.0;

  if (op == QLatin1String("+")) {
    result = a + b;
  } else if (op == QLatin1String("-")) {
    result = a - b;
  } else if (op == QLatin1String("*")) {
    result = a * b;
  } else if (op == QLatin1String("/")) {
    if (b == 0.0) {
      fail(st, QStringLiteral("Division by zero"), node, ok);
      return QVariant();
    }
    result = a / b;
  } else if (op == QLatin1String("%")) {
    if (b == 0.0) {
      fail(st, QStringLiteral("Modulo by zero"), node, ok);
      return QVariant();
    }
    result = std::fmod(a, b);
  } else if (op == QLatin1String("**")) {
    result = std::pow(a, b);
    if (std::isnan(result)) {
      fail(st, QStringLiteral("Exponentiation result is not a real number"),
           node, ok);
      return QVariant();
    }
  } else {
    fail(st, QString("Unknown operator '%1'").arg(op), node, ok,
         EvaluationError::Kind::Internal);
    return QVariant();
  }

  if (!std::isfinite(result)) {
    fail(st, QString("Result of '%1' is out of range").arg(op), node, ok);
    return QVariant();
  }
  return result;
}

QVariant FormulaEvaluator::compare(const QString &op, const QVariant &l,
                                   const QVariant &r,
                                   const FormulaASTNode *node, State &st,
                                   bool *ok) const {
  if (op == QLatin1String("=="))
    return valuesEqual(l, r);
  if (op == QLatin1String("!="))
    return !valuesEqual(l, r);

  const ValueType lt = typeOf(l);
  bool comparable = lt == typeOf(r) &&
                    (lt == ValueType::Number || lt == ValueType::String ||
                     lt == ValueType::Date);
  int c = 0;
  if (comparable)
    c = compareValues(l, r, &comparable);

  if (!comparable) {
    fail(st,
         QString("Cannot compare %1 with %2 using '%3'")
             .arg(describeType(l), describeType(r), op),
         node, ok);
    return QVariant();
  }

  if (op == QLatin1String("<"))
    return c < 0;
  if (op == QLatin1String(">"))
    return c > 0;
  if (op == QLatin1String("<="))
    return c <= 0;
  return c >= 0;
}

// ═══════════════════════════════════════════════════════════════════
// FUNCTION CALL DISPATCH
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::evalCall(const FormulaASTNode *node, State &st,
                                   bool *ok) const {
  const FormulaASTNode *callee = node->left.get();
  if (!callee || callee->kind != FormulaASTNode::Identifier) {
    fail(st, QStringLiteral("Expression is not callable"), node, ok);
    return QVariant();
  }

  const QString name = callee->name.toUpper();
  const FunctionDefinition *def = m_registry.get(name);
  if (!def) {
    fail(st, QString("Unknown function '%1'").arg(callee->name), node, ok,
         EvaluationError::Kind::Runtime, name);
    return QVariant();
  }

  // ── Arity ──
  const int argc = node->elements.size();
  const int minArgs = def->minArgs();
  const int maxArgs = def->maxArgs();
  if (argc < minArgs || (maxArgs >= 0 && argc > maxArgs)) {
    QString expected;
    if (maxArgs < 0)
      expected = QString("at least %1").arg(minArgs);
    else if (minArgs == maxArgs)
      expected = QString::number(minArgs);
    else
      expected = QString("%1 to %2").arg(minArgs).arg(maxArgs);
    fail(st,
         QString("%1 expects %2 argument(s), got %3")
             .arg(name, expected)
             .arg(argc),
         node, ok, EvaluationError::Kind::Runtime, name);
    return QVariant();
  }

  // ── IF: evaluate only the selected branch ──
  if (name == QLatin1String("IF")) {
    QVariant condition = eval(node->elements[0].get(), st, ok);
    if (!*ok)
      return QVariant();
    if (isTruthy(condition))
      return eval(node->elements[1].get(), st, ok);
    if (argc > 2)
      return eval(node->elements[2].get(), st, ok);
    return QVariant();
  }

  // ── Arguments, left to right, checked against the parameter list ──
  QVariantList args;
  args.reserve(std::max(argc, def->parameters.size()));
  for (int i = 0; i < argc; ++i) {
    QVariant v = eval(node->elements[i].get(), st, ok);
    if (!*ok)
      return QVariant();

    const FunctionParameter &p =
        def->parameters[std::min(i, def->parameters.size() - 1)];
    if (!p.types.testFlag(typeOf(v))) {
      fail(st,
           QString("%1: argument %2 (%3) must be %4, got %5")
               .arg(name)
               .arg(i + 1)
               .arg(p.name, typeNames(p.types), describeType(v)),
           node->elements[i].get(), ok, EvaluationError::Kind::Runtime, name);
      return QVariant();
    }
    args.append(v);
  }
  for (int i = argc; i < def->parameters.size(); ++i) {
    if (def->parameters[i].variadic)
      break;
    args.append(def->parameters[i].defaultValue);
  }

  // ── Call ──
  QString error;
  QVariant result;
  try {
    result = def->implementation(args, st.context, &error);
  } catch (const std::exception &e) {
    qCritical() << "[FormulaEvaluator] Function" << name
                << "threw:" << e.what();
    fail(st, QString("%1: internal error: %2").arg(name, QString::fromUtf8(e.what())),
         node, ok, EvaluationError::Kind::Internal, name);
    return QVariant();
  }

  if (!error.isEmpty()) {
    fail(st, QString("%1: %2").arg(name, error), node, ok,
         EvaluationError::Kind::Runtime, name);
    return QVariant();
  }

  result = normalize(result);
  if (typeOf(result) == ValueType::Number && !std::isfinite(result.toDouble())) {
    fail(st, QString("%1: result is out of range").arg(name), node, ok,
         EvaluationError::Kind::Runtime, name);
    return QVariant();
  }
  return result;
}

} // namespace Formula
