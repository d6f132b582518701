/**
 * @file ExpressionService.cpp
 * @brief Facade wiring parser, evaluator, validator and the registry
 */

#include "formula/ExpressionService.h"
#include "formula/FormulaTokenizer.h"
#include <QDebug>
#include <algorithm>

namespace Formula {

ExpressionService::ExpressionService(const EngineLimits &limits,
                                     const FunctionRegistry &registry)
    : m_limits(limits), m_registry(registry), m_parser(limits),
      m_evaluator(registry, limits), m_validator(registry, limits) {}

// ═══════════════════════════════════════════════════════════════════
// Core operations
// ═══════════════════════════════════════════════════════════════════

ParseResult ExpressionService::parse(const QString &source) const {
  ParseResult result = m_parser.parse(source);
  if (!result.success)
    qDebug() << "[ExpressionService] Parse failed:" << result.error.message
             << "at" << result.error.position;
  return result;
}

EvaluationResult
ExpressionService::evaluate(const QString &source,
                            const EvaluationContext &context) const {
  const ParseResult parsed = parse(source);
  if (!parsed.success) {
    EvaluationError err;
    err.kind = EvaluationError::Kind::Syntax;
    err.message = parsed.error.message;
    err.position = parsed.error.position;
    return EvaluationResult::failure(err);
  }
  return m_evaluator.evaluate(parsed.ast, context);
}

EvaluationResult
ExpressionService::evaluate(const ASTNodePtr &ast,
                            const EvaluationContext &context) const {
  return m_evaluator.evaluate(ast, context);
}

ValidationResult ExpressionService::validate(const QString &source) const {
  return m_validator.validate(source);
}

ValidationResult
ExpressionService::validate(const QString &source,
                            const QSet<QString> &knownFieldNames) const {
  return m_validator.validate(source, knownFieldNames);
}

// ═══════════════════════════════════════════════════════════════════
// Function catalogue
// ═══════════════════════════════════════════════════════════════════

QVector<FunctionDefinition> ExpressionService::listFunctions() const {
  return m_registry.list();
}

QVector<FunctionDefinition>
ExpressionService::functionsByCategory(const QString &category) const {
  return m_registry.byCategory(category);
}

const FunctionDefinition *
ExpressionService::function(const QString &name) const {
  return m_registry.get(name);
}

int ExpressionService::functionCount() const { return m_registry.count(); }

QJsonArray ExpressionService::functionCatalogueJson() const {
  QJsonArray out;
  for (const FunctionDefinition &def : m_registry.list())
    out.append(functionToJson(def));
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// Editor support
// ═══════════════════════════════════════════════════════════════════

QVector<HighlightToken> ExpressionService::highlight(const QString &source) const {
  bool ok = false;
  const FormulaTokenList tokens = FormulaTokenizer::tokenize(source, &ok);
  if (!ok)
    return {};

  QVector<HighlightToken> out;
  for (int i = 0; i < tokens.size(); ++i) {
    const FormulaToken &tok = tokens[i];
    if (tok.type == FormulaToken::End)
      break;

    HighlightToken h;
    h.text = tok.text;
    h.start = tok.position;
    h.end = tok.position + tok.text.length();

    switch (tok.type) {
    case FormulaToken::Number:
    case FormulaToken::String:
      h.type = QStringLiteral("literal");
      if (tok.type == FormulaToken::String) {
        // Span covers the quotes and escapes as written
        h.end = tokens[i + 1].position;
        while (h.end > h.start && source.at(h.end - 1).isSpace())
          --h.end;
      }
      break;
    case FormulaToken::Identifier: {
      const QString lower = tok.text.toLower();
      if (lower == QLatin1String("true") || lower == QLatin1String("false") ||
          lower == QLatin1String("null"))
        h.type = QStringLiteral("literal");
      else if (i + 1 < tokens.size() &&
               tokens[i + 1].type == FormulaToken::LParen)
        h.type = QStringLiteral("function");
      else
        h.type = QStringLiteral("field");
      break;
    }
    default:
      h.type = tok.isOperator() ? QStringLiteral("operator")
                                : QStringLiteral("punctuation");
      break;
    }
    out.append(h);
  }
  return out;
}

QVector<Suggestion> ExpressionService::suggestions(const QString &source,
                                                   int cursor,
                                                   const QStringList &fields) const {
  const int end = std::max(0, std::min(cursor, source.length()));
  int start = end;
  while (start > 0) {
    const QChar ch = source.at(start - 1);
    if (!ch.isLetterOrNumber() && ch != QLatin1Char('_') &&
        ch != QLatin1Char('$'))
      break;
    --start;
  }
  const QString partial = source.mid(start, end - start);

  QVector<Suggestion> out;
  for (const FunctionDefinition &def : m_registry.list()) {
    if (!def.name.startsWith(partial, Qt::CaseInsensitive))
      continue;
    Suggestion s;
    s.kind = Suggestion::Function;
    s.label = def.name;
    s.insertText = def.name + QLatin1Char('(');
    s.description = def.description;
    s.category = def.category;
    s.cursorOffset = 1;
    out.append(s);
  }

  for (const QString &field : fields) {
    if (!field.startsWith(partial, Qt::CaseInsensitive))
      continue;
    Suggestion s;
    s.kind = field.startsWith(QLatin1Char('$')) ? Suggestion::Variable
                                                : Suggestion::Field;
    s.label = field;
    s.insertText = field;
    out.append(s);
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const Suggestion &a, const Suggestion &b) {
                     return QString::compare(a.label, b.label,
                                             Qt::CaseInsensitive) < 0;
                   });
  return out;
}

} // namespace Formula
