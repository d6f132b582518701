#ifndef FORMULA_EXPRESSION_SERVICE_H
#define FORMULA_EXPRESSION_SERVICE_H

/**
 * @file ExpressionService.h
 * @brief Public entry point of the formula engine
 *
 * Usage:
 *   Formula::ExpressionService service;
 *
 *   EvaluationContext ctx;
 *   ctx.fields["price"] = 10;
 *   ctx.fields["quantity"] = 5;
 *
 *   auto r = service.evaluate("price * quantity", ctx);   // r.value == 50
 *
 *   auto v = service.validate("ROUND(total, 2)", {"total"});
 *   // v.valid, v.referencedFields == {"total"}, v.referencedFunctions == {"ROUND"}
 *
 * The service keeps no per-call state; a single instance can be shared by
 * any number of threads.
 */

#include "formula/EngineLimits.h"
#include "formula/EvaluationContext.h"
#include "formula/FormulaEvaluator.h"
#include "formula/FormulaParser.h"
#include "formula/FormulaValidator.h"
#include "formula/FunctionRegistry.h"
#include <QJsonArray>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

namespace Formula {

// One token of a formula classified for syntax highlighting
struct HighlightToken {
    QString type;       // function, field, operator, literal, punctuation
    QString text;
    int     start = 0;
    int     end = 0;
};

// One autocomplete candidate
struct Suggestion {
    enum Kind { Function, Field, Variable };

    Kind    kind = Field;
    QString label;
    QString insertText;
    QString description;
    QString category;       // function category, empty otherwise
    int     cursorOffset = 0;   // characters from the end of insertText to place the cursor
};

class ExpressionService {
public:
    explicit ExpressionService(const EngineLimits &limits = EngineLimits(),
                               const FunctionRegistry &registry = FunctionRegistry::builtins());

    // ── Core operations ──
    ParseResult parse(const QString &source) const;

    EvaluationResult evaluate(const QString &source,
                              const EvaluationContext &context = EvaluationContext()) const;
    EvaluationResult evaluate(const ASTNodePtr &ast,
                              const EvaluationContext &context) const;

    ValidationResult validate(const QString &source) const;
    ValidationResult validate(const QString &source,
                              const QSet<QString> &knownFieldNames) const;

    // ── Function catalogue ──
    QVector<FunctionDefinition> listFunctions() const;
    QVector<FunctionDefinition> functionsByCategory(const QString &category) const;
    const FunctionDefinition *function(const QString &name) const;
    int functionCount() const;
    QJsonArray functionCatalogueJson() const;

    // ── Editor support ──
    // Empty when the source does not tokenize
    QVector<HighlightToken> highlight(const QString &source) const;

    // Candidates for the identifier ending at `cursor`, sorted by label.
    // Fields whose name starts with '$' are offered as variables.
    QVector<Suggestion> suggestions(const QString &source, int cursor,
                                    const QStringList &fields = QStringList()) const;

    const EngineLimits &limits() const { return m_limits; }
    const FunctionRegistry &registry() const { return m_registry; }

private:
    EngineLimits             m_limits;
    const FunctionRegistry  &m_registry;
    FormulaParser            m_parser;
    FormulaEvaluator         m_evaluator;
    FormulaValidator         m_validator;
};

} // namespace Formula

#endif // FORMULA_EXPRESSION_SERVICE_H
