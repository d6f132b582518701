#ifndef FORMULA_EVALUATOR_H
#define FORMULA_EVALUATOR_H

/**
 * @file FormulaEvaluator.h
 * @brief Tree-walking evaluator for parsed formulas
 *
 * ═══════════════════════════════════════════════════════════════════
 * SEMANTICS
 * ═══════════════════════════════════════════════════════════════════
 *
 * ── Arithmetic ──
 *   - * / % **   numbers only; division and modulo by zero fail
 *   +            number + number adds; if either side is a string both
 *                sides are converted to text and concatenated
 *   &            always text concatenation
 *
 * ── Comparison ──
 *   == !=        strict structural equality (1 == "1" is false)
 *   < > <= >=    number/number, string/string, date/date
 *
 * ── Logic ──
 *   && ||        short-circuit, result is a boolean
 *   !            negated truthiness
 *   a ? b : c    only the chosen branch is evaluated (IF(...) likewise)
 *
 * ── Names ──
 *   field        context field, null when absent
 *   a.b          object property; on arrays: length / first / last, or the
 *                property of every object element; on strings: length
 *   a[i]         0-based array / string index, object key
 *
 * Runtime problems are returned in EvaluationResult; nothing is thrown to
 * the caller. One evaluator may be used by several threads at once.
 */

#include "formula/EngineLimits.h"
#include "formula/EvaluationContext.h"
#include "formula/FormulaAST.h"
#include "formula/FormulaValue.h"
#include <QString>
#include <QVariant>

namespace Formula {

class FunctionRegistry;

struct EvaluationError {
    enum class Kind {
        Syntax,     // formula did not parse (set by ExpressionService)
        Runtime,    // type mismatch, bad arguments, unknown function, ...
        Internal    // a function implementation failed unexpectedly
    };

    Kind    kind = Kind::Runtime;
    QString message;
    int     position = 0;       // source offset of the failing node
    QString functionName;       // set when the failure happened inside a call
};

struct EvaluationResult {
    bool            success = false;
    QVariant        value;
    ValueType       type = ValueType::Null;
    EvaluationError error;      // meaningful when !success

    static EvaluationResult ok(const QVariant &value);
    static EvaluationResult failure(const EvaluationError &error);
};

class FormulaEvaluator {
public:
    explicit FormulaEvaluator(const FunctionRegistry &registry,
                              const EngineLimits &limits = EngineLimits());

    EvaluationResult evaluate(const ASTNodePtr &ast,
                              const EvaluationContext &context) const;

private:
    struct State;

    QVariant eval(const FormulaASTNode *node, State &st, bool *ok) const;

    QVariant evalMember(const FormulaASTNode *node, State &st, bool *ok) const;
    QVariant evalUnary(const FormulaASTNode *node, State &st, bool *ok) const;
    QVariant evalBinary(const FormulaASTNode *node, State &st, bool *ok) const;
    QVariant evalLogical(const FormulaASTNode *node, State &st, bool *ok) const;
    QVariant evalCall(const FormulaASTNode *node, State &st, bool *ok) const;

    QVariant arithmetic(const QString &op, const QVariant &l, const QVariant &r,
                        const FormulaASTNode *node, State &st, bool *ok) const;
    QVariant compare(const QString &op, const QVariant &l, const QVariant &r,
                     const FormulaASTNode *node, State &st, bool *ok) const;

    void fail(State &st, const QString &message, const FormulaASTNode *node,
              bool *ok,
              EvaluationError::Kind kind = EvaluationError::Kind::Runtime,
              const QString &functionName = QString()) const;

    const FunctionRegistry &m_registry;
    EngineLimits m_limits;
};

} // namespace Formula

#endif // FORMULA_EVALUATOR_H
