#ifndef FORMULA_VALIDATOR_H
#define FORMULA_VALIDATOR_H

#include "formula/EngineLimits.h"
#include "formula/FormulaAST.h"
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

namespace Formula {

class FunctionRegistry;

struct ValidationIssue {
    QString type;       // "syntax", "unknown_field" or "unknown_function"
    QString message;
    int     position = 0;
};

struct ValidationResult {
    bool                     valid = false;
    QVector<ValidationIssue> errors;
    QStringList              referencedFields;      // root names, first-seen order
    QStringList              referencedFunctions;   // upper case, first-seen order
};

/**
 * @brief Static analysis of a formula without evaluating it.
 *
 * Reports syntax errors, calls to functions the registry does not know and,
 * when a set of known field names is given, references to unknown fields.
 * A field is known when the set contains its name or a dotted path below it
 * ("order" is known when "order.total" is listed).
 */
class FormulaValidator {
public:
    explicit FormulaValidator(const FunctionRegistry &registry,
                              const EngineLimits &limits = EngineLimits());

    ValidationResult validate(const QString &source) const;
    ValidationResult validate(const QString &source,
                              const QSet<QString> &knownFieldNames) const;

    // Reference analysis of an already parsed tree (no syntax check)
    ValidationResult analyze(const ASTNodePtr &ast,
                             const QSet<QString> *knownFieldNames) const;

private:
    ValidationResult run(const QString &source,
                         const QSet<QString> *knownFieldNames) const;

    const FunctionRegistry &m_registry;
    EngineLimits m_limits;
};

} // namespace Formula

#endif // FORMULA_VALIDATOR_H
