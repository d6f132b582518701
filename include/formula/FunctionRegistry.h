#ifndef FORMULA_FUNCTION_REGISTRY_H
#define FORMULA_FUNCTION_REGISTRY_H

/**
 * @file FunctionRegistry.h
 * @brief Catalogue of built-in formula functions
 *
 * Each function is described by data (name, category, parameters, return
 * type, examples) plus an implementation callable. The evaluator checks
 * arity and argument kinds against the parameter list before it calls the
 * implementation, and fills omitted optional parameters with their default.
 *
 * FunctionRegistry::builtins() is built once on first use and is read-only
 * afterwards; it may be shared by any number of threads.
 */

#include "formula/FormulaValue.h"
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <functional>

namespace Formula {

struct EvaluationContext;

struct FunctionParameter {
    QString    name;
    ValueTypes types = ValueType::Any;
    bool       required = true;
    bool       variadic = false;    // last parameter only; absorbs the remaining arguments
    QString    description;
    QVariant   defaultValue;        // used for an omitted optional parameter
};

struct FunctionExample {
    QString formula;
    QString result;     // display text of the expected result
};

/**
 * Implementation signature. On failure an implementation sets *error to a
 * message (without the function name) and returns a null QVariant.
 */
using FunctionImpl = std::function<QVariant(const QVariantList &args,
                                            const EvaluationContext &context,
                                            QString *error)>;

struct FunctionDefinition {
    QString                    name;          // upper case
    QString                    category;      // math, text, logic, date, array, aggregate, lookup, conversion
    QString                    description;
    QVector<FunctionParameter> parameters;
    ValueTypes                 returnType = ValueType::Any;
    QVector<FunctionExample>   examples;
    FunctionImpl               implementation;
    bool                       readsContext = false;

    bool isValid() const { return !name.isEmpty() && implementation; }
    int minArgs() const;
    int maxArgs() const;    // -1 when the last parameter is variadic
    QString signature() const;  // "ROUND(number, [digits])"
};

class FunctionRegistry {
public:
    FunctionRegistry() = default;

    /// Process-wide registry holding every built-in function
    static const FunctionRegistry &builtins();

    /// Adds a definition. Rejects (with a warning) nameless, duplicate or
    /// example-less definitions.
    bool add(const FunctionDefinition &def);

    // Lookup is case-insensitive. Returns nullptr when absent.
    const FunctionDefinition *get(const QString &name) const;
    bool contains(const QString &name) const;

    QVector<FunctionDefinition> list() const { return m_functions; }   // registration order
    QVector<FunctionDefinition> byCategory(const QString &category) const;
    QStringList categories() const;
    QStringList names() const;
    int count() const { return m_functions.size(); }

private:
    QVector<FunctionDefinition> m_functions;
    QHash<QString, int>         m_index;    // upper-case name → m_functions slot
};

/// Catalogue entry for UI consumption (no implementation).
QJsonObject functionToJson(const FunctionDefinition &def);

} // namespace Formula

#endif // FORMULA_FUNCTION_REGISTRY_H
