#ifndef FORMULA_BUILTIN_FUNCTIONS_H
#define FORMULA_BUILTIN_FUNCTIONS_H

// Internal to the library: per-category registration entry points and the
// small helpers the function tables share.

#include "formula/EvaluationContext.h"
#include "formula/FunctionRegistry.h"
#include <cmath>

namespace Formula {
namespace Builtins {

void registerMathFunctions(FunctionRegistry &registry);
void registerTextFunctions(FunctionRegistry &registry);
void registerDateFunctions(FunctionRegistry &registry);
void registerLogicFunctions(FunctionRegistry &registry);
void registerArrayFunctions(FunctionRegistry &registry);
void registerLookupFunctions(FunctionRegistry &registry);
void registerConversionFunctions(FunctionRegistry &registry);

// ── Parameter builders ──
inline FunctionParameter param(const QString &name, ValueTypes types,
                               const QString &description) {
    FunctionParameter p;
    p.name = name;
    p.types = types;
    p.description = description;
    return p;
}

inline FunctionParameter optionalParam(const QString &name, ValueTypes types,
                                       const QString &description,
                                       const QVariant &defaultValue = QVariant()) {
    FunctionParameter p = param(name, types, description);
    p.required = false;
    p.defaultValue = defaultValue;
    return p;
}

inline FunctionParameter variadicParam(const QString &name, ValueTypes types,
                                       const QString &description,
                                       bool required = true) {
    FunctionParameter p = param(name, types, description);
    p.variadic = true;
    p.required = required;
    return p;
}

inline FunctionDefinition define(const QString &name, const QString &category,
                                 const QString &description,
                                 const QVector<FunctionParameter> &parameters,
                                 ValueTypes returnType,
                                 const QVector<FunctionExample> &examples,
                                 const FunctionImpl &impl) {
    FunctionDefinition def;
    def.name = name;
    def.category = category;
    def.description = description;
    def.parameters = parameters;
    def.returnType = returnType;
    def.examples = examples;
    def.implementation = impl;
    return def;
}

// Numbers of every argument, descending one level into arrays.
// Sets *error and returns false when a non-number is found.
bool collectNumbers(const QVariantList &args, QVector<double> &out,
                    QString *error);

// Whole-number argument truncated toward zero. Non-finite values and values
// outside [minimum, maximum] set *error to "<what> out of range".
inline bool wholeNumberArg(double value, double minimum, double maximum,
                           const QString &what, qint64 &out, QString *error) {
    if (!std::isfinite(value) || value < minimum || value > maximum) {
        *error = QString("%1 out of range").arg(what);
        return false;
    }
    out = static_cast<qint64>(std::trunc(value));
    return true;
}

// Date argument that may also be an ISO-8601 string
bool dateArg(const QVariant &value, QDateTime &out, QString *error);

} // namespace Builtins
} // namespace Formula

#endif // FORMULA_BUILTIN_FUNCTIONS_H
