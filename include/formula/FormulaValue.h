#ifndef FORMULA_VALUE_H
#define FORMULA_VALUE_H

/**
 * @file FormulaValue.h
 * @brief Dynamic value model shared by the evaluator and the built-in functions
 *
 * Every formula value is a QVariant restricted to the kinds below.
 *
 *   Null     → invalid QVariant() (QVariant::fromValue(nullptr) is also null)
 *   Boolean  → bool
 *   Number   → double (int / qlonglong / float variants are read as numbers)
 *   String   → QString
 *   Date     → QDateTime (a QDate is read as local midnight)
 *   Array    → QVariantList (QStringList is accepted)
 *   Object   → QVariantMap (QVariantHash is accepted)
 *
 * Equality is strict: values of different kinds are never equal, so
 * 1 == "1" is false. Arrays and objects compare structurally.
 */

#include <QDateTime>
#include <QFlags>
#include <QJsonValue>
#include <QString>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>

namespace Formula {

enum class ValueType {
    Null    = 0x01,
    Boolean = 0x02,
    Number  = 0x04,
    String  = 0x08,
    Date    = 0x10,
    Array   = 0x20,
    Object  = 0x40,
    Any     = 0x7f
};
Q_DECLARE_FLAGS(ValueTypes, ValueType)
Q_DECLARE_OPERATORS_FOR_FLAGS(ValueTypes)

// ── Classification ──
ValueType typeOf(const QVariant &value);
QString typeName(ValueType type);
QString typeNames(ValueTypes types);   // "number or string"
bool isNull(const QVariant &value);
bool isNumber(const QVariant &value);

// ── Conversion ──
// Number for number/boolean/numeric-string/date(ms since epoch) inputs.
// Sets *ok = false (and returns 0) for anything else.
double toNumber(const QVariant &value, bool *ok = nullptr);

// Display text: null → "", 3.0 → "3", true → "true", dates ISO-8601,
// arrays/objects compact JSON.
QString toText(const QVariant &value);

// null, false, 0, NaN, "" and invalid dates are falsy; everything else truthy.
bool isTruthy(const QVariant &value);

QDateTime toDateTime(const QVariant &value, bool *ok = nullptr);
QVariantList toList(const QVariant &value);
QVariantMap toMap(const QVariant &value);

// Maps integer variants to double, QDate to QDateTime, QStringList to
// QVariantList and QVariantHash to QVariantMap, recursively.
QVariant normalize(const QVariant &value);

// ── Equality / ordering ──
bool valuesEqual(const QVariant &a, const QVariant &b);

// Orders number/number, string/string, date/date and boolean/boolean pairs.
// Returns <0, 0 or >0. Sets *comparable = false for other combinations.
int compareValues(const QVariant &a, const QVariant &b,
                  bool *comparable = nullptr);

// ── JSON bridge ──
QJsonValue toJsonValue(const QVariant &value);
QVariant fromJsonValue(const QJsonValue &value);

} // namespace Formula

#endif // FORMULA_VALUE_H
