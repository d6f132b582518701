/**
 * @file FormulaValue.cpp
 * @brief Classification, conversion and comparison of formula values
 */

#include "formula/FormulaValue.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <cmath>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════

ValueType typeOf(const QVariant &value) {
  switch (value.userType()) {
  case QMetaType::UnknownType:
  case QMetaType::Nullptr:
    return ValueType::Null;
  case QMetaType::Bool:
    return ValueType::Boolean;
  case QMetaType::Int:
  case QMetaType::UInt:
  case QMetaType::Short:
  case QMetaType::UShort:
  case QMetaType::Long:
  case QMetaType::ULong:
  case QMetaType::LongLong:
  case QMetaType::ULongLong:
  case QMetaType::Float:
  case QMetaType::Double:
    return ValueType::Number;
  case QMetaType::QString:
  case QMetaType::QChar:
    return ValueType::String;
  case QMetaType::QDateTime:
  case QMetaType::QDate:
    return ValueType::Date;
  case QMetaType::QVariantList:
  case QMetaType::QStringList:
    return ValueType::Array;
  case QMetaType::QVariantMap:
  case QMetaType::QVariantHash:
    return ValueType::Object;
  default:
    break;
  }
  // Anything else a host put into a context is treated as absent
  return ValueType::Null;
}

QString typeName(ValueType type) {
  switch (type) {
  case ValueType::Null:
    return QStringLiteral("null");
  case ValueType::Boolean:
    return QStringLiteral("boolean");
  case ValueType::Number:
    return QStringLiteral("number");
  case ValueType::String:
    return QStringLiteral("string");
  case ValueType::Date:
    return QStringLiteral("date");
  case ValueType::Array:
    return QStringLiteral("array");
  case ValueType::Object:
    return QStringLiteral("object");
  case ValueType::Any:
    return QStringLiteral("any");
  }
  return QStringLiteral("any");
}

QString typeNames(ValueTypes types) {
  if (types == ValueTypes(ValueType::Any))
    return typeName(ValueType::Any);

  static const ValueType order[] = {
      ValueType::Number, ValueType::String, ValueType::Boolean,
      ValueType::Date,   ValueType::Array,  ValueType::Object,
      ValueType::Null};
  QStringList names;
  for (ValueType t : order) {
    if (types.testFlag(t))
      names.append(typeName(t));
  }
  return names.join(QStringLiteral(" or "));
}

bool isNull(const QVariant &value) { return typeOf(value) == ValueType::Null; }

bool isNumber(const QVariant &value) {
  return typeOf(value) == ValueType::Number;
}

// ═══════════════════════════════════════════════════════════════════
// Conversion
// ═══════════════════════════════════════════════════════════════════

static QString numberToText(double v) {
  if (std::isnan(v))
    return QStringLiteral("NaN");
  if (std::isinf(v))
    return v > 0 ? QStringLiteral("Infinity") : QStringLiteral("-Infinity");
  if (v == std::floor(v) && std::fabs(v) < 1e15)
    return QString::number(static_cast<qlonglong>(v));
  return QString::number(v, 'g', 15);
}

double toNumber(const QVariant &value, bool *ok) {
  if (ok)
    *ok = true;

  switch (typeOf(value)) {
  case ValueType::Number:
    return value.toDouble();
  case ValueType::Boolean:
    return value.toBool() ? 1.0 : 0.0;
  case ValueType::Null:
    return 0.0;
  case ValueType::String: {
    bool parsed = false;
    double d = value.toString().trimmed().toDouble(&parsed);
    if (parsed && std::isfinite(d))
      return d;
    break;
  }
  case ValueType::Date: {
    QDateTime dt = toDateTime(value);
    if (dt.isValid())
      return static_cast<double>(dt.toMSecsSinceEpoch());
    break;
  }
  default:
    break;
  }

  if (ok)
    *ok = false;
  return 0.0;
}

QString toText(const QVariant &value) {
  switch (typeOf(value)) {
  case ValueType::Null:
    return QString();
  case ValueType::Boolean:
    return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
  case ValueType::Number:
    return numberToText(value.toDouble());
  case ValueType::String:
    return value.toString();
  case ValueType::Date:
    return toDateTime(value).toString(Qt::ISODateWithMs);
  case ValueType::Array:
    return QString::fromUtf8(
        QJsonDocument(toJsonValue(value).toArray())
            .toJson(QJsonDocument::Compact));
  case ValueType::Object:
    return QString::fromUtf8(
        QJsonDocument(toJsonValue(value).toObject())
            .toJson(QJsonDocument::Compact));
  case ValueType::Any:
    break;
  }
  return QString();
}

bool isTruthy(const QVariant &value) {
  switch (typeOf(value)) {
  case ValueType::Null:
    return false;
  case ValueType::Boolean:
    return value.toBool();
  case ValueType::Number: {
    double d = value.toDouble();
    return d != 0.0 && !std::isnan(d);
  }
  case ValueType::String:
    return !value.toString().isEmpty();
  case ValueType::Date:
    return toDateTime(value).isValid();
  default:
    return true;
  }
}

QDateTime toDateTime(const QVariant &value, bool *ok) {
  QDateTime dt;
  switch (value.userType()) {
  case QMetaType::QDateTime:
    dt = value.toDateTime();
    break;
  case QMetaType::QDate:
    dt = QDateTime(value.toDate(), QTime(0, 0));
    break;
  case QMetaType::QString: {
    const QString text = value.toString().trimmed();
    dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid())
      dt = QDateTime::fromString(text, Qt::ISODate);
    if (!dt.isValid()) {
      QDate d = QDate::fromString(text, Qt::ISODate);
      if (d.isValid())
        dt = QDateTime(d, QTime(0, 0));
    }
    break;
  }
  default:
    break;
  }
  if (ok)
    *ok = dt.isValid();
  return dt;
}

QVariantList toList(const QVariant &value) {
  if (value.userType() == QMetaType::QStringList) {
    QVariantList out;
    for (const QString &s : value.toStringList())
      out.append(s);
    return out;
  }
  if (value.userType() == QMetaType::QVariantList)
    return value.toList();
  return {};
}

QVariantMap toMap(const QVariant &value) {
  if (value.userType() == QMetaType::QVariantHash) {
    QVariantMap out;
    const QVariantHash hash = value.toHash();
    for (auto it = hash.begin(); it != hash.end(); ++it)
      out.insert(it.key(), it.value());
    return out;
  }
  if (value.userType() == QMetaType::QVariantMap)
    return value.toMap();
  return {};
}

QVariant normalize(const QVariant &value) {
  switch (typeOf(value)) {
  case ValueType::Null:
    return QVariant();
  case ValueType::Number:
    return QVariant(value.toDouble());
  case ValueType::String:
    return QVariant(value.toString());
  case ValueType::Date:
    return QVariant(toDateTime(value));
  case ValueType::Array: {
    QVariantList out;
    for (const QVariant &item : toList(value))
      out.append(normalize(item));
    return out;
  }
  case ValueType::Object: {
    QVariantMap out;
    const QVariantMap map = toMap(value);
    for (auto it = map.begin(); it != map.end(); ++it)
      out.insert(it.key(), normalize(it.value()));
    return out;
  }
  default:
    return value;
  }
}

// ═══════════════════════════════════════════════════════════════════
// Equality / ordering
// ═══════════════════════════════════════════════════════════════════

bool valuesEqual(const QVariant &a, const QVariant &b) {
  const ValueType ta = typeOf(a);
  if (ta != typeOf(b))
    return false;

  switch (ta) {
  case ValueType::Null:
    return true;
  case ValueType::Boolean:
    return a.toBool() == b.toBool();
  case ValueType::Number:
    return a.toDouble() == b.toDouble();
  case ValueType::String:
    return a.toString() == b.toString();
  case ValueType::Date:
    return toDateTime(a) == toDateTime(b);
  case ValueType::Array: {
    const QVariantList la = toList(a);
    const QVariantList lb = toList(b);
    if (la.size() != lb.size())
      return false;
    for (int i = 0; i < la.size(); ++i) {
      if (!valuesEqual(la[i], lb[i]))
        return false;
    }
    return true;
  }
  case ValueType::Object: {
    const QVariantMap ma = toMap(a);
    const QVariantMap mb = toMap(b);
    if (ma.size() != mb.size())
      return false;
    for (auto it = ma.begin(); it != ma.end(); ++it) {
      auto other = mb.find(it.key());
      if (other == mb.end() || !valuesEqual(it.value(), other.value()))
        return false;
    }
    return true;
  }
  case ValueType::Any:
    break;
  }
  return false;
}

int compareValues(const QVariant &a, const QVariant &b, bool *comparable) {
  if (comparable)
    *comparable = true;

  const ValueType ta = typeOf(a);
  if (ta == typeOf(b)) {
    switch (ta) {
    case ValueType::Number: {
      double x = a.toDouble();
      double y = b.toDouble();
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    case ValueType::String:
      return QString::compare(a.toString(), b.toString(), Qt::CaseSensitive);
    case ValueType::Date: {
      qint64 x = toDateTime(a).toMSecsSinceEpoch();
      qint64 y = toDateTime(b).toMSecsSinceEpoch();
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    case ValueType::Boolean:
      return int(a.toBool()) - int(b.toBool());
    default:
      break;
    }
  }

  if (comparable)
    *comparable = false;
  return 0;
}

// ═══════════════════════════════════════════════════════════════════
// JSON bridge
// ═══════════════════════════════════════════════════════════════════

QJsonValue toJsonValue(const QVariant &value) {
  switch (typeOf(value)) {
  case ValueType::Null:
    return QJsonValue(QJsonValue::Null);
  case ValueType::Boolean:
    return QJsonValue(value.toBool());
  case ValueType::Number:
    return QJsonValue(value.toDouble());
  case ValueType::String:
    return QJsonValue(value.toString());
  case ValueType::Date:
    return QJsonValue(toDateTime(value).toString(Qt::ISODateWithMs));
  case ValueType::Array: {
    QJsonArray arr;
    for (const QVariant &item : toList(value))
      arr.append(toJsonValue(item));
    return arr;
  }
  case ValueType::Object: {
    QJsonObject obj;
    const QVariantMap map = toMap(value);
    for (auto it = map.begin(); it != map.end(); ++it)
      obj.insert(it.key(), toJsonValue(it.value()));
    return obj;
  }
  case ValueType::Any:
    break;
  }
  return QJsonValue(QJsonValue::Null);
}

QVariant fromJsonValue(const QJsonValue &value) {
  switch (value.type()) {
  case QJsonValue::Bool:
    return value.toBool();
  case QJsonValue::Double:
    return value.toDouble();
  case QJsonValue::String:
    return value.toString();
  case QJsonValue::Array: {
    QVariantList out;
    const QJsonArray arr = value.toArray();
    for (const QJsonValue &item : arr)
      out.append(fromJsonValue(item));
    return out;
  }
  case QJsonValue::Object: {
    QVariantMap out;
    const QJsonObject obj = value.toObject();
    for (auto it = obj.begin(); it != obj.end(); ++it)
      out.insert(it.key(), fromJsonValue(it.value()));
    return out;
  }
  case QJsonValue::Null:
  case QJsonValue::Undefined:
    break;
  }
  return QVariant();
}

} // namespace Formula
