/**
 * @file ConversionFunctions.cpp
 * @brief conversion category
 */

#include "BuiltinFunctions.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Formula {
namespace Builtins {

void registerConversionFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("conversion");

  registry.add(define(
      "NUMBER", cat,
      "Converts numeric text, booleans and dates (ms since epoch) to a number",
      {param("value", ValueType::Any, "Value to convert")}, ValueType::Number,
      {{"NUMBER(\"123.5\")", "123.5"}, {"NUMBER(true)", "1"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        bool ok = false;
        const double d = toNumber(args[0], &ok);
        if (!ok) {
          *error = QString("cannot convert %1 to a number")
                       .arg(typeName(typeOf(args[0])));
          return QVariant();
        }
        return d;
      }));

  registry.add(define(
      "STRING", cat, "Display text of a value",
      {param("value", ValueType::Any, "Value to convert")}, ValueType::String,
      {{"STRING(123)", "123"}, {"STRING([1, 2])", "[1,2]"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return toText(args[0]); }));

  registry.add(define(
      "BOOLEAN", cat, "Truthiness of a value",
      {param("value", ValueType::Any, "Value to convert")}, ValueType::Boolean,
      {{"BOOLEAN(1)", "true"}, {"BOOLEAN(\"\")", "false"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return isTruthy(args[0]); }));

  registry.add(define(
      "JSON_PARSE", cat, "Parses JSON text, null when the text is not valid JSON",
      {param("text", ValueType::String, "JSON text")}, ValueType::Any,
      {{"JSON_PARSE('{\"a\": 1}').a", "1"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        // Wrapped in an array so scalar documents parse as well
        const QByteArray wrapped =
            "[" + args[0].toString().toUtf8() + "]";
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(wrapped, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isArray() ||
            doc.array().size() != 1)
          return QVariant();
        return fromJsonValue(doc.array().first());
      }));

  registry.add(define(
      "JSON_STRINGIFY", cat, "Compact JSON text of a value",
      {param("value", ValueType::Any, "Value to serialise")}, ValueType::String,
      {{"JSON_STRINGIFY({a: 1})", "{\"a\":1}"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QJsonArray holder;
        holder.append(toJsonValue(args[0]));
        const QString text = QString::fromUtf8(
            QJsonDocument(holder).toJson(QJsonDocument::Compact));
        return text.mid(1, text.length() - 2);
      }));
}

} // namespace Builtins
} // namespace Formula
