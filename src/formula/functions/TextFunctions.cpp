/**
 * @file TextFunctions.cpp
 * @brief text category
 *
 * Positions and lengths count Unicode code points, so a character outside
 * the BMP (a surrogate pair in QString) counts once.
 */

#include "BuiltinFunctions.h"
#include <QLocale>
#include <algorithm>
#include <cmath>

namespace Formula {
namespace Builtins {

namespace {

const ValueTypes kTextLike = ValueType::String | ValueType::Number;

QVector<uint> codePoints(const QVariant &value) { return toText(value).toUcs4(); }

QString fromCodePoints(const QVector<uint> &cps, int start, int count) {
  if (start >= cps.size() || count <= 0)
    return QString();
  count = std::min(count, cps.size() - start);
  return QString::fromUcs4(cps.constData() + start, count);
}

bool countArg(const QVariant &value, const char *what, int *out,
              QString *error) {
  const double d = value.toDouble();
  if (d < 0 || std::isnan(d)) {
    *error = QString("%1 must not be negative").arg(QLatin1String(what));
    return false;
  }
  *out = d > 1e9 ? 1000000000 : static_cast<int>(std::trunc(d));
  return true;
}

QString formatNumber(double value, const QString &format) {
  int decimals = 0;
  const int dot = format.indexOf(QLatin1Char('.'));
  if (dot >= 0) {
    for (int i = dot + 1; i < format.size() && (format[i] == QLatin1Char('0') ||
                                                format[i] == QLatin1Char('#'));
         ++i)
      ++decimals;
  }

  if (format.contains(QLatin1Char(','))) {
    QLocale locale(QLocale::English, QLocale::UnitedStates);
    return locale.toString(value, 'f', decimals);
  }
  if (format.contains(QLatin1Char('0')) || format.contains(QLatin1Char('#')))
    return QString::number(value, 'f', decimals);
  return toText(value);
}

QString formatDate(const QDateTime &dt, QString format) {
  const QDate d = dt.date();
  const QTime t = dt.time();
  format.replace(QLatin1String("YYYY"), QString::number(d.year()));
  format.replace(QLatin1String("MM"), QString::number(d.month()).rightJustified(2, QLatin1Char('0')));
  format.replace(QLatin1String("DD"), QString::number(d.day()).rightJustified(2, QLatin1Char('0')));
  format.replace(QLatin1String("HH"), QString::number(t.hour()).rightJustified(2, QLatin1Char('0')));
  format.replace(QLatin1String("mm"), QString::number(t.minute()).rightJustified(2, QLatin1Char('0')));
  format.replace(QLatin1String("ss"), QString::number(t.second()).rightJustified(2, QLatin1Char('0')));
  return format;
}

} // namespace

void registerTextFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("text");

  const FunctionImpl concat = [](const QVariantList &args,
                                 const EvaluationContext &,
                                 QString *) -> QVariant {
    QString out;
    for (const QVariant &v : args)
      out += toText(v);
    return out;
  };

  registry.add(define(
      "CONCAT", cat, "Joins the text of all arguments",
      {variadicParam("values", ValueType::Any, "Values to join")},
      ValueType::String, {{"CONCAT(\"Hello\", \" \", \"World\")", "Hello World"}},
      concat));

  registry.add(define(
      "CONCATENATE", cat, "Same as CONCAT",
      {variadicParam("values", ValueType::Any, "Values to join")},
      ValueType::String, {{"CONCATENATE(\"a\", 1, true)", "a1true"}}, concat));

  registry.add(define(
      "UPPER", cat, "Converts text to upper case",
      {param("text", kTextLike, "Text")}, ValueType::String,
      {{"UPPER(\"hello\")", "HELLO"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return toText(args[0]).toUpper(); }));

  registry.add(define(
      "LOWER", cat, "Converts text to lower case",
      {param("text", kTextLike, "Text")}, ValueType::String,
      {{"LOWER(\"HELLO\")", "hello"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return toText(args[0]).toLower(); }));

  registry.add(define(
      "TRIM", cat, "Removes leading and trailing whitespace",
      {param("text", kTextLike, "Text")}, ValueType::String,
      {{"TRIM(\"  hello  \")", "hello"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant { return toText(args[0]).trimmed(); }));

  registry.add(define(
      "LEFT", cat, "First characters of a text",
      {param("text", kTextLike, "Source text"),
       param("count", ValueType::Number, "Number of characters")},
      ValueType::String, {{"LEFT(\"Hello\", 3)", "Hel"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        int count = 0;
        if (!countArg(args[1], "count", &count, error))
          return QVariant();
        return fromCodePoints(codePoints(args[0]), 0, count);
      }));

  registry.add(define(
      "RIGHT", cat, "Last characters of a text",
      {param("text", kTextLike, "Source text"),
       param("count", ValueType::Number, "Number of characters")},
      ValueType::String, {{"RIGHT(\"Hello\", 3)", "llo"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        int count = 0;
        if (!countArg(args[1], "count", &count, error))
          return QVariant();
        const QVector<uint> cps = codePoints(args[0]);
        const int start = std::max(0, cps.size() - count);
        return fromCodePoints(cps, start, cps.size() - start);
      }));

  registry.add(define(
      "MID", cat, "Characters from a 1-based start position",
      {param("text", kTextLike, "Source text"),
       param("start", ValueType::Number, "Start position (1-based)"),
       param("count", ValueType::Number, "Number of characters")},
      ValueType::String, {{"MID(\"Hello\", 2, 3)", "ell"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double start = args[1].toDouble();
        if (!(start >= 1)) {
          *error = QStringLiteral("start must be 1 or greater");
          return QVariant();
        }
        int count = 0;
        if (!countArg(args[2], "count", &count, error))
          return QVariant();
        const int from = start > 1e9 ? 1000000000
                                     : static_cast<int>(std::trunc(start)) - 1;
        return fromCodePoints(codePoints(args[0]), from, count);
      }));

  registry.add(define(
      "LEN", cat, "Number of characters in a text",
      {param("text", kTextLike, "Text")}, ValueType::Number,
      {{"LEN(\"Hello\")", "5"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        return static_cast<double>(codePoints(args[0]).size());
      }));

  registry.add(define(
      "FIND", cat,
      "1-based position of the first occurrence of a text, 0 when absent",
      {param("search", kTextLike, "Text to find"),
       param("within", kTextLike, "Text to search"),
       optionalParam("start", ValueType::Number, "Start position (1-based)",
                     1.0)},
      ValueType::Number, {{"FIND(\"l\", \"Hello\")", "3"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        const double start = args[2].toDouble();
        if (!(start >= 1)) {
          *error = QStringLiteral("start must be 1 or greater");
          return QVariant();
        }
        const QVector<uint> needle = codePoints(args[0]);
        const QVector<uint> hay = codePoints(args[1]);
        const int from = start > 1e9 ? hay.size() + 1
                                     : static_cast<int>(std::trunc(start)) - 1;
        for (int i = from; i + needle.size() <= hay.size(); ++i) {
          if (std::equal(needle.begin(), needle.end(), hay.begin() + i))
            return static_cast<double>(i + 1);
        }
        return 0.0;
      }));

  registry.add(define(
      "REPLACE", cat, "Replaces every occurrence of a text (literal match)",
      {param("text", kTextLike, "Original text"),
       param("search", kTextLike, "Text to find"),
       param("replacement", kTextLike, "Replacement text")},
      ValueType::String,
      {{"REPLACE(\"Hello World\", \"World\", \"Universe\")", "Hello Universe"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QString text = toText(args[0]);
        const QString search = toText(args[1]);
        if (search.isEmpty())
          return text;
        return text.replace(search, toText(args[2]));
      }));

  registry.add(define(
      "SPLIT", cat,
      "Splits a text into an array (into characters for an empty delimiter)",
      {param("text", kTextLike, "Text to split"),
       param("delimiter", ValueType::String, "Delimiter")},
      ValueType::Array, {{"SPLIT(\"a,b,c\", \",\")", "[\"a\",\"b\",\"c\"]"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QString text = toText(args[0]);
        const QString delimiter = args[1].toString();
        QVariantList out;
        if (delimiter.isEmpty()) {
          const QVector<uint> cps = text.toUcs4();
          for (int i = 0; i < cps.size(); ++i)
            out.append(fromCodePoints(cps, i, 1));
          return out;
        }
        for (const QString &part : text.split(delimiter))
          out.append(part);
        return out;
      }));

  registry.add(define(
      "JOIN", cat, "Joins the elements of an array with a delimiter",
      {param("array", ValueType::Array, "Array to join"),
       optionalParam("delimiter", ValueType::String, "Delimiter",
                     QStringLiteral(","))},
      ValueType::String, {{"JOIN([\"a\", \"b\", \"c\"], \"-\")", "a-b-c"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        QStringList parts;
        for (const QVariant &v : toList(args[0]))
          parts.append(toText(v));
        return parts.join(args[1].toString());
      }));

  registry.add(define(
      "PROPER", cat,
      "Capitalises the first letter of every word and lower-cases the rest",
      {param("text", kTextLike, "Text")}, ValueType::String,
      {{"PROPER(\"hello wORLD\")", "Hello World"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QString text = toText(args[0]);
        QString out;
        out.reserve(text.size());
        bool wordStart = true;
        for (const QChar ch : text) {
          if (ch.isLetterOrNumber()) {
            out += wordStart ? ch.toUpper() : ch.toLower();
            wordStart = false;
          } else {
            out += ch;
            wordStart = !ch.isMark();
          }
        }
        return out;
      }));

  registry.add(define(
      "TEXT", cat,
      "Formats a number (\"#,##0.00\", \"0.0\") or a date (\"YYYY-MM-DD HH:mm:ss\")",
      {param("value", ValueType::Any, "Value to format"),
       param("format", ValueType::String, "Format pattern")},
      ValueType::String,
      {{"TEXT(1234.5, \"#,##0.00\")", "1,234.50"},
       {"TEXT(DATE(2024, 1, 15), \"YYYY-MM-DD\")", "2024-01-15"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *) -> QVariant {
        const QString format = args[1].toString();
        switch (typeOf(args[0])) {
        case ValueType::Number:
          return formatNumber(args[0].toDouble(), format);
        case ValueType::Date:
          return formatDate(toDateTime(args[0]), format);
        default:
          return toText(args[0]);
        }
      }));
}

} // namespace Builtins
} // namespace Formula
