/**
 * @file DateFunctions.cpp
 * @brief date category
 *
 * Dates are local-time QDateTime values. Every date parameter also accepts
 * an ISO-8601 string ("2024-03-15" or "2024-03-15T10:30:00").
 */

#include "BuiltinFunctions.h"
#include <cmath>

namespace Formula {
namespace Builtins {

bool dateArg(const QVariant &value, QDateTime &out, QString *error) {
  bool ok = false;
  out = toDateTime(value, &ok);
  if (!ok) {
    if (typeOf(value) == ValueType::String)
      *error = QString("'%1' is not a valid date").arg(value.toString());
    else
      *error = QStringLiteral("invalid date");
  }
  return ok;
}

namespace {

const ValueTypes kDateLike = ValueType::Date | ValueType::String;

enum class DateUnit { Invalid, Years, Months, Weeks, Days, Hours, Minutes, Seconds };

DateUnit parseUnit(const QString &text) {
  QString u = text.trimmed().toLower();
  if (u.endsWith(QLatin1Char('s')))
    u.chop(1);
  if (u == QLatin1String("year"))
    return DateUnit::Years;
  if (u == QLatin1String("month"))
    return DateUnit::Months;
  if (u == QLatin1String("week"))
    return DateUnit::Weeks;
  if (u == QLatin1String("day"))
    return DateUnit::Days;
  if (u == QLatin1String("hour"))
    return DateUnit::Hours;
  if (u == QLatin1String("minute"))
    return DateUnit::Minutes;
  if (u == QLatin1String("second"))
    return DateUnit::Seconds;
  return DateUnit::Invalid;
}

const double kMaxYears = 10000;
const double kMaxDays = 3650000;
const double kDayMs = 24.0 * 3600 * 1000;

qint64 unitMs(DateUnit unit) {
  switch (unit) {
  case DateUnit::Weeks:
    return 7LL * 24 * 3600 * 1000;
  case DateUnit::Days:
    return 24LL * 3600 * 1000;
  case DateUnit::Hours:
    return 3600LL * 1000;
  case DateUnit::Minutes:
    return 60LL * 1000;
  case DateUnit::Seconds:
    return 1000;
  default:
    return 0;
  }
}

// Whole calendar months from a to b, truncated toward zero
int monthsBetween(const QDateTime &a, const QDateTime &b) {
  int months = (b.date().year() - a.date().year()) * 12 +
               (b.date().month() - a.date().month());
  const QDateTime shifted = a.addMonths(months);
  if (months > 0 && shifted > b)
    --months;
  else if (months < 0 && shifted < b)
    ++months;
  return months;
}

// Whole calendar days from a to b, truncated toward zero. Counts dates
// rather than elapsed time so a daylight-saving shift does not lose a day.
qint64 wholeDaysBetween(const QDateTime &a, const QDateTime &b) {
  qint64 days = a.date().daysTo(b.date());
  if (days > 0 && b.time() < a.time())
    --days;
  else if (days < 0 && b.time() > a.time())
    ++days;
  return days;
}

using DatePart = int (*)(const QDateTime &);

FunctionImpl datePart(DatePart part) {
  return [part](const QVariantList &args, const EvaluationContext &,
                QString *error) -> QVariant {
    QDateTime dt;
    if (!dateArg(args[0], dt, error))
      return QVariant();
    return static_cast<double>(part(dt));
  };
}

} // namespace

void registerDateFunctions(FunctionRegistry &registry) {
  const QString cat = QStringLiteral("date");
  const QVector<FunctionParameter> dateParam = {
      param("date", kDateLike, "Date or ISO-8601 text")};

  registry.add(define(
      "NOW", cat, "Current date and time", {}, ValueType::Date,
      {{"NOW()", "2024-01-15T10:30:00.000"}},
      [](const QVariantList &, const EvaluationContext &,
         QString *) -> QVariant { return QDateTime::currentDateTime(); }));

  registry.add(define(
      "TODAY", cat, "Current date at midnight", {}, ValueType::Date,
      {{"TODAY()", "2024-01-15T00:00:00.000"}},
      [](const QVariantList &, const EvaluationContext &,
         QString *) -> QVariant {
        return QDateTime(QDate::currentDate(), QTime(0, 0));
      }));

  registry.add(define(
      "DATE", cat,
      "Builds a date; months and days beyond their range roll over",
      {param("year", ValueType::Number, "Year"),
       param("month", ValueType::Number, "Month (1-12)"),
       param("day", ValueType::Number, "Day of month")},
      ValueType::Date,
      {{"DATE(2024, 3, 15)", "2024-03-15T00:00:00.000"},
       {"DATE(2024, 13, 1)", "2025-01-01T00:00:00.000"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        qint64 y = 0, m = 0, d = 0;
        if (!wholeNumberArg(args[0].toDouble(), -9999, 9999,
                            QStringLiteral("year"), y, error) ||
            !wholeNumberArg(args[1].toDouble(), -120000, 120000,
                            QStringLiteral("month"), m, error) ||
            !wholeNumberArg(args[2].toDouble(), -3650000, 3650000,
                            QStringLiteral("day"), d, error))
          return QVariant();
        const QDate date = QDate(static_cast<int>(y), 1, 1)
                               .addMonths(static_cast<int>(m) - 1)
                               .addDays(d - 1);
        if (!date.isValid()) {
          *error = QStringLiteral("invalid date");
          return QVariant();
        }
        return QDateTime(date, QTime(0, 0));
      }));

  registry.add(define("YEAR", cat, "Year of a date", dateParam,
                      ValueType::Number, {{"YEAR(DATE(2024, 3, 15))", "2024"}},
                      datePart([](const QDateTime &dt) {
                        return dt.date().year();
                      })));

  registry.add(define("MONTH", cat, "Month of a date (1-12)", dateParam,
                      ValueType::Number, {{"MONTH(DATE(2024, 3, 15))", "3"}},
                      datePart([](const QDateTime &dt) {
                        return dt.date().month();
                      })));

  registry.add(define("DAY", cat, "Day of month of a date", dateParam,
                      ValueType::Number, {{"DAY(\"2024-03-15\")", "15"}},
                      datePart([](const QDateTime &dt) {
                        return dt.date().day();
                      })));

  registry.add(define("WEEKDAY", cat, "Day of week (1 = Sunday, 7 = Saturday)",
                      dateParam, ValueType::Number,
                      {{"WEEKDAY(DATE(2024, 3, 17))", "1"}},
                      datePart([](const QDateTime &dt) {
                        return dt.date().dayOfWeek() % 7 + 1;
                      })));

  registry.add(define("HOUR", cat, "Hour of a date-time (0-23)", dateParam,
                      ValueType::Number,
                      {{"HOUR(\"2024-03-15T10:30:00\")", "10"}},
                      datePart([](const QDateTime &dt) {
                        return dt.time().hour();
                      })));

  registry.add(define("MINUTE", cat, "Minute of a date-time (0-59)", dateParam,
                      ValueType::Number,
                      {{"MINUTE(\"2024-03-15T10:30:00\")", "30"}},
                      datePart([](const QDateTime &dt) {
                        return dt.time().minute();
                      })));

  registry.add(define(
      "DATEADD", cat,
      "Adds an amount of years, months, weeks, days, hours, minutes or "
      "seconds to a date",
      {param("date", kDateLike, "Start date"),
       param("amount", ValueType::Number, "Amount to add (may be negative)"),
       param("unit", ValueType::String, "Unit name, singular or plural")},
      ValueType::Date,
      {{"DATEADD(DATE(2024, 1, 31), 1, \"months\")", "2024-02-29T00:00:00.000"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QDateTime dt;
        if (!dateArg(args[0], dt, error))
          return QVariant();
        const double amount = args[1].toDouble();
        const DateUnit unit = parseUnit(args[2].toString());
        const QString what = QStringLiteral("amount");
        qint64 whole = 0;
        QDateTime shifted;
        switch (unit) {
        case DateUnit::Years:
          if (!wholeNumberArg(amount, -kMaxYears, kMaxYears, what, whole, error))
            return QVariant();
          shifted = dt.addYears(static_cast<int>(whole));
          break;
        case DateUnit::Months:
          if (!wholeNumberArg(amount, -kMaxYears * 12, kMaxYears * 12, what,
                              whole, error))
            return QVariant();
          shifted = dt.addMonths(static_cast<int>(whole));
          break;
        case DateUnit::Weeks:
        case DateUnit::Days:
          // Whole days follow the calendar across daylight-saving changes
          if (amount == std::trunc(amount)) {
            const double days = unit == DateUnit::Weeks ? amount * 7 : amount;
            if (!wholeNumberArg(days, -kMaxDays, kMaxDays, what, whole, error))
              return QVariant();
            shifted = dt.addDays(whole);
            break;
          }
          Q_FALLTHROUGH();
        case DateUnit::Hours:
        case DateUnit::Minutes:
        case DateUnit::Seconds:
          if (!wholeNumberArg(amount * static_cast<double>(unitMs(unit)),
                              -kMaxDays * kDayMs, kMaxDays * kDayMs, what, whole,
                              error))
            return QVariant();
          shifted = dt.addMSecs(whole);
          break;
        case DateUnit::Invalid:
          *error = QString("unknown unit '%1'").arg(args[2].toString());
          return QVariant();
        }
        if (!shifted.isValid()) {
          *error = QStringLiteral("date out of range");
          return QVariant();
        }
        return shifted;
      }));

  registry.add(define(
      "DATEDIFF", cat,
      "Whole units between two dates (negative when end is before start)",
      {param("start", kDateLike, "Start date"),
       param("end", kDateLike, "End date"),
       optionalParam("unit", ValueType::String, "Unit name",
                     QStringLiteral("days"))},
      ValueType::Number,
      {{"DATEDIFF(\"2024-01-01\", \"2024-01-31\")", "30"},
       {"DATEDIFF(DATE(2024, 1, 15), DATE(2024, 4, 10), \"months\")", "2"}},
      [](const QVariantList &args, const EvaluationContext &,
         QString *error) -> QVariant {
        QDateTime start, end;
        if (!dateArg(args[0], start, error) || !dateArg(args[1], end, error))
          return QVariant();
        const DateUnit unit = parseUnit(args[2].toString());
        switch (unit) {
        case DateUnit::Years:
          return static_cast<double>(monthsBetween(start, end) / 12);
        case DateUnit::Months:
          return static_cast<double>(monthsBetween(start, end));
        case DateUnit::Invalid:
          *error = QString("unknown unit '%1'").arg(args[2].toString());
          return QVariant();
        default:
          break;
        }
        if (unit == DateUnit::Days || unit == DateUnit::Weeks) {
          const qint64 days = wholeDaysBetween(start, end);
          return static_cast<double>(unit == DateUnit::Weeks ? days / 7 : days);
        }
        const double diff =
            static_cast<double>(end.toMSecsSinceEpoch() - start.toMSecsSinceEpoch());
        return std::trunc(diff / unitMs(unit));
      }));
}

} // namespace Builtins
} // namespace Formula
