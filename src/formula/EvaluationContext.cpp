#include "formula/EvaluationContext.h"
#include "formula/FormulaValue.h"
#include <QDebug>
#include <QJsonArray>

namespace Formula {

namespace {

QVariantMap mapFromJson(const QJsonObject &json, const QString &key) {
  const QJsonValue value = json.value(key);
  if (!value.isUndefined() && !value.isObject()) {
    qWarning() << "[EvaluationContext]" << key << "is not an object, skipped";
    return QVariantMap();
  }
  QVariantMap out;
  const QJsonObject obj = value.toObject();
  for (auto it = obj.begin(); it != obj.end(); ++it)
    out.insert(it.key(), fromJsonValue(it.value()));
  return out;
}

} // namespace

QVariant EvaluationContext::resolve(const QString &name) const {
  auto field = fields.constFind(name);
  if (field != fields.constEnd())
    return field.value();

  auto variable = variables.constFind(name);
  if (variable != variables.constEnd())
    return variable.value();
  if (name.startsWith(QLatin1Char('$'))) {
    variable = variables.constFind(name.mid(1));
    if (variable != variables.constEnd())
      return variable.value();
  }

  const QString lower = name.toLower();
  if (lower == QLatin1String("now") || lower == QLatin1String("today"))
    return system.value(lower);
  if (lower == QLatin1String("user"))
    return user.isEmpty() ? QVariant() : QVariant(user);
  if (lower == QLatin1String("system"))
    return system.isEmpty() ? QVariant() : QVariant(system);
  return QVariant();
}

void EvaluationContext::setSystemClock(const QDateTime &now) {
  system.insert(QStringLiteral("now"), now);
  system.insert(QStringLiteral("today"), QDateTime(now.date(), QTime(0, 0)));
}

bool EvaluationContext::isReservedName(const QString &name) {
  const QString lower = name.toLower();
  return lower == QLatin1String("now") || lower == QLatin1String("today") ||
         lower == QLatin1String("user") || lower == QLatin1String("system");
}

EvaluationContext EvaluationContext::fromJson(const QJsonObject &json) {
  EvaluationContext ctx;

  ctx.fields = mapFromJson(json, QStringLiteral("fields"));
  ctx.variables = mapFromJson(json, QStringLiteral("variables"));
  ctx.user = mapFromJson(json, QStringLiteral("user"));
  ctx.system = mapFromJson(json, QStringLiteral("system"));

  for (const QString key : {QStringLiteral("now"), QStringLiteral("today")}) {
    if (typeOf(ctx.system.value(key)) != ValueType::String)
      continue;
    bool ok = false;
    const QDateTime dt = toDateTime(ctx.system.value(key), &ok);
    if (ok)
      ctx.system.insert(key, dt);
    else
      qWarning() << "[EvaluationContext] system value" << key
                 << "is not a valid date";
  }

  const QJsonObject datasets =
      json.value(QStringLiteral("datasets")).toObject();
  for (auto it = datasets.begin(); it != datasets.end(); ++it) {
    if (!it.value().isArray()) {
      qWarning() << "[EvaluationContext] Dataset" << it.key()
                 << "is not an array, skipped";
      continue;
    }

    DatasetRows rows;
    const QJsonArray arr = it.value().toArray();
    for (const QJsonValue &row : arr) {
      if (!row.isObject()) {
        qWarning() << "[EvaluationContext] Non-object row in dataset"
                   << it.key() << "skipped";
        continue;
      }
      rows.append(fromJsonValue(row).toMap());
    }
    ctx.datasets.insert(it.key(), rows);
  }

  return ctx;
}

} // namespace Formula
