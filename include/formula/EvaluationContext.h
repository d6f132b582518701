#ifndef FORMULA_EVALUATION_CONTEXT_H
#define FORMULA_EVALUATION_CONTEXT_H

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

namespace Formula {

using DatasetRows = QVector<QVariantMap>;

/**
 * @brief Named values a formula can see while it is evaluated.
 *
 * An identifier resolves, in order, against `fields`, then `variables`
 * (`$rate` also finds a variable bound as `rate`), then the reserved names
 * `now`, `today`, `user` and `system` (case-insensitive). `datasets` are
 * reachable only through LOOKUP. The engine never modifies a context.
 */
struct EvaluationContext {
    QVariantMap fields;
    QVariantMap variables;
    QVariantMap user;      // id, email, name, roles, ...
    QVariantMap system;    // now, today, locale, ...
    QHash<QString, DatasetRows> datasets;

    EvaluationContext() = default;
    explicit EvaluationContext(const QVariantMap &fieldValues)
        : fields(fieldValues) {}

    // Value of an identifier, null when nothing matches
    QVariant resolve(const QString &name) const;

    // Stamps system.now and system.today (midnight of the same day)
    void setSystemClock(const QDateTime &now);

    // now, today, user or system in any letter case
    static bool isReservedName(const QString &name);

    bool hasDataset(const QString &name) const { return datasets.contains(name); }

    /**
     * Builds a context from
     *   { "fields": { ... }, "variables": { ... }, "user": { ... },
     *     "system": { "now": "2024-03-15T10:30:00", ... },
     *     "datasets": { "name": [ { ... }, ... ] } }
     * ISO-8601 text in system.now / system.today becomes a date.
     * Non-object dataset rows are skipped with a warning.
     */
    static EvaluationContext fromJson(const QJsonObject &json);
};

} // namespace Formula

#endif // FORMULA_EVALUATION_CONTEXT_H
