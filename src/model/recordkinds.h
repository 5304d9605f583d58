#ifndef RECORDKINDS_H
#define RECORDKINDS_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include "sync/syncrecord.h"

/**
 * @file recordkinds.h
 * @brief Expense tracker record kinds and helpers to build them
 *
 * The engine only sees SyncRecords; these helpers give the field names
 * the rest of the application agrees on.
 */

namespace LedgerSync {
namespace Records {

extern const QString Expense;
extern const QString Category;
extern const QString SharedBudget;
extern const QString ExpenseTemplate;
extern const QString RecurringExpense;

/**
 * @brief Every kind the application persists
 */
QStringList allKinds();

/**
 * @brief Kinds kept by the degraded in-memory store
 */
QStringList minimalKinds();

/**
 * @brief Generate a fresh record id
 */
QString newId();

/**
 * @brief Dates are stored as UTC ISO-8601 strings with milliseconds
 */
QString dateValue(const QDateTime &date);

SyncRecord makeExpense(const QString &id,
                       double amount,
                       const QDateTime &date,
                       const QString &notes = QString(),
                       const QString &categoryId = QString());

SyncRecord makeCategory(const QString &id,
                        const QString &name,
                        const QString &icon,
                        double budget = 0,
                        const QString &color = "#FF0000");

SyncRecord makeSharedBudget(const QString &id,
                            const QString &name,
                            const QString &createdBy,
                            double budgetAmount,
                            const QDateTime &startDate,
                            const QString &periodType = "monthly");

/**
 * @brief Categories seeded into an empty store
 *
 * Ids are derived from the names so devices that seed independently
 * produce the same records. Marker is 1 so any user edit wins.
 */
QList<SyncRecord> defaultCategories();

} // namespace Records
} // namespace LedgerSync

#endif // RECORDKINDS_H
