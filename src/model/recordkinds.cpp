#include "recordkinds.h"

#include <QUuid>

namespace LedgerSync {
namespace Records {

const QString Expense = "Expense";
const QString Category = "Category";
const QString SharedBudget = "SharedBudget";
const QString ExpenseTemplate = "ExpenseTemplate";
const QString RecurringExpense = "RecurringExpense";

QStringList allKinds()
{
    return {Expense, Category, SharedBudget, ExpenseTemplate, RecurringExpense};
}

QStringList minimalKinds()
{
    return {Expense, Category};
}

QString newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString dateValue(const QDateTime &date)
{
    return date.toUTC().toString(Qt::ISODateWithMs);
}

SyncRecord makeExpense(const QString &id,
                       double amount,
                       const QDateTime &date,
                       const QString &notes,
                       const QString &categoryId)
{
    SyncRecord record(Expense, id);
    record.setField("amount", amount);
    record.setField("date", dateValue(date));
    if (!notes.isEmpty()) {
        record.setField("notes", notes);
    }
    if (!categoryId.isEmpty()) {
        record.setField("categoryId", categoryId);
    }
    return record;
}

SyncRecord makeCategory(const QString &id,
                        const QString &name,
                        const QString &icon,
                        double budget,
                        const QString &color)
{
    SyncRecord record(Category, id);
    record.setField("name", name);
    record.setField("icon", icon);
    record.setField("budget", budget);
    record.setField("color", color);
    return record;
}

SyncRecord makeSharedBudget(const QString &id,
                            const QString &name,
                            const QString &createdBy,
                            double budgetAmount,
                            const QDateTime &startDate,
                            const QString &periodType)
{
    SyncRecord record(SharedBudget, id);
    record.setField("name", name);
    record.setField("createdBy", createdBy);
    record.setField("budgetAmount", budgetAmount);
    record.setField("startDate", dateValue(startDate));
    record.setField("periodType", periodType);
    record.setField("isActive", true);
    record.addMember(createdBy);
    return record;
}

QList<SyncRecord> defaultCategories()
{
    struct Seed { const char *name; const char *icon; double budget; const char *color; };
    static const Seed seeds[] = {
        {"Food",          "fork.knife", 500,  "#FF6B6B"},
        {"Bills",         "doc.text",   1000, "#4ECDC4"},
        {"Shopping",      "cart",       300,  "#45B7D1"},
        {"Transport",     "car",        200,  "#96CEB4"},
        {"Entertainment", "film",       150,  "#FFEEAD"},
    };

    QList<SyncRecord> categories;
    for (const Seed &seed : seeds) {
        QString name = QString::fromLatin1(seed.name);
        SyncRecord record = makeCategory("default-" + name.toLower(), name,
                                         QString::fromLatin1(seed.icon), seed.budget,
                                         QString::fromLatin1(seed.color));
        record.modifiedMarker = 1;
        categories.append(record);
    }
    return categories;
}

} // namespace Records
} // namespace LedgerSync
