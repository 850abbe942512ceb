#ifndef FORMULA_LOADER_H
#define FORMULA_LOADER_H

#include "formula/Formula.h"
#include "formula/FormulaParser.h"
#include <QHash>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QVector>

// (id, expression) pair as stored in a formula library
struct FormulaDefinition {
    QString id;
    QString expression;

    FormulaDefinition() = default;
    FormulaDefinition(QString id_, QString expression_)
        : id(std::move(id_)), expression(std::move(expression_)) {}
};

/**
 * @brief Registry of compiled formulas keyed by id.
 *
 * Each expression is parsed once on registration; lookups hand out the
 * shared, immutable Formula. Not internally synchronized.
 *
 * Failed registrations leave any formula already stored under the id
 * untouched and are reported through errorOccurred().
 */
class FormulaLoader : public QObject {
    Q_OBJECT

public:
    explicit FormulaLoader(RandomProviderPtr randomProvider = nullptr,
                           QObject *parent = nullptr);

    // ── Registration ──
    // *error, when given, receives the parse failure
    bool registerFormula(const QString &id, const QString &expression,
                         ParseError *error = nullptr);
    int registerFormulas(const QVector<FormulaDefinition> &definitions);

    // ── Lookup ──
    FormulaPtr formula(const QString &id) const;   // nullptr when unknown
    bool hasFormula(const QString &id) const;
    QSet<QString> requiredInputs(const QString &id) const;
    QStringList formulaIds() const;                // sorted
    int formulaCount() const;
    QString formulaExpression(const QString &id) const; // null when unknown

    // ── Removal ──
    bool removeFormula(const QString &id);
    void clearAll();

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &message);

private:
    FormulaParser               m_parser;
    QHash<QString, FormulaPtr>  m_formulas;
};

#endif // FORMULA_LOADER_H
