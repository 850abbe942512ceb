#ifndef FORMULA_RUNNER_H
#define FORMULA_RUNNER_H

#include "services/FormulaLoader.h"
#include <QHash>
#include <QObject>
#include <QPair>
#include <QStringList>
#include <QVector>

struct RunnerStats {
    int  pooledFormulaCount = 0;
    bool poolingEnabled = false;

    // "Pooled: N, Pooling: Enabled|Disabled"
    QString toString() const;
};

using FormulaInputPairs = QVector<QPair<QString, double>>;

/**
 * @brief Evaluates registered formulas by id.
 *
 * Map-style calls evaluate on a copy of the caller's bindings. Pair-style
 * calls can reuse one binding map per formula id (input pooling): the pool
 * is cleared, every required input is preset to 0, then the pairs are
 * applied. Not internally synchronized.
 *
 * Failures return 0 and emit errorOccurred(); tryEvaluate() reports through
 * its return value instead.
 */
class FormulaRunner : public QObject {
    Q_OBJECT

public:
    explicit FormulaRunner(FormulaLoader *loader, QObject *parent = nullptr);

    // ── Pooling ──
    bool useInputPooling() const { return m_useInputPooling; }
    void setUseInputPooling(bool enabled) { m_useInputPooling = enabled; }

    // ── Evaluation ──
    double evaluate(const QString &formulaId, const FormulaBindings &inputs);
    double evaluate(const QString &formulaId, const FormulaInputPairs &inputs);

    // Results in input order; stops at the first failure (rest stay 0)
    QVector<double> evaluateBatch(const QString &formulaId,
                                  const QVector<FormulaBindings> &batchInputs);

    QHash<QString, double> evaluateMultiple(const QStringList &formulaIds,
                                            const FormulaBindings &inputs);

    bool tryEvaluate(const QString &formulaId, const FormulaBindings &inputs,
                     double *result);

    // ── Pools ──
    void prepareFormula(const QString &formulaId);
    void clearPools();
    RunnerStats stats() const;

signals:
    void errorOccurred(const QString &message);

private:
    FormulaPtr lookup(const QString &formulaId);
    void reportEvalError(const QString &formulaId, const EvalError &error);

    FormulaLoader *m_loader;
    QHash<QString, FormulaBindings> m_inputPools;
    bool m_useInputPooling = true;
};

#endif // FORMULA_RUNNER_H
