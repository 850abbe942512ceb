#include "services/FormulaRunner.h"
#include <QDebug>

QString RunnerStats::toString() const {
    return QString("Pooled: %1, Pooling: %2")
        .arg(pooledFormulaCount)
        .arg(poolingEnabled ? "Enabled" : "Disabled");
}

FormulaRunner::FormulaRunner(FormulaLoader *loader, QObject *parent)
    : QObject(parent)
    , m_loader(loader) {}

FormulaPtr FormulaRunner::lookup(const QString &formulaId) {
    FormulaPtr f = m_loader->formula(formulaId);
    if (!f) {
        QString msg = QString("Formula '%1' not found").arg(formulaId);
        qWarning().noquote() << "[FormulaRunner]" << msg;
        emit errorOccurred(msg);
    }
    return f;
}

void FormulaRunner::reportEvalError(const QString &formulaId,
                                    const EvalError &error) {
    QString msg = QString("Error evaluating formula '%1': %2")
                      .arg(formulaId, error.message);
    qWarning().noquote() << "[FormulaRunner]" << msg;
    emit errorOccurred(msg);
}

// ═══════════════════════════════════════════════════════════════════
// EVALUATION
// ═══════════════════════════════════════════════════════════════════

double FormulaRunner::evaluate(const QString &formulaId,
                               const FormulaBindings &inputs) {
    FormulaPtr f = lookup(formulaId);
    if (!f)
        return 0.0;

    EvalError err;
    double value = f->evaluate(inputs, &err);
    if (err.isError()) {
        reportEvalError(formulaId, err);
        return 0.0;
    }
    return value;
}

double FormulaRunner::evaluate(const QString &formulaId,
                               const FormulaInputPairs &inputs) {
    FormulaPtr f = lookup(formulaId);
    if (!f)
        return 0.0;

    FormulaBindings scratch;
    FormulaBindings *bindings = &scratch;

    if (m_useInputPooling) {
        // Reset the pooled map; it may still hold locals from the last call
        bindings = &m_inputPools[formulaId];
        bindings->clear();
        for (const QString &name : f->requiredInputs())
            bindings->insert(name, 0.0);
    } else {
        scratch.reserve(inputs.size());
    }

    for (const auto &pair : inputs)
        bindings->insert(pair.first, pair.second);

    EvalError err;
    double value = f->evaluateInPlace(*bindings, &err);
    if (err.isError()) {
        reportEvalError(formulaId, err);
        return 0.0;
    }
    return value;
}

QVector<double> FormulaRunner::evaluateBatch(
    const QString &formulaId, const QVector<FormulaBindings> &batchInputs) {
    QVector<double> results(batchInputs.size(), 0.0);

    FormulaPtr f = lookup(formulaId);
    if (!f)
        return results;

    for (int i = 0; i < batchInputs.size(); ++i) {
        EvalError err;
        double value = f->evaluate(batchInputs[i], &err);
        if (err.isError()) {
            QString msg = QString("Error in batch evaluation of '%1' at index %2: %3")
                              .arg(formulaId)
                              .arg(i)
                              .arg(err.message);
            qWarning().noquote() << "[FormulaRunner]" << msg;
            emit errorOccurred(msg);
            break;
        }
        results[i] = value;
    }
    return results;
}

QHash<QString, double> FormulaRunner::evaluateMultiple(
    const QStringList &formulaIds, const FormulaBindings &inputs) {
    QHash<QString, double> results;
    for (const QString &id : formulaIds)
        results.insert(id, evaluate(id, inputs));
    return results;
}

bool FormulaRunner::tryEvaluate(const QString &formulaId,
                                const FormulaBindings &inputs,
                                double *result) {
    if (result)
        *result = 0.0;

    FormulaPtr f = m_loader->formula(formulaId);
    if (!f)
        return false;

    EvalError err;
    double value = f->evaluate(inputs, &err);
    if (err.isError())
        return false;

    if (result)
        *result = value;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// POOLS
// ═══════════════════════════════════════════════════════════════════

void FormulaRunner::prepareFormula(const QString &formulaId) {
    FormulaPtr f = m_loader->formula(formulaId);
    if (!f) {
        QString msg = QString("Cannot prepare formula '%1' - not found").arg(formulaId);
        qWarning().noquote() << "[FormulaRunner]" << msg;
        emit errorOccurred(msg);
        return;
    }

    if (m_inputPools.contains(formulaId))
        return;

    FormulaBindings pooled;
    for (const QString &name : f->requiredInputs())
        pooled.insert(name, 0.0);
    m_inputPools.insert(formulaId, pooled);
}

void FormulaRunner::clearPools() { m_inputPools.clear(); }

RunnerStats FormulaRunner::stats() const {
    RunnerStats s;
    s.pooledFormulaCount = m_inputPools.size();
    s.poolingEnabled = m_useInputPooling;
    return s;
}
