#ifndef EVAL_CONTEXT_H
#define EVAL_CONTEXT_H

#include "formula/FormulaError.h"
#include <QHash>
#include <QString>

class RandomProvider;

// name → value map for one evaluation: caller inputs plus formula locals
using FormulaBindings = QHash<QString, double>;

/**
 * @brief Mutable state of a single formula evaluation.
 *
 * Wraps the binding map the tree walk reads and writes, records the first
 * failure, and optionally overrides the random provider bound at parse time.
 * One context per evaluate call; never shared between threads.
 */
class EvalContext {
public:
    explicit EvalContext(FormulaBindings &bindings,
                         RandomProvider *randomOverride = nullptr);

    // ── Bindings ──
    bool lookup(const QString &name, double *value) const;
    double valueOr(const QString &name, double defaultValue) const;
    void assign(const QString &name, double value);

    // ── Failure ──
    void fail(const EvalError &error);
    bool failed() const { return m_error.isError(); }
    const EvalError &error() const { return m_error; }

    // nullptr unless the caller substituted a provider for this evaluation
    RandomProvider *randomOverride() const { return m_randomOverride; }

private:
    FormulaBindings &m_bindings;
    RandomProvider  *m_randomOverride;
    EvalError        m_error;
};

#endif // EVAL_CONTEXT_H
