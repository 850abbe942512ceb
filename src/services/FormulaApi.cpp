#include "services/FormulaApi.h"
#include "services/FormulaLoader.h"
#include <QCryptographicHash>
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>

namespace {

struct ApiCache {
    QMutex        mutex;
    FormulaLoader loader;
};

ApiCache &cache() {
    static ApiCache s_cache;
    return s_cache;
}

double failWith(const QString &message, bool *ok, QString *errorMsg) {
    qWarning().noquote() << "[FormulaApi]" << message;
    if (ok)
        *ok = false;
    if (errorMsg)
        *errorMsg = message;
    return 0.0;
}

// Returns the compiled formula for expression, registering it under cacheId
// (or the expression hash) when missing or stale.
FormulaPtr ensureFormula(const QString &expression, const QString &cacheId,
                         QString *errorMsg) {
    QString formulaId = cacheId.trimmed().isEmpty()
                            ? FormulaApi::cacheIdFor(expression)
                            : cacheId;

    ApiCache &c = cache();
    QMutexLocker locker(&c.mutex);

    FormulaPtr f = c.loader.formula(formulaId);
    if (f && f->source() == expression)
        return f;

    ParseError err;
    if (!c.loader.registerFormula(formulaId, expression, &err)) {
        if (errorMsg)
            *errorMsg = QString("Failed to register formula '%1': %2")
                            .arg(expression, err.toString());
        return nullptr;
    }
    return c.loader.formula(formulaId);
}

double evaluateCached(const QString &expression, const FormulaBindings &inputs,
                      const QString &cacheId, bool *ok, QString *errorMsg) {
    if (expression.trimmed().isEmpty())
        return failWith("Expression cannot be null or empty.", ok, errorMsg);

    QString registerError;
    FormulaPtr f = ensureFormula(expression, cacheId, &registerError);
    if (!f)
        return failWith(registerError, ok, errorMsg);

    // Outside the lock; Formula::evaluate works on its own copy of inputs
    EvalError err;
    double value = f->evaluate(inputs, &err);
    if (err.isError())
        return failWith(err.message, ok, errorMsg);

    if (ok)
        *ok = true;
    return value;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// REQUEST BUILDER
// ═══════════════════════════════════════════════════════════════════

FormulaApi::FormulaRequest &FormulaApi::FormulaRequest::set(const QString &key,
                                                            double value) {
    if (key.trimmed().isEmpty()) {
        if (m_error.isEmpty())
            m_error = "Input key cannot be null or empty.";
        return *this;
    }
    m_inputs.insert(key, value);
    return *this;
}

FormulaApi::FormulaRequest &
FormulaApi::FormulaRequest::withInputs(const FormulaBindings &inputs) {
    m_inputs = inputs;
    return *this;
}

double FormulaApi::FormulaRequest::evaluate(bool *ok, QString *errorMsg) const {
    if (!m_error.isEmpty())
        return failWith(m_error, ok, errorMsg);
    return evaluateCached(m_expression, m_inputs, QString(), ok, errorMsg);
}

double FormulaApi::FormulaRequest::withCache(const QString &cacheId, bool *ok,
                                             QString *errorMsg) const {
    if (!m_error.isEmpty())
        return failWith(m_error, ok, errorMsg);
    if (cacheId.trimmed().isEmpty())
        return failWith("Cache identifier cannot be null or empty.", ok,
                        errorMsg);
    return evaluateCached(m_expression, m_inputs, cacheId, ok, errorMsg);
}

// ═══════════════════════════════════════════════════════════════════
// STATIC API
// ═══════════════════════════════════════════════════════════════════

FormulaApi::FormulaRequest FormulaApi::request(const QString &expression) {
    return FormulaRequest(expression);
}

double FormulaApi::run(const QString &expression, const FormulaBindings &inputs,
                       const QString &cacheId, bool *ok, QString *errorMsg) {
    return evaluateCached(expression, inputs, cacheId, ok, errorMsg);
}

void FormulaApi::clearCache() {
    ApiCache &c = cache();
    QMutexLocker locker(&c.mutex);
    c.loader.clearAll();
}

QHash<QString, QString> FormulaApi::allFormulas() {
    ApiCache &c = cache();
    QMutexLocker locker(&c.mutex);

    QHash<QString, QString> formulas;
    for (const QString &id : c.loader.formulaIds())
        formulas.insert(id, c.loader.formulaExpression(id));
    return formulas;
}

QString FormulaApi::cacheIdFor(const QString &expression) {
    return QString::fromLatin1(
        QCryptographicHash::hash(expression.toUtf8(), QCryptographicHash::Sha256)
            .toHex());
}
