#ifndef FORMULA_API_H
#define FORMULA_API_H

#include "formula/EvalContext.h"
#include <QHash>
#include <QString>

/**
 * @brief Process-wide one-shot formula evaluation with a compile cache.
 *
 *   double hp = FormulaApi::request("base + level * 10")
 *                   .set("base", 100)
 *                   .set("level", 3)
 *                   .evaluate(&ok);                        // 130
 *
 *   double d = FormulaApi::run("a * b", {{"a", 2}, {"b", 4}}, "mul", &ok);
 *
 * Compiled formulas are cached under a caller-chosen id, or under the hex
 * SHA-256 of the expression when no id is given. A cached id whose
 * expression changed is recompiled. The cache is guarded by a mutex;
 * evaluation runs outside it on a private copy of the inputs, so all
 * functions are safe to call from any thread.
 *
 * Failures return 0 and set *ok = false and *errorMsg.
 */
class FormulaApi {
public:
    class FormulaRequest {
    public:
        // Empty keys are rejected when the request is evaluated
        FormulaRequest &set(const QString &key, double value);
        // Replaces all inputs set so far
        FormulaRequest &withInputs(const FormulaBindings &inputs);

        double evaluate(bool *ok = nullptr, QString *errorMsg = nullptr) const;
        double withCache(const QString &cacheId, bool *ok = nullptr,
                         QString *errorMsg = nullptr) const;

        const QString &expression() const { return m_expression; }
        const FormulaBindings &inputs() const { return m_inputs; }

    private:
        friend class FormulaApi;
        explicit FormulaRequest(QString expression)
            : m_expression(std::move(expression)) {}

        QString         m_expression;
        FormulaBindings m_inputs;
        QString         m_error;   // first builder error
    };

    static FormulaRequest request(const QString &expression);

    static double run(const QString &expression, const FormulaBindings &inputs,
                      const QString &cacheId = QString(), bool *ok = nullptr,
                      QString *errorMsg = nullptr);

    // Drops every cached formula
    static void clearCache();

    // cache id → expression
    static QHash<QString, QString> allFormulas();

    static QString cacheIdFor(const QString &expression);

private:
    FormulaApi() = delete;
};

#endif // FORMULA_API_H
