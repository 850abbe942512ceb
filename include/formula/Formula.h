#ifndef FORMULA_H
#define FORMULA_H

#include "formula/EvalContext.h"
#include "formula/FormulaNodes.h"
#include <QSet>
#include <QString>
#include <memory>

/**
 * @brief A compiled formula: source text, AST root and required inputs.
 *
 * Built only by FormulaParser and immutable afterwards, so one instance can
 * be evaluated any number of times, from any thread, as long as each call
 * uses its own bindings.
 *
 *   FormulaParser parser;
 *   ParseError perr;
 *   FormulaPtr f = parser.parse("let temp = x * 2; temp + y", &perr);
 *   // f->requiredInputs() == {"x", "y"}
 *
 *   EvalError eerr;
 *   double v = f->evaluate({{"x", 2}, {"y", 3}}, &eerr);   // 7
 */
class Formula {
public:
    Formula(QString source, FormulaNodePtr root, QSet<QString> requiredInputs);

    Formula(const Formula &) = delete;
    Formula &operator=(const Formula &) = delete;

    const QString &source() const { return m_source; }

    // Identifiers the caller must bind; locals (let / assignment) excluded
    const QSet<QString> &requiredInputs() const { return m_requiredInputs; }

    // ── Evaluate ──
    // Runs on a private copy of inputs. Returns 0 and fills *error when the
    // evaluation fails. random, when given, replaces the provider bound at
    // parse time for this call only.
    double evaluate(const FormulaBindings &inputs,
                    EvalError *error = nullptr,
                    RandomProvider *random = nullptr) const;

    // Same, but reads and writes bindings directly; locals stay in the map
    double evaluateInPlace(FormulaBindings &bindings,
                           EvalError *error = nullptr,
                           RandomProvider *random = nullptr) const;

private:
    const QString        m_source;
    const FormulaNodePtr m_root;
    const QSet<QString>  m_requiredInputs;
};

using FormulaPtr = std::shared_ptr<const Formula>;

#endif // FORMULA_H
