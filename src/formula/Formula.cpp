#include "formula/Formula.h"

Formula::Formula(QString source, FormulaNodePtr root,
                 QSet<QString> requiredInputs)
    : m_source(std::move(source)), m_root(std::move(root)),
      m_requiredInputs(std::move(requiredInputs)) {}

double Formula::evaluate(const FormulaBindings &inputs, EvalError *error,
                         RandomProvider *random) const {
  FormulaBindings local(inputs);
  return evaluateInPlace(local, error, random);
}

double Formula::evaluateInPlace(FormulaBindings &bindings, EvalError *error,
                                RandomProvider *random) const {
  EvalContext ctx(bindings, random);
  double result = m_root->evaluate(ctx);

  if (error)
    *error = ctx.error();
  return ctx.failed() ? 0.0 : result;
}
