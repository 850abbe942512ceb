#include "formula/EvalContext.h"

EvalContext::EvalContext(FormulaBindings &bindings,
                         RandomProvider *randomOverride)
    : m_bindings(bindings), m_randomOverride(randomOverride) {}

bool EvalContext::lookup(const QString &name, double *value) const {
  auto it = m_bindings.constFind(name);
  if (it == m_bindings.constEnd())
    return false;
  if (value)
    *value = it.value();
  return true;
}

double EvalContext::valueOr(const QString &name, double defaultValue) const {
  return m_bindings.value(name, defaultValue);
}

void EvalContext::assign(const QString &name, double value) {
  m_bindings.insert(name, value);
}

void EvalContext::fail(const EvalError &error) {
  // First failure wins; later nodes only unwind
  if (!m_error.isError())
    m_error = error;
}
