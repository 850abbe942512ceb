#include "formula/FormulaNodes.h"
#include <QHash>
#include <algorithm>
#include <climits>
#include <cmath>

namespace {

inline double truth(bool value) { return value ? 1.0 : 0.0; }

inline double clamp01(double x) { return std::max(0.0, std::min(x, 1.0)); }

inline RandomProvider *activeProvider(const EvalContext &ctx,
                                      const RandomProviderPtr &bound) {
  return ctx.randomOverride() ? ctx.randomOverride() : bound.get();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// LEAVES
// ═══════════════════════════════════════════════════════════════════

double ConstantNode::evaluate(EvalContext &) const { return m_value; }

double VariableNode::evaluate(EvalContext &ctx) const {
  double value = 0.0;
  if (ctx.lookup(m_name, &value))
    return value;
  ctx.fail(EvalError::missingVariable(m_name));
  return 0.0;
}

double EmptyNode::evaluate(EvalContext &) const { return 0.0; }

// ═══════════════════════════════════════════════════════════════════
// UNARY
// ═══════════════════════════════════════════════════════════════════

bool UnaryOpNode::functionOp(const QString &name, Op *op) {
  static const QHash<QString, Op> kFunctions = {
      {"sqrt", Sqrt},   {"abs", Abs},         {"floor", Floor},
      {"ceil", Ceil},   {"round", Round},     {"sin", Sin},
      {"cos", Cos},     {"tan", Tan},         {"log", Log},
      {"exp", Exp},     {"clamp01", Clamp01}, {"sign", Sign},
      {"negative", Negate}, {"acos", Acos},   {"asin", Asin},
      {"atan", Atan}};

  auto it = kFunctions.constFind(name);
  if (it == kFunctions.constEnd())
    return false;
  if (op)
    *op = it.value();
  return true;
}

double UnaryOpNode::apply(Op op, double x) {
  switch (op) {
  case Negate:
    return -x;
  case Sqrt:
    return std::sqrt(x);
  case Abs:
    return std::abs(x);
  case Floor:
    return std::floor(x);
  case Ceil:
    return std::ceil(x);
  case Round:
    // Halfway cases go to the even neighbour (default FE_TONEAREST)
    return std::nearbyint(x);
  case Sin:
    return std::sin(x);
  case Cos:
    return std::cos(x);
  case Tan:
    return std::tan(x);
  case Asin:
    return std::asin(x);
  case Acos:
    return std::acos(x);
  case Atan:
    return std::atan(x);
  case Log:
    return std::log(x);
  case Exp:
    return std::exp(x);
  case Clamp01:
    return clamp01(x);
  case Sign:
    return x >= 0.0 ? 1.0 : -1.0;
  }
  return x;
}

double UnaryOpNode::evaluate(EvalContext &ctx) const {
  double x = m_operand->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  return apply(m_op, x);
}

// ═══════════════════════════════════════════════════════════════════
// BINARY
// ═══════════════════════════════════════════════════════════════════

double BinaryOpNode::evaluate(EvalContext &ctx) const {
  double l = m_left->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  double r = m_right->evaluate(ctx);
  if (ctx.failed())
    return 0.0;

  // Division by zero is left to IEEE semantics (±inf / NaN)
  switch (m_op) {
  case Add:
    return l + r;
  case Subtract:
    return l - r;
  case Multiply:
    return l * r;
  case Divide:
    return l / r;
  case Power:
    return std::pow(l, r);
  }
  return 0.0;
}

double ModuloNode::evaluate(EvalContext &ctx) const {
  double l = m_left->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  double r = m_right->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  return std::fmod(l, r);
}

double ComparisonNode::evaluate(EvalContext &ctx) const {
  double l = m_left->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  double r = m_right->evaluate(ctx);
  if (ctx.failed())
    return 0.0;

  switch (m_op) {
  case Less:
    return truth(l < r);
  case Greater:
    return truth(l > r);
  case LessEqual:
    return truth(l <= r);
  case GreaterEqual:
    return truth(l >= r);
  case Equal:
    return truth(std::abs(l - r) < kEqualityEpsilon);
  case NotEqual:
    return truth(std::abs(l - r) >= kEqualityEpsilon);
  }
  return 0.0;
}

// ═══════════════════════════════════════════════════════════════════
// LOGICAL
// ═══════════════════════════════════════════════════════════════════

double LogicalNode::evaluate(EvalContext &ctx) const {
  double l = m_left->evaluate(ctx);
  if (ctx.failed())
    return 0.0;

  // Right side is not evaluated (nor its assignments applied) when the
  // left side already decides the result
  if (m_op == And && l == 0.0)
    return 0.0;
  if (m_op == Or && l != 0.0)
    return 1.0;

  double r = m_right->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  return truth(r != 0.0);
}

double LogicalNotNode::evaluate(EvalContext &ctx) const {
  double x = m_operand->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  return truth(x == 0.0);
}

// ═══════════════════════════════════════════════════════════════════
// CONTROL FLOW
// ═══════════════════════════════════════════════════════════════════

double TernaryNode::evaluate(EvalContext &ctx) const {
  double cond = m_condition->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  return cond != 0.0 ? m_trueValue->evaluate(ctx)
                     : m_falseValue->evaluate(ctx);
}

double ConditionalNode::evaluate(EvalContext &ctx) const {
  double cond = m_condition->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  if (cond != 0.0)
    return m_thenBranch->evaluate(ctx);
  if (m_elseBranch)
    return m_elseBranch->evaluate(ctx);
  return 0.0;
}

double SequenceNode::evaluate(EvalContext &ctx) const {
  double result = 0.0;
  for (const auto &statement : m_statements) {
    result = statement->evaluate(ctx);
    if (ctx.failed())
      return 0.0;
  }
  return result;
}

// ═══════════════════════════════════════════════════════════════════
// DECLARATION / ASSIGNMENT
// ═══════════════════════════════════════════════════════════════════

double DeclarationNode::evaluate(EvalContext &ctx) const {
  double value = 0.0;
  if (m_initialValue) {
    value = m_initialValue->evaluate(ctx);
    if (ctx.failed())
      return 0.0;
  }
  ctx.assign(m_name, value);
  return value;
}

double AssignmentNode::evaluate(EvalContext &ctx) const {
  double value = m_value->evaluate(ctx);
  if (ctx.failed())
    return 0.0;

  if (m_op != Assign) {
    double current = ctx.valueOr(m_name, 0.0);
    switch (m_op) {
    case AddAssign:
      value = current + value;
      break;
    case SubAssign:
      value = current - value;
      break;
    case MulAssign:
      value = current * value;
      break;
    case DivAssign:
      value = current / value;
      break;
    case Assign:
      break;
    }
  }

  ctx.assign(m_name, value);
  return value;
}

// ═══════════════════════════════════════════════════════════════════
// MULTI-ARGUMENT FUNCTIONS
// ═══════════════════════════════════════════════════════════════════

bool FunctionNode::lookup(const QString &name, Function *function) {
  static const QHash<QString, Function> kFunctions = {
      {"min", Min}, {"max", Max}, {"clamp", Clamp}, {"lerp", Lerp},
      {"pow", Pow}};

  auto it = kFunctions.constFind(name);
  if (it == kFunctions.constEnd())
    return false;
  if (function)
    *function = it.value();
  return true;
}

int FunctionNode::minimumArity(Function function) {
  switch (function) {
  case Min:
  case Max:
  case Pow:
    return 2;
  case Clamp:
  case Lerp:
    return 3;
  }
  return 0;
}

double FunctionNode::evaluate(EvalContext &ctx) const {
  std::vector<double> args;
  args.reserve(m_arguments.size());
  for (const auto &argument : m_arguments) {
    args.push_back(argument->evaluate(ctx));
    if (ctx.failed())
      return 0.0;
  }

  if (args.empty())
    return 0.0;
  if (static_cast<int>(args.size()) < minimumArity(m_function))
    return args[0];

  switch (m_function) {
  case Min:
    return std::min(args[0], args[1]);
  case Max:
    return std::max(args[0], args[1]);
  case Pow:
    return std::pow(args[0], args[1]);
  case Clamp:
    if (args[0] < args[1])
      return args[1];
    if (args[0] > args[2])
      return args[2];
    return args[0];
  case Lerp:
    return args[0] + (args[1] - args[0]) * clamp01(args[2]);
  }
  return args[0];
}

// ═══════════════════════════════════════════════════════════════════
// RANDOM INTRINSICS
// ═══════════════════════════════════════════════════════════════════

double RandomValueNode::evaluate(EvalContext &ctx) const {
  return activeProvider(ctx, m_provider)->uniform01();
}

double RandomIntNode::evaluate(EvalContext &ctx) const {
  double maxValue = m_maxValue->evaluate(ctx);
  if (ctx.failed())
    return 0.0;

  // !(x >= 1) also catches NaN
  if (!(maxValue >= 1.0))
    return 0.0;
  int max = maxValue >= static_cast<double>(INT_MAX)
                ? INT_MAX
                : static_cast<int>(maxValue);
  return activeProvider(ctx, m_provider)->uniformIntBelow(max);
}

double RandomFloatNode::evaluate(EvalContext &ctx) const {
  double maxValue = m_maxValue->evaluate(ctx);
  if (ctx.failed())
    return 0.0;
  if (!(maxValue > 0.0))
    return 0.0;
  return activeProvider(ctx, m_provider)->uniformBelow(maxValue);
}
