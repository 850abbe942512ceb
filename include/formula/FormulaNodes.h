#ifndef FORMULA_NODES_H
#define FORMULA_NODES_H

/**
 * @file FormulaNodes.h
 * @brief AST node model produced by FormulaParser
 *
 * Every node evaluates to a double against an EvalContext. A node owns its
 * children exclusively, so a parsed formula is always a tree.
 *
 * Truth convention: 0.0 is false, anything else is true. Nodes that produce
 * a boolean always return exactly 1.0 or 0.0.
 *
 * Failure convention: once ctx.failed() is set every node returns 0.0
 * immediately, so the first failure aborts the rest of the walk.
 */

#include "formula/EvalContext.h"
#include "formula/RandomProvider.h"
#include <QString>
#include <memory>
#include <vector>

class FormulaNode {
public:
    virtual ~FormulaNode() = default;
    virtual double evaluate(EvalContext &ctx) const = 0;
};

using FormulaNodePtr = std::unique_ptr<FormulaNode>;

// ═══════════════════════════════════════════════════════════════════
// LEAVES
// ═══════════════════════════════════════════════════════════════════

class ConstantNode final : public FormulaNode {
public:
    explicit ConstantNode(double value) : m_value(value) {}
    double evaluate(EvalContext &ctx) const override;

private:
    double m_value;
};

// Reads a binding; a missing name fails the evaluation
class VariableNode final : public FormulaNode {
public:
    explicit VariableNode(QString name) : m_name(std::move(name)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    QString m_name;
};

// Empty block "{ }"
class EmptyNode final : public FormulaNode {
public:
    double evaluate(EvalContext &ctx) const override;
};

// ═══════════════════════════════════════════════════════════════════
// OPERATORS
// ═══════════════════════════════════════════════════════════════════

// Negation and the single-argument math functions
class UnaryOpNode final : public FormulaNode {
public:
    enum Op {
        Negate,
        Sqrt, Abs, Floor, Ceil, Round,
        Sin, Cos, Tan, Asin, Acos, Atan,
        Log, Exp,
        Clamp01, Sign
    };

    UnaryOpNode(Op op, FormulaNodePtr operand)
        : m_op(op), m_operand(std::move(operand)) {}
    double evaluate(EvalContext &ctx) const override;

    // Maps a one-argument function name ("sqrt", "negative", ...) to its op
    static bool functionOp(const QString &name, Op *op);
    static double apply(Op op, double x);

private:
    Op             m_op;
    FormulaNodePtr m_operand;
};

class BinaryOpNode final : public FormulaNode {
public:
    enum Op { Add, Subtract, Multiply, Divide, Power };

    BinaryOpNode(Op op, FormulaNodePtr left, FormulaNodePtr right)
        : m_op(op), m_left(std::move(left)), m_right(std::move(right)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    Op             m_op;
    FormulaNodePtr m_left;
    FormulaNodePtr m_right;
};

// left % right with fmod semantics (result takes the dividend's sign)
class ModuloNode final : public FormulaNode {
public:
    ModuloNode(FormulaNodePtr left, FormulaNodePtr right)
        : m_left(std::move(left)), m_right(std::move(right)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr m_left;
    FormulaNodePtr m_right;
};

// == and != compare with an absolute tolerance of 1e-4
class ComparisonNode final : public FormulaNode {
public:
    enum Op { Less, Greater, LessEqual, GreaterEqual, Equal, NotEqual };

    static constexpr double kEqualityEpsilon = 1e-4;

    ComparisonNode(Op op, FormulaNodePtr left, FormulaNodePtr right)
        : m_op(op), m_left(std::move(left)), m_right(std::move(right)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    Op             m_op;
    FormulaNodePtr m_left;
    FormulaNodePtr m_right;
};

// && and ||, short-circuiting
class LogicalNode final : public FormulaNode {
public:
    enum Op { And, Or };

    LogicalNode(Op op, FormulaNodePtr left, FormulaNodePtr right)
        : m_op(op), m_left(std::move(left)), m_right(std::move(right)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    Op             m_op;
    FormulaNodePtr m_left;
    FormulaNodePtr m_right;
};

class LogicalNotNode final : public FormulaNode {
public:
    explicit LogicalNotNode(FormulaNodePtr operand)
        : m_operand(std::move(operand)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr m_operand;
};

// ═══════════════════════════════════════════════════════════════════
// CONTROL FLOW
// ═══════════════════════════════════════════════════════════════════

// cond ? trueValue : falseValue
class TernaryNode final : public FormulaNode {
public:
    TernaryNode(FormulaNodePtr condition, FormulaNodePtr trueValue,
                FormulaNodePtr falseValue)
        : m_condition(std::move(condition)),
          m_trueValue(std::move(trueValue)),
          m_falseValue(std::move(falseValue)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr m_condition;
    FormulaNodePtr m_trueValue;
    FormulaNodePtr m_falseValue;
};

// if (cond) then [else otherwise]; 0 when false and no else branch
class ConditionalNode final : public FormulaNode {
public:
    ConditionalNode(FormulaNodePtr condition, FormulaNodePtr thenBranch,
                    FormulaNodePtr elseBranch = nullptr)
        : m_condition(std::move(condition)),
          m_thenBranch(std::move(thenBranch)),
          m_elseBranch(std::move(elseBranch)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr m_condition;
    FormulaNodePtr m_thenBranch;
    FormulaNodePtr m_elseBranch;   // may be null
};

// Statements in order; value of the last one, 0 when empty
class SequenceNode final : public FormulaNode {
public:
    explicit SequenceNode(std::vector<FormulaNodePtr> statements)
        : m_statements(std::move(statements)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    std::vector<FormulaNodePtr> m_statements;
};

// ═══════════════════════════════════════════════════════════════════
// STATEMENTS THAT WRITE BINDINGS
// ═══════════════════════════════════════════════════════════════════

// let name [= init]; zero-initialized without an initializer
class DeclarationNode final : public FormulaNode {
public:
    DeclarationNode(QString name, FormulaNodePtr initialValue = nullptr)
        : m_name(std::move(name)), m_initialValue(std::move(initialValue)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    QString        m_name;
    FormulaNodePtr m_initialValue;   // may be null
};

// name = v, name += v, ...; compound forms read a missing target as 0
class AssignmentNode final : public FormulaNode {
public:
    enum Op { Assign, AddAssign, SubAssign, MulAssign, DivAssign };

    AssignmentNode(QString name, FormulaNodePtr value, Op op = Assign)
        : m_name(std::move(name)), m_value(std::move(value)), m_op(op) {}
    double evaluate(EvalContext &ctx) const override;

private:
    QString        m_name;
    FormulaNodePtr m_value;
    Op             m_op;
};

// ═══════════════════════════════════════════════════════════════════
// FUNCTIONS
// ═══════════════════════════════════════════════════════════════════

/**
 * Multi-argument functions: min(a,b) max(a,b) pow(a,b) clamp(x,lo,hi)
 * lerp(a,b,t). Called with fewer arguments than required they return the
 * first argument (0 with none); extra arguments are evaluated and ignored.
 */
class FunctionNode final : public FormulaNode {
public:
    enum Function { Min, Max, Clamp, Lerp, Pow };

    FunctionNode(Function function, std::vector<FormulaNodePtr> arguments)
        : m_function(function), m_arguments(std::move(arguments)) {}
    double evaluate(EvalContext &ctx) const override;

    static bool lookup(const QString &name, Function *function);
    static int minimumArity(Function function);

private:
    Function                    m_function;
    std::vector<FormulaNodePtr> m_arguments;
};

// random(): [0, 1)
class RandomValueNode final : public FormulaNode {
public:
    explicit RandomValueNode(RandomProviderPtr provider)
        : m_provider(std::move(provider)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    RandomProviderPtr m_provider;
};

// rand(max): integer in [0, max), max truncated toward zero
class RandomIntNode final : public FormulaNode {
public:
    RandomIntNode(FormulaNodePtr maxValue, RandomProviderPtr provider)
        : m_maxValue(std::move(maxValue)), m_provider(std::move(provider)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr    m_maxValue;
    RandomProviderPtr m_provider;
};

// randf(max): [0, max)
class RandomFloatNode final : public FormulaNode {
public:
    RandomFloatNode(FormulaNodePtr maxValue, RandomProviderPtr provider)
        : m_maxValue(std::move(maxValue)), m_provider(std::move(provider)) {}
    double evaluate(EvalContext &ctx) const override;

private:
    FormulaNodePtr    m_maxValue;
    RandomProviderPtr m_provider;
};

#endif // FORMULA_NODES_H
