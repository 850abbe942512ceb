#ifndef FORMULA_PARSER_H
#define FORMULA_PARSER_H

/**
 * @file FormulaParser.h
 * @brief Compiles formula text into a Formula (AST + required inputs)
 *
 * ═══════════════════════════════════════════════════════════════════
 * FORMULA SYNTAX
 * ═══════════════════════════════════════════════════════════════════
 *
 * ── Statements (separated by ';' and/or newlines) ──
 *   let name = expr        declare a local (zero without "= expr")
 *   name = expr            assign; also  +=  -=  *=  /=
 *   if (cond) stmt else stmt
 *   { stmt; stmt }         block, value of its last statement
 *   expr
 *
 *   The value of a formula is the value of its last statement.
 *
 * ── Literals ──
 *   42, 3.14, .5           (no exponent notation; sign is an operator)
 *
 * ── Arithmetic ──
 *   +  -  *  /  %  ^(power, right-associative)
 *
 * ── Comparison (1.0 / 0.0; == and != tolerate 1e-4) ──
 *   <  <=  >  >=  ==  !=   (at most one per level: a < b < c is an error)
 *
 * ── Logical (non-zero is true, short-circuit) ──
 *   &&  ||  !
 *
 * ── Ternary ──
 *   cond ? a : b
 *
 * ── Functions ──
 *   sqrt abs floor ceil round sin cos tan log exp clamp01 sign negative
 *   acos asin atan                      (one argument)
 *   min(a,b) max(a,b) pow(a,b) clamp(x,lo,hi) lerp(a,b,t)
 *   rand(max) randf(max) random()
 *
 * ═══════════════════════════════════════════════════════════════════
 * VARIABLES
 * ═══════════════════════════════════════════════════════════════════
 *
 * Any identifier read before it is the target of a let or an assignment is
 * an input and must be supplied by the caller. Tracking is flat per formula:
 * a let inside a block makes the name local for the rest of the formula.
 */

#include "formula/Formula.h"
#include "formula/FormulaError.h"
#include "formula/FormulaTokenizer.h"
#include "formula/RandomProvider.h"
#include <QSet>
#include <QString>
#include <QVector>

class FormulaParser {
public:
    // randomProvider is bound into every rand / randf / random node;
    // nullptr selects DefaultRandomProvider::shared()
    explicit FormulaParser(RandomProviderPtr randomProvider = nullptr);

    // ── Parse ──
    // Returns nullptr and fills *error on a syntax error.
    FormulaPtr parse(const QString &expression, ParseError *error = nullptr);

    // ── Validate (parse-only) ──
    bool validate(const QString &expression, QString *errorMsg = nullptr);

    // ── Last error ──
    const ParseError &lastError() const { return m_error; }

    RandomProviderPtr randomProvider() const { return m_random; }

private:
    using Type = FormulaToken::Type;

    // ── Token cursor ──
    const FormulaToken &peek(int ahead = 0) const;
    bool check(Type type) const;
    bool match(Type type);
    void skipNewlines();
    void skipSeparators();

    // ── Statements ──
    FormulaNodePtr parseStatements();
    FormulaNodePtr parseStatement();
    FormulaNodePtr parseDeclaration();
    FormulaNodePtr parseIfStatement();
    FormulaNodePtr parseBlock();
    FormulaNodePtr parseAssignmentOrExpression();

    // ── Expressions (lowest → highest precedence) ──
    FormulaNodePtr parseExpression();
    FormulaNodePtr parseTernary();
    FormulaNodePtr parseLogicalOr();
    FormulaNodePtr parseLogicalAnd();
    FormulaNodePtr parseComparison();
    FormulaNodePtr parseAdditive();
    FormulaNodePtr parseMultiplicative();
    FormulaNodePtr parseExponent();
    FormulaNodePtr parseUnary();
    FormulaNodePtr parsePrimary();
    FormulaNodePtr parseNumber(const FormulaToken &tok);
    FormulaNodePtr parseFunctionCall(const FormulaToken &nameTok);

    static FormulaNodePtr wrapStatements(std::vector<FormulaNodePtr> statements,
                                         FormulaNodePtr whenEmpty);

    // ── Errors ──
    FormulaNodePtr fail(ParseError::Kind kind, const QString &message,
                        const FormulaToken &at);
    FormulaNodePtr failUnexpected(const FormulaToken &tok);
    void buildErrorContext(ParseError &error, int position) const;

    // ── State of the current parse ──
    RandomProviderPtr     m_random;
    QString               m_source;
    QVector<FormulaToken> m_tokens;
    int                   m_pos = 0;
    QSet<QString>         m_inputs;
    QSet<QString>         m_locals;
    ParseError            m_error;
};

#endif // FORMULA_PARSER_H
