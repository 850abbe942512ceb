#ifndef FORMULA_ERROR_H
#define FORMULA_ERROR_H

#include <QString>

// ═══════════════════════════════════════════════════════════════════
// PARSE ERROR: grammar violation found while compiling a formula
// ═══════════════════════════════════════════════════════════════════

struct ParseError {
    enum Kind {
        None,
        UnexpectedCharacter,      // token that cannot start / continue here
        UnexpectedEnd,            // input ended where an operand was needed
        InvalidNumber,            // "1.2.3", "."
        UnterminatedParenthesis,  // "(a + b"
        UnterminatedTernary,      // "a ? b" without ':'
        UnterminatedFunctionCall, // "min(a, b"
        UnterminatedBlock,        // "{ a"
        UnknownFunction,          // name / arity not in any function table
        ExpectedToken,            // "if x", "let = 3"
        UnexpectedKeyword         // "else" without a matching "if"
    };

    Kind    kind = None;
    QString message;     // short description, e.g. "Expected ')'"
    int     offset = 0;  // index into the source text
    int     line = 1;    // 1-based
    int     column = 1;  // 1-based
    QString lineText;    // text of the offending line
    QString pointer;     // spaces + '^' under the offending column

    bool isError() const { return kind != None; }

    // "Parse error at line L, column C: message" + line + pointer
    QString toString() const;

    static QString kindName(Kind kind);
};

// ═══════════════════════════════════════════════════════════════════
// EVAL ERROR: failure raised while walking a formula's tree
// ═══════════════════════════════════════════════════════════════════

struct EvalError {
    enum Kind {
        None,
        MissingVariable   // an input was referenced but never supplied
    };

    Kind    kind = None;
    QString variable;    // offending variable (MissingVariable)
    QString message;

    bool isError() const { return kind != None; }

    static EvalError missingVariable(const QString &name);
};

#endif // FORMULA_ERROR_H
