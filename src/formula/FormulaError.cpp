#include "formula/FormulaError.h"

QString ParseError::toString() const {
  if (kind == None)
    return QString();

  QString text = QString("Parse error at line %1, column %2: %3")
                     .arg(line)
                     .arg(column)
                     .arg(message);
  if (!lineText.isEmpty())
    text += '\n' + lineText + '\n' + pointer;
  return text;
}

QString ParseError::kindName(Kind kind) {
  switch (kind) {
  case None:
    return "None";
  case UnexpectedCharacter:
    return "UnexpectedCharacter";
  case UnexpectedEnd:
    return "UnexpectedEnd";
  case InvalidNumber:
    return "InvalidNumber";
  case UnterminatedParenthesis:
    return "UnterminatedParenthesis";
  case UnterminatedTernary:
    return "UnterminatedTernary";
  case UnterminatedFunctionCall:
    return "UnterminatedFunctionCall";
  case UnterminatedBlock:
    return "UnterminatedBlock";
  case UnknownFunction:
    return "UnknownFunction";
  case ExpectedToken:
    return "ExpectedToken";
  case UnexpectedKeyword:
    return "UnexpectedKeyword";
  }
  return "Unknown";
}

EvalError EvalError::missingVariable(const QString &name) {
  EvalError error;
  error.kind = MissingVariable;
  error.variable = name;
  error.message = QString("Variable '%1' not found").arg(name);
  return error;
}
