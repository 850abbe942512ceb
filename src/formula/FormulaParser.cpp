/**
 * @file FormulaParser.cpp
 * @brief Recursive-descent compiler for the formula language
 *
 * Grammar (precedence low → high):
 *   statements  := sep* (statement sep*)*          sep := ';' | NEWLINE
 *   statement   := 'let' IDENT ('=' expression)?
 *                | 'if' '(' expression ')' statement (sep* 'else' statement)?
 *                | '{' statements '}'
 *                | IDENT ('=' | '+=' | '-=' | '*=' | '/=') expression
 *                | expression
 *   expression  := ternary
 *   ternary     := or ('?' or ':' ternary)?
 *   or          := and ('||' and)*
 *   and         := comparison ('&&' comparison)*
 *   comparison  := additive (('<'|'<='|'>'|'>='|'=='|'!=') additive)?
 *   additive    := multiplic (('+' | '-') multiplic)*
 *   multiplic   := exponent (('*' | '/' | '%') exponent)*
 *   exponent    := unary ('^' exponent)?
 *   unary       := ('-' | '+' | '!') unary | primary
 *   primary     := NUMBER
 *                | IDENT '(' (expression (',' expression)*)? ')'
 *                | IDENT
 *                | '(' expression ')'
 *
 * Newlines separate statements, so inside an expression a newline ends it.
 * Newlines are skipped only between statements, after '{', before '}' and
 * before 'else'.
 */

#include "formula/FormulaParser.h"
#include <QDebug>

FormulaParser::FormulaParser(RandomProviderPtr randomProvider)
    : m_random(randomProvider ? std::move(randomProvider)
                              : DefaultRandomProvider::shared()) {}

// ═══════════════════════════════════════════════════════════════════
// PUBLIC API
// ═══════════════════════════════════════════════════════════════════

FormulaPtr FormulaParser::parse(const QString &expression, ParseError *error) {
  m_source = expression;
  m_tokens = FormulaTokenizer::tokenize(expression);
  m_pos = 0;
  m_inputs.clear();
  m_locals.clear();
  m_error = ParseError();

  FormulaNodePtr root = parseStatements();
  if (!root) {
    qWarning().noquote() << "[FormulaParser]" << m_error.toString()
                         << "\nExpression:\n" + expression;
    if (error)
      *error = m_error;
    return nullptr;
  }

  if (error)
    *error = ParseError();
  return std::make_shared<const Formula>(expression, std::move(root),
                                         m_inputs);
}

bool FormulaParser::validate(const QString &expression, QString *errorMsg) {
  ParseError err;
  bool ok = parse(expression, &err) != nullptr;
  if (!ok && errorMsg)
    *errorMsg = err.toString();
  return ok;
}

// ═══════════════════════════════════════════════════════════════════
// TOKEN CURSOR
// ═══════════════════════════════════════════════════════════════════

const FormulaToken &FormulaParser::peek(int ahead) const {
  int idx = m_pos + ahead;
  if (idx >= m_tokens.size())
    return m_tokens.last(); // End
  return m_tokens[idx];
}

bool FormulaParser::check(Type type) const { return peek().type == type; }

bool FormulaParser::match(Type type) {
  if (!check(type))
    return false;
  ++m_pos;
  return true;
}

void FormulaParser::skipNewlines() {
  while (check(FormulaToken::Newline))
    ++m_pos;
}

void FormulaParser::skipSeparators() {
  while (check(FormulaToken::Newline) || check(FormulaToken::Semicolon))
    ++m_pos;
}

// ═══════════════════════════════════════════════════════════════════
// STATEMENTS
// ═══════════════════════════════════════════════════════════════════

FormulaNodePtr FormulaParser::wrapStatements(
    std::vector<FormulaNodePtr> statements, FormulaNodePtr whenEmpty) {
  if (statements.empty())
    return whenEmpty;
  if (statements.size() == 1)
    return std::move(statements.front());
  return std::make_unique<SequenceNode>(std::move(statements));
}

FormulaNodePtr FormulaParser::parseStatements() {
  std::vector<FormulaNodePtr> statements;

  skipSeparators();
  while (!check(FormulaToken::End)) {
    FormulaNodePtr stmt = parseStatement();
    if (!stmt)
      return nullptr;
    statements.push_back(std::move(stmt));
    skipSeparators();
  }

  // Empty or whitespace-only text evaluates to 0
  return wrapStatements(std::move(statements),
                        std::make_unique<ConstantNode>(0.0));
}

FormulaNodePtr FormulaParser::parseStatement() {
  skipNewlines();
  const FormulaToken &tok = peek();

  if (tok.isWord("let"))
    return parseDeclaration();
  if (tok.isWord("if"))
    return parseIfStatement();
  if (tok.isWord("else"))
    return fail(ParseError::UnexpectedKeyword, "'else' without matching 'if'",
                tok);
  if (tok.is(FormulaToken::LBrace))
    return parseBlock();
  return parseAssignmentOrExpression();
}

FormulaNodePtr FormulaParser::parseDeclaration() {
  ++m_pos; // consume 'let'

  const FormulaToken &nameTok = peek();
  if (!nameTok.is(FormulaToken::Identifier))
    return fail(ParseError::ExpectedToken, "Expected variable name after 'let'",
                nameTok);
  QString name = nameTok.text;
  ++m_pos;

  // Declared before the initializer: "let x = x + 1" reads x as a local
  m_locals.insert(name);

  FormulaNodePtr init;
  if (match(FormulaToken::Assign)) {
    init = parseExpression();
    if (!init)
      return nullptr;
  }

  return std::make_unique<DeclarationNode>(name, std::move(init));
}

FormulaNodePtr FormulaParser::parseIfStatement() {
  ++m_pos; // consume 'if'

  if (!match(FormulaToken::LParen))
    return fail(ParseError::ExpectedToken, "Expected '(' after 'if'", peek());

  FormulaNodePtr condition = parseExpression();
  if (!condition)
    return nullptr;

  if (!match(FormulaToken::RParen))
    return fail(ParseError::UnterminatedParenthesis,
                "Expected ')' after if condition", peek());

  skipNewlines();
  if (check(FormulaToken::End))
    return fail(ParseError::UnexpectedEnd,
                "Expected statement after if condition", peek());

  FormulaNodePtr thenBranch = parseStatement();
  if (!thenBranch)
    return nullptr;

  // Look past separators for 'else'; put them back when there is none
  int afterThen = m_pos;
  skipSeparators();
  if (!peek().isWord("else")) {
    m_pos = afterThen;
    return std::make_unique<ConditionalNode>(std::move(condition),
                                             std::move(thenBranch));
  }
  ++m_pos; // consume 'else'

  skipNewlines();
  if (check(FormulaToken::End))
    return fail(ParseError::UnexpectedEnd, "Expected statement after 'else'",
                peek());

  FormulaNodePtr elseBranch = parseStatement();
  if (!elseBranch)
    return nullptr;

  return std::make_unique<ConditionalNode>(
      std::move(condition), std::move(thenBranch), std::move(elseBranch));
}

FormulaNodePtr FormulaParser::parseBlock() {
  const FormulaToken &open = peek();
  ++m_pos; // consume '{'

  std::vector<FormulaNodePtr> statements;
  skipSeparators();
  while (!check(FormulaToken::RBrace)) {
    if (check(FormulaToken::End))
      return fail(ParseError::UnterminatedBlock,
                  QString("Expected '}' to close block opened at offset %1")
                      .arg(open.offset),
                  peek());

    FormulaNodePtr stmt = parseStatement();
    if (!stmt)
      return nullptr;
    statements.push_back(std::move(stmt));
    skipSeparators();
  }
  ++m_pos; // consume '}'

  return wrapStatements(std::move(statements), std::make_unique<EmptyNode>());
}

FormulaNodePtr FormulaParser::parseAssignmentOrExpression() {
  const FormulaToken &nameTok = peek();

  if (nameTok.is(FormulaToken::Identifier)) {
    AssignmentNode::Op op = AssignmentNode::Assign;
    bool isAssignment = true;
    switch (peek(1).type) {
    case FormulaToken::Assign:      op = AssignmentNode::Assign; break;
    case FormulaToken::PlusAssign:  op = AssignmentNode::AddAssign; break;
    case FormulaToken::MinusAssign: op = AssignmentNode::SubAssign; break;
    case FormulaToken::StarAssign:  op = AssignmentNode::MulAssign; break;
    case FormulaToken::SlashAssign: op = AssignmentNode::DivAssign; break;
    default: isAssignment = false; break;
    }

    if (isAssignment) {
      QString name = nameTok.text;
      m_pos += 2; // name and operator

      FormulaNodePtr value = parseExpression();
      if (!value)
        return nullptr;

      // Marked after the value: "x = x * 2" reads x as an input
      m_locals.insert(name);
      return std::make_unique<AssignmentNode>(name, std::move(value), op);
    }
  }

  return parseExpression();
}

// ═══════════════════════════════════════════════════════════════════
// EXPRESSIONS
// ═══════════════════════════════════════════════════════════════════

FormulaNodePtr FormulaParser::parseExpression() { return parseTernary(); }

FormulaNodePtr FormulaParser::parseTernary() {
  FormulaNodePtr cond = parseLogicalOr();
  if (!cond)
    return nullptr;

  if (!match(FormulaToken::Question))
    return cond;

  FormulaNodePtr trueExpr = parseLogicalOr();
  if (!trueExpr)
    return nullptr;

  if (!match(FormulaToken::Colon))
    return fail(ParseError::UnterminatedTernary,
                "Expected ':' in ternary operator", peek());

  FormulaNodePtr falseExpr = parseTernary();
  if (!falseExpr)
    return nullptr;

  return std::make_unique<TernaryNode>(std::move(cond), std::move(trueExpr),
                                       std::move(falseExpr));
}

FormulaNodePtr FormulaParser::parseLogicalOr() {
  FormulaNodePtr left = parseLogicalAnd();
  if (!left)
    return nullptr;

  while (match(FormulaToken::OrOr)) {
    FormulaNodePtr right = parseLogicalAnd();
    if (!right)
      return nullptr;
    left = std::make_unique<LogicalNode>(LogicalNode::Or, std::move(left),
                                         std::move(right));
  }
  return left;
}

FormulaNodePtr FormulaParser::parseLogicalAnd() {
  FormulaNodePtr left = parseComparison();
  if (!left)
    return nullptr;

  while (match(FormulaToken::AndAnd)) {
    FormulaNodePtr right = parseComparison();
    if (!right)
      return nullptr;
    left = std::make_unique<LogicalNode>(LogicalNode::And, std::move(left),
                                         std::move(right));
  }
  return left;
}

FormulaNodePtr FormulaParser::parseComparison() {
  FormulaNodePtr left = parseAdditive();
  if (!left)
    return nullptr;

  ComparisonNode::Op op;
  switch (peek().type) {
  case FormulaToken::Less:         op = ComparisonNode::Less; break;
  case FormulaToken::LessEqual:    op = ComparisonNode::LessEqual; break;
  case FormulaToken::Greater:      op = ComparisonNode::Greater; break;
  case FormulaToken::GreaterEqual: op = ComparisonNode::GreaterEqual; break;
  case FormulaToken::EqualEqual:   op = ComparisonNode::Equal; break;
  case FormulaToken::BangEqual:    op = ComparisonNode::NotEqual; break;
  default:
    return left;
  }
  ++m_pos;

  // Non-associative: a second comparison operator is left unconsumed
  FormulaNodePtr right = parseAdditive();
  if (!right)
    return nullptr;
  return std::make_unique<ComparisonNode>(op, std::move(left),
                                          std::move(right));
}

FormulaNodePtr FormulaParser::parseAdditive() {
  FormulaNodePtr left = parseMultiplicative();
  if (!left)
    return nullptr;

  while (check(FormulaToken::Plus) || check(FormulaToken::Minus)) {
    BinaryOpNode::Op op = check(FormulaToken::Plus) ? BinaryOpNode::Add
                                                    : BinaryOpNode::Subtract;
    ++m_pos;
    FormulaNodePtr right = parseMultiplicative();
    if (!right)
      return nullptr;
    left = std::make_unique<BinaryOpNode>(op, std::move(left),
                                          std::move(right));
  }
  return left;
}

FormulaNodePtr FormulaParser::parseMultiplicative() {
  FormulaNodePtr left = parseExponent();
  if (!left)
    return nullptr;

  for (;;) {
    Type type = peek().type;
    if (type != FormulaToken::Star && type != FormulaToken::Slash &&
        type != FormulaToken::Percent)
      break;
    ++m_pos;

    FormulaNodePtr right = parseExponent();
    if (!right)
      return nullptr;

    if (type == FormulaToken::Percent)
      left = std::make_unique<ModuloNode>(std::move(left), std::move(right));
    else
      left = std::make_unique<BinaryOpNode>(type == FormulaToken::Star
                                                ? BinaryOpNode::Multiply
                                                : BinaryOpNode::Divide,
                                            std::move(left), std::move(right));
  }
  return left;
}

FormulaNodePtr FormulaParser::parseExponent() {
  // The left side is a unary, so -2^2 is (-2)^2
  FormulaNodePtr base = parseUnary();
  if (!base)
    return nullptr;

  if (!match(FormulaToken::Caret))
    return base;

  FormulaNodePtr exponent = parseExponent(); // right-associative
  if (!exponent)
    return nullptr;
  return std::make_unique<BinaryOpNode>(BinaryOpNode::Power, std::move(base),
                                        std::move(exponent));
}

FormulaNodePtr FormulaParser::parseUnary() {
  if (match(FormulaToken::Minus)) {
    FormulaNodePtr operand = parseUnary();
    if (!operand)
      return nullptr;
    return std::make_unique<UnaryOpNode>(UnaryOpNode::Negate,
                                         std::move(operand));
  }
  if (match(FormulaToken::Plus))
    return parseUnary();
  if (match(FormulaToken::Bang)) {
    FormulaNodePtr operand = parseUnary();
    if (!operand)
      return nullptr;
    return std::make_unique<LogicalNotNode>(std::move(operand));
  }
  return parsePrimary();
}

FormulaNodePtr FormulaParser::parsePrimary() {
  const FormulaToken &tok = peek();

  // Parenthesized expression
  if (tok.is(FormulaToken::LParen)) {
    ++m_pos;
    FormulaNodePtr inner = parseExpression();
    if (!inner)
      return nullptr;
    if (!match(FormulaToken::RParen))
      return fail(ParseError::UnterminatedParenthesis,
                  "Expected closing parenthesis", peek());
    return inner;
  }

  if (tok.is(FormulaToken::Number)) {
    ++m_pos;
    return parseNumber(tok);
  }

  // Identifier: function call or variable reference
  if (tok.is(FormulaToken::Identifier)) {
    ++m_pos;
    if (check(FormulaToken::LParen))
      return parseFunctionCall(tok);

    if (!m_locals.contains(tok.text))
      m_inputs.insert(tok.text);
    return std::make_unique<VariableNode>(tok.text);
  }

  return failUnexpected(tok);
}

FormulaNodePtr FormulaParser::parseNumber(const FormulaToken &tok) {
  bool ok = false;
  double value = tok.text.toDouble(&ok);
  if (!ok)
    return fail(ParseError::InvalidNumber,
                QString("Invalid number '%1'").arg(tok.text), tok);
  return std::make_unique<ConstantNode>(value);
}

FormulaNodePtr FormulaParser::parseFunctionCall(const FormulaToken &nameTok) {
  ++m_pos; // consume '('

  std::vector<FormulaNodePtr> args;
  if (!check(FormulaToken::RParen)) {
    do {
      FormulaNodePtr arg = parseExpression();
      if (!arg)
        return nullptr;
      args.push_back(std::move(arg));
    } while (match(FormulaToken::Comma));
  }

  if (!match(FormulaToken::RParen))
    return fail(ParseError::UnterminatedFunctionCall,
                QString("Expected ')' after arguments of '%1'")
                    .arg(nameTok.text),
                peek());

  const QString &name = nameTok.text;

  // One-argument math functions
  UnaryOpNode::Op unaryOp;
  if (args.size() == 1 && UnaryOpNode::functionOp(name, &unaryOp))
    return std::make_unique<UnaryOpNode>(unaryOp, std::move(args.front()));

  // Multi-argument functions (any arity, see FunctionNode)
  FunctionNode::Function function;
  if (FunctionNode::lookup(name, &function))
    return std::make_unique<FunctionNode>(function, std::move(args));

  // Random functions
  if (name == QLatin1String("rand") && args.size() == 1)
    return std::make_unique<RandomIntNode>(std::move(args.front()), m_random);
  if (name == QLatin1String("randf") && args.size() == 1)
    return std::make_unique<RandomFloatNode>(std::move(args.front()),
                                             m_random);
  if (name == QLatin1String("random") && args.empty())
    return std::make_unique<RandomValueNode>(m_random);

  return fail(ParseError::UnknownFunction,
              QString("Unknown function: %1 with %2 argument(s)")
                  .arg(name)
                  .arg(args.size()),
              nameTok);
}

// ═══════════════════════════════════════════════════════════════════
// ERRORS
// ═══════════════════════════════════════════════════════════════════

FormulaNodePtr FormulaParser::failUnexpected(const FormulaToken &tok) {
  switch (tok.type) {
  case FormulaToken::End:
    return fail(ParseError::UnexpectedEnd, "Unexpected end of expression",
                tok);
  case FormulaToken::Newline:
    return fail(ParseError::UnexpectedEnd, "Unexpected end of line", tok);
  default:
    return fail(ParseError::UnexpectedCharacter,
                QString("Unexpected character '%1'").arg(tok.text), tok);
  }
}

FormulaNodePtr FormulaParser::fail(ParseError::Kind kind,
                                   const QString &message,
                                   const FormulaToken &at) {
  // First error wins
  if (m_error.isError())
    return nullptr;

  m_error.kind = kind;
  m_error.message = message;
  buildErrorContext(m_error, at.offset);
  return nullptr;
}

void FormulaParser::buildErrorContext(ParseError &error, int position) const {
  const int len = m_source.length();

  // Errors at end of input point at the last character
  if (position >= len)
    position = qMax(0, len - 1);
  error.offset = position;

  int line = 1;
  int column = 1;
  for (int i = 0; i < position; ++i) {
    QChar ch = m_source[i];
    if (ch == '\n') {
      ++line;
      column = 1;
    } else if (ch != '\r') {
      ++column;
    }
  }
  error.line = line;
  error.column = column;

  int start = position;
  while (start > 0 && m_source[start - 1] != '\n')
    --start;
  int end = position;
  while (end < len && m_source[end] != '\n')
    ++end;
  QString text = m_source.mid(start, end - start);
  if (text.endsWith('\r'))
    text.chop(1);
  error.lineText = text;

  int pointerColumn = qMin(column, text.length() + 1);
  error.pointer = QString(pointerColumn - 1, ' ') + QLatin1Char('^');
}
