#include "formula/FormulaTokenizer.h"

bool FormulaTokenizer::isIdentifierStart(QChar ch) {
  return ch.isLetter() || ch == '_';
}

bool FormulaTokenizer::isIdentifierPart(QChar ch) {
  return ch.isLetterOrNumber() || ch == '_';
}

QVector<FormulaToken> FormulaTokenizer::tokenize(const QString &source) {
  QVector<FormulaToken> tokens;
  const int len = source.length();
  int i = 0;

  auto push = [&tokens, &source](FormulaToken::Type type, int start,
                                 int length) {
    FormulaToken tok;
    tok.type = type;
    tok.text = source.mid(start, length);
    tok.offset = start;
    tokens.append(tok);
  };

  while (i < len) {
    QChar ch = source[i];

    if (ch == '\n') {
      push(FormulaToken::Newline, i, 1);
      ++i;
      continue;
    }

    // Skip the rest of the whitespace (space, tab, '\r', ...)
    if (ch.isSpace()) {
      ++i;
      continue;
    }

    // Numbers: digits and dots only; no exponent, no sign
    if (ch.isDigit() || ch == '.') {
      int start = i;
      while (i < len && (source[i].isDigit() || source[i] == '.'))
        ++i;
      push(FormulaToken::Number, start, i - start);
      continue;
    }

    // Identifiers: [letter_][letter digit _]*
    if (isIdentifierStart(ch)) {
      int start = i;
      while (i < len && isIdentifierPart(source[i]))
        ++i;
      push(FormulaToken::Identifier, start, i - start);
      continue;
    }

    // Two-character operators
    if (i + 1 < len) {
      QChar next = source[i + 1];
      FormulaToken::Type two = FormulaToken::Invalid;
      if (ch == '<' && next == '=')
        two = FormulaToken::LessEqual;
      else if (ch == '>' && next == '=')
        two = FormulaToken::GreaterEqual;
      else if (ch == '=' && next == '=')
        two = FormulaToken::EqualEqual;
      else if (ch == '!' && next == '=')
        two = FormulaToken::BangEqual;
      else if (ch == '&' && next == '&')
        two = FormulaToken::AndAnd;
      else if (ch == '|' && next == '|')
        two = FormulaToken::OrOr;
      else if (ch == '+' && next == '=')
        two = FormulaToken::PlusAssign;
      else if (ch == '-' && next == '=')
        two = FormulaToken::MinusAssign;
      else if (ch == '*' && next == '=')
        two = FormulaToken::StarAssign;
      else if (ch == '/' && next == '=')
        two = FormulaToken::SlashAssign;

      if (two != FormulaToken::Invalid) {
        push(two, i, 2);
        i += 2;
        continue;
      }
    }

    // Single-character operators and punctuation
    FormulaToken::Type one = FormulaToken::Invalid;
    switch (ch.unicode()) {
    case '+': one = FormulaToken::Plus; break;
    case '-': one = FormulaToken::Minus; break;
    case '*': one = FormulaToken::Star; break;
    case '/': one = FormulaToken::Slash; break;
    case '%': one = FormulaToken::Percent; break;
    case '^': one = FormulaToken::Caret; break;
    case '!': one = FormulaToken::Bang; break;
    case '<': one = FormulaToken::Less; break;
    case '>': one = FormulaToken::Greater; break;
    case '=': one = FormulaToken::Assign; break;
    case '?': one = FormulaToken::Question; break;
    case ':': one = FormulaToken::Colon; break;
    case '(': one = FormulaToken::LParen; break;
    case ')': one = FormulaToken::RParen; break;
    case '{': one = FormulaToken::LBrace; break;
    case '}': one = FormulaToken::RBrace; break;
    case ',': one = FormulaToken::Comma; break;
    case ';': one = FormulaToken::Semicolon; break;
    default: break;
    }

    // Unknown characters are passed through as Invalid tokens
    push(one, i, 1);
    ++i;
  }

  FormulaToken endTok;
  endTok.type = FormulaToken::End;
  endTok.offset = len;
  tokens.append(endTok);
  return tokens;
}
