#ifndef FORMULA_TOKENIZER_H
#define FORMULA_TOKENIZER_H

#include <QString>
#include <QVector>

// ═══════════════════════════════════════════════════════════════════
// TOKEN: lexical element of a formula, with its source offset
// ═══════════════════════════════════════════════════════════════════

struct FormulaToken {
    enum Type {
        Number,        // 12, 3.5, .5 (digits and '.', validated by the parser)
        Identifier,    // variable, function or keyword (let / if / else)

        Plus, Minus, Star, Slash, Percent, Caret,          // + - * / % ^
        Bang,                                              // !
        Less, LessEqual, Greater, GreaterEqual,            // < <= > >=
        EqualEqual, BangEqual,                             // == !=
        AndAnd, OrOr,                                      // && ||

        Assign, PlusAssign, MinusAssign, StarAssign, SlashAssign, // = += -= *= /=

        Question, Colon,                                   // ? :
        LParen, RParen, LBrace, RBrace,                    // ( ) { }
        Comma, Semicolon,                                  // , ;
        Newline,                                           // '\n' (statement separator)

        Invalid,       // any other character
        End            // end of input
    };

    Type    type = End;
    QString text;        // exact source text of the token
    int     offset = 0;  // index of the first character in the source

    bool is(Type t) const { return type == t; }
    bool isWord(const char *word) const {
        return type == Identifier && text == QLatin1String(word);
    }
};

/**
 * @brief Splits formula text into tokens.
 *
 * Spaces, tabs and carriage returns are skipped; '\n' becomes a Newline
 * token because it separates statements. Unknown characters become Invalid
 * tokens so the parser reports them at the point it reaches them. The
 * result always ends with an End token whose offset is the text length.
 */
class FormulaTokenizer {
public:
    static QVector<FormulaToken> tokenize(const QString &source);

private:
    static bool isIdentifierStart(QChar ch);
    static bool isIdentifierPart(QChar ch);
};

#endif // FORMULA_TOKENIZER_H
