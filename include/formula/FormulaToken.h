#ifndef FORMULA_TOKEN_H
#define FORMULA_TOKEN_H

#include <QString>
#include <QVector>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// TOKEN: lexical unit of a formula
// ═══════════════════════════════════════════════════════════════════

struct FormulaToken {
    enum Type {
        Number,        // 123, 45.67, 1e10 (text kept, converted by the parser)
        String,        // 'abc' / "abc" (text is the unescaped content)
        Identifier,    // field, function, true/false/null, $bound

        Plus,          // +
        Minus,         // -
        Star,          // *
        Slash,         // /
        Percent,       // %
        StarStar,      // **
        EqualEqual,    // == (also ===)
        BangEqual,     // != (also !==)
        Less,          // <
        Greater,       // >
        LessEqual,     // <=
        GreaterEqual,  // >=
        AmpAmp,        // &&
        PipePipe,      // ||
        Bang,          // !
        Amp,           // & (string concatenation)

        LParen,        // (
        RParen,        // )
        LBracket,      // [
        RBracket,      // ]
        LBrace,        // {
        RBrace,        // }
        Comma,         // ,
        Dot,           // .
        Colon,         // :
        Question,      // ?

        End            // end of input
    };

    Type    type = End;
    QString text;        // source spelling (unescaped content for String)
    int     position = 0; // 0-based offset of the first character
    int     line = 1;
    int     column = 1;

    bool isOperator() const { return type >= Plus && type <= Amp; }
    bool isPunctuation() const { return type >= LParen && type <= Question; }
};

using FormulaTokenList = QVector<FormulaToken>;

QString tokenTypeName(FormulaToken::Type type);

} // namespace Formula

#endif // FORMULA_TOKEN_H
