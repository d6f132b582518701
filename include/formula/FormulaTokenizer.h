#ifndef FORMULA_TOKENIZER_H
#define FORMULA_TOKENIZER_H

#include "formula/FormulaToken.h"
#include <QString>

namespace Formula {

struct LexError {
    QString message;
    int position = 0;
    int line = 1;
    int column = 1;
};

/**
 * @brief Turns formula source text into a token list ending in an End token.
 *
 * Whitespace is discarded. Multi-character operators are matched before their
 * single-character prefixes. The first invalid character or unterminated string
 * aborts tokenization: *ok is set to false, *error describes the problem and an
 * empty list is returned.
 */
class FormulaTokenizer {
public:
    static FormulaTokenList tokenize(const QString &source, bool *ok,
                                     LexError *error = nullptr);

private:
    explicit FormulaTokenizer(const QString &source);

    bool run(FormulaTokenList &out, LexError &error);

    bool readNumber(FormulaTokenList &out, LexError &error);
    bool readString(FormulaTokenList &out, LexError &error);
    void readIdentifier(FormulaTokenList &out);
    bool readOperator(FormulaTokenList &out);

    QChar current() const;
    QChar peek(int offset = 1) const;
    void advance(int count = 1);
    void push(FormulaTokenList &out, FormulaToken::Type type,
              const QString &text, int start, int line, int column) const;
    void fail(LexError &error, const QString &message) const;

    const QString &m_src;
    int m_pos = 0;
    int m_line = 1;
    int m_column = 1;
};

} // namespace Formula

#endif // FORMULA_TOKENIZER_H
