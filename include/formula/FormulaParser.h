#ifndef FORMULA_PARSER_H
#define FORMULA_PARSER_H

/**
 * @file FormulaParser.h
 * @brief Recursive-descent parser producing FormulaASTNode trees
 *
 * Grammar (precedence low → high):
 *   ternary        := or ('?' ternary ':' ternary)?          right-assoc
 *   or             := and ('||' and)*
 *   and            := equality ('&&' equality)*
 *   equality       := relational (('==' | '!=') relational)*
 *   relational     := additive (('<' | '>' | '<=' | '>=') additive)*
 *   additive       := multiplicative (('+' | '-' | '&') multiplicative)*
 *   multiplicative := power (('*' | '/' | '%') power)*
 *   power          := unary ('**' power)?                     right-assoc
 *   unary          := ('-' | '!') unary | postfix
 *   postfix        := primary ('.' IDENT | '[' ternary ']' | '(' argList? ')')*
 *   primary        := NUMBER | STRING | IDENT | '(' ternary ')'
 *                   | '[' argList? ']'
 *                   | '{' (key ':' ternary (',' key ':' ternary)*)? '}'
 *   argList        := ternary (',' ternary)*
 *   key            := IDENT | STRING
 *
 * true / false / null (any letter case) are turned into literals here.
 * The parser stops at the first error; it never throws.
 */

#include "formula/EngineLimits.h"
#include "formula/FormulaAST.h"
#include "formula/FormulaToken.h"
#include <QString>

namespace Formula {

struct ParseError {
    enum class Kind {
        Lex,      // invalid character, unterminated string, bad number
        Syntax,   // malformed token sequence, empty input
        Limit     // formula exceeds an EngineLimits bound
    };

    Kind    kind = Kind::Syntax;
    QString message;
    int     position = 0;
    int     line = 1;
    int     column = 1;
    QString snippet;     // source excerpt with '→' at the error position
};

struct ParseResult {
    bool        success = false;
    ASTNodePtr  ast;
    ParseError  error;      // meaningful when !success
    int         nodeCount = 0;
    int         depth = 0;
};

class FormulaParser {
public:
    explicit FormulaParser(const EngineLimits &limits = EngineLimits());

    ParseResult parse(const QString &source) const;

    const EngineLimits &limits() const { return m_limits; }

private:
    struct State;

    // ── Precedence levels ──
    ASTNodePtr parseTernary(State &st, bool *ok) const;
    ASTNodePtr parseOr(State &st, bool *ok) const;
    ASTNodePtr parseAnd(State &st, bool *ok) const;
    ASTNodePtr parseEquality(State &st, bool *ok) const;
    ASTNodePtr parseRelational(State &st, bool *ok) const;
    ASTNodePtr parseAdditive(State &st, bool *ok) const;
    ASTNodePtr parseMultiplicative(State &st, bool *ok) const;
    ASTNodePtr parsePower(State &st, bool *ok) const;
    ASTNodePtr parseUnary(State &st, bool *ok) const;
    ASTNodePtr parsePostfix(State &st, bool *ok) const;
    ASTNodePtr parsePrimary(State &st, bool *ok) const;
    ASTNodePtr parseArrayLiteral(State &st, bool *ok) const;
    ASTNodePtr parseObjectLiteral(State &st, bool *ok) const;
    bool parseArgumentList(State &st, FormulaToken::Type closer,
                           QVector<ASTNodePtr> &out, bool *ok) const;

    // ── Node construction (depth / count bookkeeping + limit checks) ──
    ASTNodePtr finish(std::shared_ptr<FormulaASTNode> node, State &st,
                      bool *ok) const;
    ASTNodePtr makeBinary(FormulaASTNode::Kind kind, const QString &op,
                          const ASTNodePtr &left, const ASTNodePtr &right,
                          State &st, bool *ok) const;

    bool enter(State &st, bool *ok) const;
    void fail(State &st, ParseError::Kind kind, const QString &message,
              const FormulaToken &at, bool *ok) const;

    EngineLimits m_limits;
};

QString errorSnippet(const QString &source, int position);

} // namespace Formula

#endif // FORMULA_PARSER_H
