#ifndef FORMULA_AST_H
#define FORMULA_AST_H

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <memory>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// AST NODE: parsed expression tree
//
// One Kind per production. Only the members listed against a kind are
// meaningful for it. Nodes are built by FormulaParser and never modified
// afterwards; children are shared read-only so a parsed tree can be cached
// by the caller and evaluated from several threads.
// ═══════════════════════════════════════════════════════════════════

struct FormulaASTNode;
using ASTNodePtr = std::shared_ptr<const FormulaASTNode>;

struct FormulaASTNode {
    enum Kind {
        Literal,                // value
        Identifier,             // name
        MemberExpression,       // object . name   |   object [ property ] (computed)
        ArrayExpression,        // elements
        ObjectExpression,       // keys[i] : elements[i]
        UnaryExpression,        // op operand            (op: "-" "!")
        BinaryExpression,       // left op right         (arithmetic, comparison, "&")
        LogicalExpression,      // left op right         (op: "&&" "||")
        ConditionalExpression,  // test ? consequent : alternate
        CallExpression          // callee ( elements )
    };

    Kind kind = Literal;

    QVariant value;             // Literal: null / bool / double / QString
    QString  name;              // Identifier name, non-computed member property
    QString  op;                // operator spelling as written ("==" also for "===")

    ASTNodePtr left;            // Binary/Logical left, Unary operand, Member object,
                                // Conditional test, Call callee
    ASTNodePtr right;           // Binary/Logical right, computed Member property,
                                // Conditional alternate
    ASTNodePtr middle;          // Conditional consequent
    QVector<ASTNodePtr> elements; // Array elements, Object values, Call arguments
    QStringList keys;           // Object keys, parallel to elements
    bool computed = false;      // Member: a[b] rather than a.b

    int start = 0;              // source span [start, end)
    int end = 0;
    int depth = 1;              // height of this subtree (leaf == 1)

    // Root identifier of a member chain (order.customer.name → "order"),
    // or empty when the chain does not start at an identifier.
    QString rootName() const;
};

QString nodeKindName(FormulaASTNode::Kind kind);

} // namespace Formula

#endif // FORMULA_AST_H
