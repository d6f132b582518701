#include "formula/FormulaAST.h"

namespace Formula {

QString FormulaASTNode::rootName() const {
  const FormulaASTNode *node = this;
  while (node->kind == MemberExpression && node->left)
    node = node->left.get();
  return node->kind == Identifier ? node->name : QString();
}

QString nodeKindName(FormulaASTNode::Kind kind) {
  switch (kind) {
  case FormulaASTNode::Literal:
    return QStringLiteral("Literal");
  case FormulaASTNode::Identifier:
    return QStringLiteral("Identifier");
  case FormulaASTNode::MemberExpression:
    return QStringLiteral("MemberExpression");
  case FormulaASTNode::ArrayExpression:
    return QStringLiteral("ArrayExpression");
  case FormulaASTNode::ObjectExpression:
    return QStringLiteral("ObjectExpression");
  case FormulaASTNode::UnaryExpression:
    return QStringLiteral("UnaryExpression");
  case FormulaASTNode::BinaryExpression:
    return QStringLiteral("BinaryExpression");
  case FormulaASTNode::LogicalExpression:
    return QStringLiteral("LogicalExpression");
  case FormulaASTNode::ConditionalExpression:
    return QStringLiteral("ConditionalExpression");
  case FormulaASTNode::CallExpression:
    return QStringLiteral("CallExpression");
  }
  return QStringLiteral("Unknown");
}

} // namespace Formula
