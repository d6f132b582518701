/**
 * @file FormulaParser.cpp
 * @brief Recursive-descent parser implementation (grammar in FormulaParser.h)
 *
 * Every level threads a `bool *ok` flag; the first failure records a
 * ParseError in the per-call State and unwinds with nullptr. Nesting and
 * node counts are tracked as the tree is built so that hostile input is
 * rejected before it can exhaust the stack.
 */

#include "formula/FormulaParser.h"
#include "formula/FormulaTokenizer.h"
#include <algorithm>

namespace Formula {

// ═══════════════════════════════════════════════════════════════════
// Per-call parser state
// ═══════════════════════════════════════════════════════════════════

struct FormulaParser::State {
  State(const QString &src, const FormulaTokenList &toks)
      : source(src), tokens(toks) {}

  const QString &source;
  const FormulaTokenList &tokens;
  int pos = 0;
  int nodeCount = 0;
  int nesting = 0;
  ParseError error;

  const FormulaToken &peek() const { return tokens[pos]; }
  const FormulaToken &previous() const { return tokens[pos - 1]; }
  bool check(FormulaToken::Type type) const { return peek().type == type; }
  bool match(FormulaToken::Type type) {
    if (!check(type) || type == FormulaToken::End)
      return false;
    ++pos;
    return true;
  }
};

namespace {

struct NestingGuard {
  explicit NestingGuard(int &counter) : m_counter(counter) { ++m_counter; }
  ~NestingGuard() { --m_counter; }
  int &m_counter;
};

QString describe(const FormulaToken &tok) {
  if (tok.type == FormulaToken::End)
    return QStringLiteral("end of expression");
  if (tok.type == FormulaToken::String)
    return QString("string \"%1\"").arg(tok.text);
  return QString("token '%1'").arg(tok.text);
}

} // namespace

QString errorSnippet(const QString &source, int position) {
  const int pos = std::max(0, std::min(position, source.length()));
  const int start = std::max(0, pos - 20);
  const int end = std::min(source.length(), pos + 20);
  QString snippet;
  if (start > 0)
    snippet += QStringLiteral("...");
  snippet += source.mid(start, pos - start);
  snippet += QChar(0x2192); // →
  snippet += source.mid(pos, end - pos);
  if (end < source.length())
    snippet += QStringLiteral("...");
  return snippet;
}

// ═══════════════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════════════

FormulaParser::FormulaParser(const EngineLimits &limits) : m_limits(limits) {}

ParseResult FormulaParser::parse(const QString &source) const {
  ParseResult result;

  if (m_limits.maxFormulaLength > 0 &&
      source.length() > m_limits.maxFormulaLength) {
    result.error.kind = ParseError::Kind::Limit;
    result.error.message =
        QString("Formula is too long (%1 characters, limit %2)")
            .arg(source.length())
            .arg(m_limits.maxFormulaLength);
    result.error.position = m_limits.maxFormulaLength;
    return result;
  }

  if (source.trimmed().isEmpty()) {
    result.error.kind = ParseError::Kind::Syntax;
    result.error.message = QStringLiteral("Empty expression");
    result.error.snippet = errorSnippet(source, 0);
    return result;
  }

  bool lexOk = true;
  LexError lexError;
  const FormulaTokenList tokens =
      FormulaTokenizer::tokenize(source, &lexOk, &lexError);
  if (!lexOk) {
    result.error.kind = ParseError::Kind::Lex;
    result.error.message = lexError.message;
    result.error.position = lexError.position;
    result.error.line = lexError.line;
    result.error.column = lexError.column;
    result.error.snippet = errorSnippet(source, lexError.position);
    return result;
  }

  State st(source, tokens);
  bool ok = true;
  ASTNodePtr ast = parseTernary(st, &ok);

  if (ok && !st.check(FormulaToken::End))
    fail(st, ParseError::Kind::Syntax,
         QString("Unexpected %1").arg(describe(st.peek())), st.peek(), &ok);

  if (!ok || !ast) {
    result.error = st.error;
    return result;
  }

  result.success = true;
  result.ast = ast;
  result.nodeCount = st.nodeCount;
  result.depth = ast->depth;
  return result;
}

// ═══════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════

void FormulaParser::fail(State &st, ParseError::Kind kind,
                         const QString &message, const FormulaToken &at,
                         bool *ok) const {
  st.error.kind = kind;
  st.error.message = message;
  st.error.position = at.position;
  st.error.line = at.line;
  st.error.column = at.column;
  st.error.snippet = errorSnippet(st.source, at.position);
  *ok = false;
}

bool FormulaParser::enter(State &st, bool *ok) const {
  if (m_limits.maxDepth > 0 && st.nesting > m_limits.maxDepth) {
    fail(st, ParseError::Kind::Limit,
         QString("Expression is nested too deeply (limit %1)")
             .arg(m_limits.maxDepth),
         st.peek(), ok);
    return false;
  }
  return true;
}

ASTNodePtr FormulaParser::finish(std::shared_ptr<FormulaASTNode> node,
                                 State &st, bool *ok) const {
  int childDepth = 0;
  for (const ASTNodePtr &child : {node->left, node->right, node->middle}) {
    if (child)
      childDepth = std::max(childDepth, child->depth);
  }
  for (const ASTNodePtr &child : node->elements)
    childDepth = std::max(childDepth, child->depth);
  node->depth = childDepth + 1;

  ++st.nodeCount;

  const FormulaToken &at = st.tokens[std::max(0, st.pos - 1)];
  if (m_limits.maxNodeCount > 0 && st.nodeCount > m_limits.maxNodeCount) {
    fail(st, ParseError::Kind::Limit,
         QString("Formula has too many elements (limit %1 nodes)")
             .arg(m_limits.maxNodeCount),
         at, ok);
    return nullptr;
  }
  if (m_limits.maxDepth > 0 && node->depth > m_limits.maxDepth) {
    fail(st, ParseError::Kind::Limit,
         QString("Expression is too deep (%1 levels, limit %2)")
             .arg(node->depth)
             .arg(m_limits.maxDepth),
         at, ok);
    return nullptr;
  }
  return node;
}

ASTNodePtr FormulaParser::makeBinary(FormulaASTNode::Kind kind,
                                     const QString &op, const ASTNodePtr &left,
                                     const ASTNodePtr &right, State &st,
                                     bool *ok) const {
  auto node = std::make_shared<FormulaASTNode>();
  node->kind = kind;
  node->op = op;
  node->left = left;
  node->right = right;
  node->start = left->start;
  node->end = right->end;
  return finish(node, st, ok);
}

// ═══════════════════════════════════════════════════════════════════
// Precedence levels
// ═══════════════════════════════════════════════════════════════════

ASTNodePtr FormulaParser::parseTernary(State &st, bool *ok) const {
  ASTNodePtr test = parseOr(st, ok);
  if (!*ok)
    return nullptr;

  if (!st.match(FormulaToken::Question))
    return test;

  NestingGuard guard(st.nesting);
  if (!enter(st, ok))
    return nullptr;

  ASTNodePtr consequent = parseTernary(st, ok);
  if (!*ok)
    return nullptr;

  if (!st.match(FormulaToken::Colon)) {
    fail(st, ParseError::Kind::Syntax,
         QString("Expected ':' in conditional expression, found %1")
             .arg(describe(st.peek())),
         st.peek(), ok);
    return nullptr;
  }

  ASTNodePtr alternate = parseTernary(st, ok);
  if (!*ok)
    return nullptr;

  auto node = std::make_shared<FormulaASTNode>();
  node->kind = FormulaASTNode::ConditionalExpression;
  node->left = test;
  node->middle = consequent;
  node->right = alternate;
  node->start = test->start;
  node->end = alternate->end;
  return finish(node, st, ok);
}

ASTNodePtr FormulaParser::parseOr(State &st, bool *ok) const {
  ASTNodePtr left = parseAnd(st, ok);
  if (!*ok)
    return nullptr;

  while (st.match(FormulaToken::PipePipe)) {
    ASTNodePtr right = parseAnd(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::LogicalExpression, QStringLiteral("||"),
                      left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parseAnd(State &st, bool *ok) const {
  ASTNodePtr left = parseEquality(st, ok);
  if (!*ok)
    return nullptr;

  while (st.match(FormulaToken::AmpAmp)) {
    ASTNodePtr right = parseEquality(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::LogicalExpression, QStringLiteral("&&"),
                      left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parseEquality(State &st, bool *ok) const {
  ASTNodePtr left = parseRelational(st, ok);
  if (!*ok)
    return nullptr;

  while (st.check(FormulaToken::EqualEqual) ||
         st.check(FormulaToken::BangEqual)) {
    // "===" / "!==" are the same strict operators as "==" / "!="
    const QString op = st.peek().type == FormulaToken::EqualEqual
                           ? QStringLiteral("==")
                           : QStringLiteral("!=");
    ++st.pos;
    ASTNodePtr right = parseRelational(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::BinaryExpression, op, left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parseRelational(State &st, bool *ok) const {
  ASTNodePtr left = parseAdditive(st, ok);
  if (!*ok)
    return nullptr;

  while (st.check(FormulaToken::Less) || st.check(FormulaToken::Greater) ||
         st.check(FormulaToken::LessEqual) ||
         st.check(FormulaToken::GreaterEqual)) {
    const QString op = st.peek().text;
    ++st.pos;
    ASTNodePtr right = parseAdditive(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::BinaryExpression, op, left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parseAdditive(State &st, bool *ok) const {
  ASTNodePtr left = parseMultiplicative(st, ok);
  if (!*ok)
    return nullptr;

  while (st.check(FormulaToken::Plus) || st.check(FormulaToken::Minus) ||
         st.check(FormulaToken::Amp)) {
    const QString op = st.peek().text;
    ++st.pos;
    ASTNodePtr right = parseMultiplicative(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::BinaryExpression, op, left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parseMultiplicative(State &st, bool *ok) const {
  ASTNodePtr left = parsePower(st, ok);
  if (!*ok)
    return nullptr;

  while (st.check(FormulaToken::Star) || st.check(FormulaToken::Slash) ||
         st.check(FormulaToken::Percent)) {
    const QString op = st.peek().text;
    ++st.pos;
    ASTNodePtr right = parsePower(st, ok);
    if (!*ok)
      return nullptr;
    left = makeBinary(FormulaASTNode::BinaryExpression, op, left, right, st, ok);
    if (!*ok)
      return nullptr;
  }
  return left;
}

ASTNodePtr FormulaParser::parsePower(State &st, bool *ok) const {
  NestingGuard guard(st.nesting);
  if (!enter(st, ok))
    return nullptr;

  ASTNodePtr left = parseUnary(st, ok);
  if (!*ok)
    return nullptr;

  if (st.match(FormulaToken::StarStar)) {
    ASTNodePtr right = parsePower(st, ok); // right-associative
    if (!*ok)
      return nullptr;
    return makeBinary(FormulaASTNode::BinaryExpression, QStringLiteral("**"),
                      left, right, st, ok);
  }
  return left;
}

ASTNodePtr FormulaParser::parseUnary(State &st, bool *ok) const {
  if (st.check(FormulaToken::Minus) || st.check(FormulaToken::Bang)) {
    NestingGuard guard(st.nesting);
    if (!enter(st, ok))
      return nullptr;

    const FormulaToken opTok = st.peek();
    ++st.pos;
    ASTNodePtr operand = parseUnary(st, ok);
    if (!*ok)
      return nullptr;

    auto node = std::make_shared<FormulaASTNode>();
    node->kind = FormulaASTNode::UnaryExpression;
    node->op = opTok.text;
    node->left = operand;
    node->start = opTok.position;
    node->end = operand->end;
    return finish(node, st, ok);
  }
  return parsePostfix(st, ok);
}

ASTNodePtr FormulaParser::parsePostfix(State &st, bool *ok) const {
  ASTNodePtr expr = parsePrimary(st, ok);
  if (!*ok)
    return nullptr;

  while (true) {
    if (st.match(FormulaToken::Dot)) {
      if (!st.check(FormulaToken::Identifier)) {
        fail(st, ParseError::Kind::Syntax,
             QString("Expected property name after '.', found %1")
                 .arg(describe(st.peek())),
             st.peek(), ok);
        return nullptr;
      }
      const FormulaToken nameTok = st.peek();
      ++st.pos;
      auto node = std::make_shared<FormulaASTNode>();
      node->kind = FormulaASTNode::MemberExpression;
      node->left = expr;
      node->name = nameTok.text;
      node->start = expr->start;
      node->end = nameTok.position + nameTok.text.length();
      expr = finish(node, st, ok);
    } else if (st.match(FormulaToken::LBracket)) {
      ASTNodePtr property = parseTernary(st, ok);
      if (!*ok)
        return nullptr;
      if (!st.match(FormulaToken::RBracket)) {
        fail(st, ParseError::Kind::Syntax,
             QString("Expected ']' after index, found %1")
                 .arg(describe(st.peek())),
             st.peek(), ok);
        return nullptr;
      }
      auto node = std::make_shared<FormulaASTNode>();
      node->kind = FormulaASTNode::MemberExpression;
      node->left = expr;
      node->right = property;
      node->computed = true;
      node->start = expr->start;
      node->end = st.previous().position + 1;
      expr = finish(node, st, ok);
    } else if (st.match(FormulaToken::LParen)) {
      auto node = std::make_shared<FormulaASTNode>();
      node->kind = FormulaASTNode::CallExpression;
      node->left = expr;
      if (!parseArgumentList(st, FormulaToken::RParen, node->elements, ok))
        return nullptr;
      node->start = expr->start;
      node->end = st.previous().position + 1;
      expr = finish(node, st, ok);
    } else {
      break;
    }
    if (!*ok)
      return nullptr;
  }
  return expr;
}

bool FormulaParser::parseArgumentList(State &st, FormulaToken::Type closer,
                                      QVector<ASTNodePtr> &out,
                                      bool *ok) const {
  if (!st.check(closer)) {
    do {
      ASTNodePtr arg = parseTernary(st, ok);
      if (!*ok)
        return false;
      out.append(arg);
    } while (st.match(FormulaToken::Comma));
  }

  if (!st.match(closer)) {
    fail(st, ParseError::Kind::Syntax,
         QString("Expected '%1' or ',', found %2")
             .arg(tokenTypeName(closer), describe(st.peek())),
         st.peek(), ok);
    return false;
  }
  return true;
}

ASTNodePtr FormulaParser::parsePrimary(State &st, bool *ok) const {
  const FormulaToken tok = st.peek();
  auto node = std::make_shared<FormulaASTNode>();
  node->start = tok.position;
  node->end = tok.position + tok.text.length();

  switch (tok.type) {
  case FormulaToken::Number: {
    bool numOk = false;
    double value = tok.text.toDouble(&numOk);
    if (!numOk) {
      fail(st, ParseError::Kind::Lex,
           QString("Invalid number literal '%1'").arg(tok.text), tok, ok);
      return nullptr;
    }
    ++st.pos;
    node->kind = FormulaASTNode::Literal;
    node->value = value;
    return finish(node, st, ok);
  }

  case FormulaToken::String:
    ++st.pos;
    node->kind = FormulaASTNode::Literal;
    node->value = tok.text;
    node->end = st.peek().type == FormulaToken::End
                    ? st.source.length()
                    : std::max(node->end, st.peek().position);
    return finish(node, st, ok);

  case FormulaToken::Identifier: {
    ++st.pos;
    const QString lower = tok.text.toLower();
    if (lower == QLatin1String("true") || lower == QLatin1String("false")) {
      node->kind = FormulaASTNode::Literal;
      node->value = (lower == QLatin1String("true"));
    } else if (lower == QLatin1String("null")) {
      node->kind = FormulaASTNode::Literal;
      node->value = QVariant();
    } else {
      node->kind = FormulaASTNode::Identifier;
      node->name = tok.text;
    }
    return finish(node, st, ok);
  }

  case FormulaToken::LParen: {
    ++st.pos;
    NestingGuard guard(st.nesting);
    if (!enter(st, ok))
      return nullptr;
    ASTNodePtr inner = parseTernary(st, ok);
    if (!*ok)
      return nullptr;
    if (!st.match(FormulaToken::RParen)) {
      fail(st, ParseError::Kind::Syntax,
           QString("Expected ')' after expression, found %1")
               .arg(describe(st.peek())),
           st.peek(), ok);
      return nullptr;
    }
    return inner;
  }

  case FormulaToken::LBracket:
    return parseArrayLiteral(st, ok);

  case FormulaToken::LBrace:
    return parseObjectLiteral(st, ok);

  default:
    break;
  }

  fail(st, ParseError::Kind::Syntax, QString("Unexpected %1").arg(describe(tok)),
       tok, ok);
  return nullptr;
}

ASTNodePtr FormulaParser::parseArrayLiteral(State &st, bool *ok) const {
  const FormulaToken open = st.peek();
  ++st.pos; // '['

  NestingGuard guard(st.nesting);
  if (!enter(st, ok))
    return nullptr;

  auto node = std::make_shared<FormulaASTNode>();
  node->kind = FormulaASTNode::ArrayExpression;
  node->start = open.position;
  if (!parseArgumentList(st, FormulaToken::RBracket, node->elements, ok))
    return nullptr;
  node->end = st.previous().position + 1;
  return finish(node, st, ok);
}

ASTNodePtr FormulaParser::parseObjectLiteral(State &st, bool *ok) const {
  const FormulaToken open = st.peek();
  ++st.pos; // '{'

  NestingGuard guard(st.nesting);
  if (!enter(st, ok))
    return nullptr;

  auto node = std::make_shared<FormulaASTNode>();
  node->kind = FormulaASTNode::ObjectExpression;
  node->start = open.position;

  if (!st.check(FormulaToken::RBrace)) {
    do {
      const FormulaToken keyTok = st.peek();
      if (keyTok.type != FormulaToken::Identifier &&
          keyTok.type != FormulaToken::String) {
        fail(st, ParseError::Kind::Syntax,
             QString("Expected property name, found %1").arg(describe(keyTok)),
             keyTok, ok);
        return nullptr;
      }
      ++st.pos;

      if (!st.match(FormulaToken::Colon)) {
        fail(st, ParseError::Kind::Syntax,
             QString("Expected ':' after property name, found %1")
                 .arg(describe(st.peek())),
             st.peek(), ok);
        return nullptr;
      }

      ASTNodePtr value = parseTernary(st, ok);
      if (!*ok)
        return nullptr;
      node->keys.append(keyTok.text);
      node->elements.append(value);
    } while (st.match(FormulaToken::Comma));
  }

  if (!st.match(FormulaToken::RBrace)) {
    fail(st, ParseError::Kind::Syntax,
         QString("Expected '}' or ',', found %1").arg(describe(st.peek())),
         st.peek(), ok);
    return nullptr;
  }
  node->end = st.previous().position + 1;
  return finish(node, st, ok);
}

} // namespace Formula
