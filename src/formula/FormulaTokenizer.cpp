/**
 * @file FormulaTokenizer.cpp
 * @brief Lexical analysis of formula source text
 */

#include "formula/FormulaTokenizer.h"

namespace Formula {

namespace {

bool isAsciiDigit(QChar ch) { return ch >= QLatin1Char('0') && ch <= QLatin1Char('9'); }

bool isIdentifierStart(QChar ch) {
  return ch.isLetter() || ch == QLatin1Char('_') || ch == QLatin1Char('$');
}

bool isIdentifierPart(QChar ch) {
  return ch.isLetterOrNumber() || ch == QLatin1Char('_') ||
         ch == QLatin1Char('$');
}

struct OperatorSpelling {
  const char *text;
  FormulaToken::Type type;
};

// Longest spellings first so that greedy matching falls out of the order.
const OperatorSpelling kOperators[] = {
    {"===", FormulaToken::EqualEqual}, {"!==", FormulaToken::BangEqual},
    {"**", FormulaToken::StarStar},    {"==", FormulaToken::EqualEqual},
    {"!=", FormulaToken::BangEqual},   {"<=", FormulaToken::LessEqual},
    {">=", FormulaToken::GreaterEqual}, {"&&", FormulaToken::AmpAmp},
    {"||", FormulaToken::PipePipe},    {"+", FormulaToken::Plus},
    {"-", FormulaToken::Minus},        {"*", FormulaToken::Star},
    {"/", FormulaToken::Slash},        {"%", FormulaToken::Percent},
    {"<", FormulaToken::Less},         {">", FormulaToken::Greater},
    {"!", FormulaToken::Bang},         {"&", FormulaToken::Amp},
    {"(", FormulaToken::LParen},       {")", FormulaToken::RParen},
    {"[", FormulaToken::LBracket},     {"]", FormulaToken::RBracket},
    {"{", FormulaToken::LBrace},       {"}", FormulaToken::RBrace},
    {",", FormulaToken::Comma},        {".", FormulaToken::Dot},
    {":", FormulaToken::Colon},        {"?", FormulaToken::Question},
};

} // namespace

QString tokenTypeName(FormulaToken::Type type) {
  switch (type) {
  case FormulaToken::Number:
    return QStringLiteral("number");
  case FormulaToken::String:
    return QStringLiteral("string");
  case FormulaToken::Identifier:
    return QStringLiteral("identifier");
  case FormulaToken::End:
    return QStringLiteral("end of input");
  default:
    break;
  }
  for (const OperatorSpelling &op : kOperators) {
    if (op.type == type)
      return QString::fromLatin1(op.text);
  }
  return QStringLiteral("token");
}

// ═══════════════════════════════════════════════════════════════════
// Public entry point
// ═══════════════════════════════════════════════════════════════════

FormulaTokenList FormulaTokenizer::tokenize(const QString &source, bool *ok,
                                            LexError *error) {
  FormulaTokenizer lexer(source);
  FormulaTokenList tokens;
  LexError err;

  if (!lexer.run(tokens, err)) {
    if (ok)
      *ok = false;
    if (error)
      *error = err;
    return {};
  }

  if (ok)
    *ok = true;
  return tokens;
}

FormulaTokenizer::FormulaTokenizer(const QString &source) : m_src(source) {}

bool FormulaTokenizer::run(FormulaTokenList &out, LexError &error) {
  const int len = m_src.length();

  while (m_pos < len) {
    QChar ch = current();

    if (ch.isSpace()) {
      advance();
      continue;
    }

    // Numbers: 123, 3.14, .5, 1e10, 2.5E-3
    if (isAsciiDigit(ch) || (ch == QLatin1Char('.') && isAsciiDigit(peek()))) {
      if (!readNumber(out, error))
        return false;
      continue;
    }

    if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
      if (!readString(out, error))
        return false;
      continue;
    }

    if (isIdentifierStart(ch)) {
      readIdentifier(out);
      continue;
    }

    if (readOperator(out))
      continue;

    fail(error, QString("Unexpected character '%1'").arg(ch));
    return false;
  }

  push(out, FormulaToken::End, QString(), m_pos, m_line, m_column);
  return true;
}

// ═══════════════════════════════════════════════════════════════════
// Scanners
// ═══════════════════════════════════════════════════════════════════

bool FormulaTokenizer::readNumber(FormulaTokenList &out, LexError &error) {
  const int start = m_pos;
  const int line = m_line;
  const int column = m_column;

  while (isAsciiDigit(current()))
    advance();

  if (current() == QLatin1Char('.') && isAsciiDigit(peek())) {
    advance();
    while (isAsciiDigit(current()))
      advance();
  }

  if (current() == QLatin1Char('e') || current() == QLatin1Char('E')) {
    advance();
    if (current() == QLatin1Char('+') || current() == QLatin1Char('-'))
      advance();
    if (!isAsciiDigit(current())) {
      fail(error, QStringLiteral("Invalid number: expected digit after exponent"));
      return false;
    }
    while (isAsciiDigit(current()))
      advance();
  }

  push(out, FormulaToken::Number, m_src.mid(start, m_pos - start), start, line,
       column);
  return true;
}

bool FormulaTokenizer::readString(FormulaTokenList &out, LexError &error) {
  const int start = m_pos;
  const int line = m_line;
  const int column = m_column;
  const QChar quote = current();
  QString value;

  advance(); // opening quote

  while (m_pos < m_src.length() && current() != quote) {
    QChar ch = current();
    if (ch == QLatin1Char('\n')) {
      fail(error, QStringLiteral("Unterminated string: unexpected newline"));
      return false;
    }
    if (ch == QLatin1Char('\\')) {
      advance();
      if (m_pos >= m_src.length())
        break;
      QChar escaped = current();
      switch (escaped.unicode()) {
      case 'n':
        value += QLatin1Char('\n');
        break;
      case 't':
        value += QLatin1Char('\t');
        break;
      case 'r':
        value += QLatin1Char('\r');
        break;
      default: // \\ \" \' and anything else stand for themselves
        value += escaped;
        break;
      }
      advance();
      continue;
    }
    value += ch;
    advance();
  }

  if (m_pos >= m_src.length()) {
    LexError err;
    err.message = QStringLiteral("Unterminated string");
    err.position = start;
    err.line = line;
    err.column = column;
    error = err;
    return false;
  }

  advance(); // closing quote
  push(out, FormulaToken::String, value, start, line, column);
  return true;
}

void FormulaTokenizer::readIdentifier(FormulaTokenList &out) {
  const int start = m_pos;
  const int line = m_line;
  const int column = m_column;
  while (m_pos < m_src.length() && isIdentifierPart(current()))
    advance();
  push(out, FormulaToken::Identifier, m_src.mid(start, m_pos - start), start,
       line, column);
}

bool FormulaTokenizer::readOperator(FormulaTokenList &out) {
  for (const OperatorSpelling &op : kOperators) {
    const QLatin1String spelling(op.text);
    if (m_src.midRef(m_pos, spelling.size()) == spelling) {
      const int start = m_pos;
      const int line = m_line;
      const int column = m_column;
      advance(spelling.size());
      push(out, op.type, QString(spelling), start, line, column);
      return true;
    }
  }
  return false;
}

// ═══════════════════════════════════════════════════════════════════
// Cursor helpers
// ═══════════════════════════════════════════════════════════════════

QChar FormulaTokenizer::current() const {
  return m_pos < m_src.length() ? m_src.at(m_pos) : QChar();
}

QChar FormulaTokenizer::peek(int offset) const {
  const int i = m_pos + offset;
  return i < m_src.length() ? m_src.at(i) : QChar();
}

void FormulaTokenizer::advance(int count) {
  for (int i = 0; i < count && m_pos < m_src.length(); ++i) {
    if (m_src.at(m_pos) == QLatin1Char('\n')) {
      ++m_line;
      m_column = 1;
    } else {
      ++m_column;
    }
    ++m_pos;
  }
}

void FormulaTokenizer::push(FormulaTokenList &out, FormulaToken::Type type,
                            const QString &text, int start, int line,
                            int column) const {
  FormulaToken tok;
  tok.type = type;
  tok.text = text;
  tok.position = start;
  tok.line = line;
  tok.column = column;
  out.append(tok);
}

void FormulaTokenizer::fail(LexError &error, const QString &message) const {
  error.message = message;
  error.position = m_pos;
  error.line = m_line;
  error.column = m_column;
}

} // namespace Formula
